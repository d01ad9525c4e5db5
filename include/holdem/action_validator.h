#ifndef HOLDEM_ACTION_VALIDATOR_H
#define HOLDEM_ACTION_VALIDATOR_H

#include <vector>

#include "holdem/betting_round.h"
#include "holdem/common_types.h"
#include "holdem/table.h"

namespace holdem_table {

/**
 * @brief Décide si `action` est légale pour `seat` dans `round` et normalise les montants.
 *
 * Ne modifie rien. Un call est plafonné au stack (all-in), une mise ou une
 * relance au-delà du stack est refusée. Une relance all-in sous le min-raise
 * reste légale mais ne rouvre pas l'action.
 *
 * @throws InvalidActionError si la street n'accepte plus d'action, si le siège
 *         n'est pas PLAYING ou si le type / montant est illégal.
 * @throws NotYourTurnError si le siège n'est pas celui qui doit parler.
 */
ValidatedAction validate_action(const BettingRound& round,
                                const Seat& seat,
                                const Action& action,
                                Chips big_blind);

// Réponse à "que puis-je faire ?" (vide si ce n'est pas le tour du siège)
struct LegalActions {
    std::vector<ActionType> actions;
    Chips call_amount = 0;
    Chips min_bet = 0;
    Chips min_raise_to = 0;   // totaux engagés sur la street
    Chips max_raise_to = 0;

    bool allows(ActionType type) const;
};

LegalActions legal_actions(const BettingRound& round, const Seat& seat, Chips big_blind);

} // namespace holdem_table

#endif // HOLDEM_ACTION_VALIDATOR_H
