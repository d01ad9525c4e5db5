#ifndef HOLDEM_BETTING_ROUND_H
#define HOLDEM_BETTING_ROUND_H

#include <map>
#include <optional>
#include <set>
#include <vector>

#include "holdem/common_types.h"
#include "holdem/table.h"

namespace holdem_table {

// Action acceptée par le validateur, montants normalisés
struct ValidatedAction {
    SeatNumber seat = NO_SEAT;
    ActionType type = ActionType::FOLD;
    Chips chips_to_commit = 0;   // retirés du stack
    Chips new_total = 0;         // engagé sur la street après l'action
    bool goes_all_in = false;
    bool full_raise = false;     // mise ou relance complète : rouvre l'action
};

/**
 * Une street de mise.
 *
 * AwaitingAction(seat) tant que seat_to_act() est défini, RoundComplete sinon.
 * `pending` contient les sièges PLAYING qui doivent encore parler depuis la
 * dernière relance complète. Une relance all-in incomplète remet en attente
 * ceux qui doivent compléter, sans leur rendre le droit de relancer.
 */
class BettingRound {
public:
    BettingRound() = default;

    // Ouvre la street. `committed` : blindes déjà postées (préflop),
    // `first_candidate` : premier siège à interroger (inclus).
    static BettingRound open(Street street,
                             Chips current_bet,
                             Chips min_raise,
                             std::map<SeatNumber, Chips> committed,
                             const Table& table,
                             SeatNumber first_candidate);

    // Le statut des sièges dans `table` doit déjà refléter l'action
    void apply(const ValidatedAction& action, const Table& table);

    // Fin de main : plus personne ne parle
    void close();

    Street street() const { return street_; }
    Chips current_bet() const { return current_bet_; }
    Chips min_raise() const { return min_raise_; }
    Chips committed(SeatNumber seat) const;
    const std::map<SeatNumber, Chips>& committed_by_seat() const { return committed_; }
    Chips total_committed() const;

    std::optional<SeatNumber> seat_to_act() const { return to_act_; }
    bool complete() const { return !to_act_.has_value(); }
    bool is_pending(SeatNumber seat) const { return pending_.count(seat) > 0; }
    // Relance interdite : a déjà parlé avant une relance all-in incomplète
    bool raise_locked(SeatNumber seat) const { return no_reraise_.count(seat) > 0; }

private:
    void prune(const Table& table);
    void advance_from(SeatNumber from, bool inclusive);

    Street street_ = Street::PREFLOP;
    Chips current_bet_ = 0;
    Chips min_raise_ = 0;
    std::map<SeatNumber, Chips> committed_;
    std::set<SeatNumber> pending_;
    std::set<SeatNumber> acted_since_full_raise_;
    std::set<SeatNumber> no_reraise_;
    std::optional<SeatNumber> to_act_;
};

} // namespace holdem_table

#endif // HOLDEM_BETTING_ROUND_H
