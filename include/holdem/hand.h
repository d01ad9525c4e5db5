#ifndef HOLDEM_HAND_H
#define HOLDEM_HAND_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "core/deck.hpp"
#include "holdem/betting_round.h"
#include "holdem/common_types.h"
#include "holdem/position_resolver.h"
#include "holdem/pot_accountant.h"
#include "holdem/table.h"

namespace holdem_table {

struct ShowdownHand {
    SeatNumber seat = NO_SEAT;
    std::vector<Card> hole_cards;
    HandRank rank = INVALID_HAND_RANK;
    std::string description;      // "Full House", ...
};

struct HandResult {
    bool uncontested = false;
    std::vector<PotAward> awards;
    std::vector<ShowdownHand> showdown;   // vide si uncontested
    std::map<SeatNumber, Chips> net_won;  // total reçu par siège
};

// Une main distribuée. Possède son paquet ; copiée en bloc pour chaque transition.
struct Hand {
    int hand_number = 0;
    SeatPositions positions;
    std::vector<SeatNumber> participants;   // sièges ayant reçu des cartes, triés
    Deck deck;
    std::vector<Card> community_cards;      // 0 -> 5, ajout seulement
    Street street = Street::PREFLOP;
    BettingRound round;
    PotAccountant pots;
    uint64_t action_sequence = 0;           // incrémenté à chaque action appliquée
    bool complete = false;
    std::optional<HandResult> result;
};

// Ce que lit et écrit le collaborateur de persistance
struct TableState {
    Table table;
    std::optional<Hand> hand;

    // Une street attend l'action d'un siège
    bool awaiting_action() const {
        return hand && !hand->complete && hand->round.seat_to_act().has_value();
    }
};

} // namespace holdem_table

#endif // HOLDEM_HAND_H
