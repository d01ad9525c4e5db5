#ifndef HOLDEM_TABLE_H
#define HOLDEM_TABLE_H

#include <optional>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "holdem/common_types.h"

namespace holdem_table {

struct TableSettings {
    Chips small_blind = 5;
    Chips big_blind = 10;
    Chips buy_in = 1000;
    int max_players = 8;

    // InvalidConfigurationError si une borne n'est pas respectée
    void validate() const;
};

struct Seat {
    SeatNumber seat_number = NO_SEAT;
    std::string occupant;             // identité du joueur
    Chips chip_count = 0;
    SeatStatus status = SeatStatus::PLAYING;
    std::vector<Card> hole_cards;     // 0 ou exactement 2, privées

    // Peut recevoir des cartes à la prochaine main
    bool can_play() const { return status != SeatStatus::SITTING_OUT && chip_count > 0; }
};

struct Table {
    std::string id;
    TableSettings settings;
    std::vector<Seat> seats;          // triés par seat_number croissant
    // Bouton de la dernière main. Entre deux mains il peut désigner un siège
    // sorti (bouton mort) ; resolve_positions repart de lui pour la rotation.
    std::optional<SeatNumber> button_seat;
    TableStatus status = TableStatus::WAITING;
    int hands_played = 0;

    const Seat* find_seat(SeatNumber seat) const;
    Seat* find_seat(SeatNumber seat);
    Seat& seat_at(SeatNumber seat);   // InvalidActionError si absent

    Chips total_chips() const;
};

} // namespace holdem_table

#endif // HOLDEM_TABLE_H
