#ifndef HOLDEM_PUBLIC_VIEW_H
#define HOLDEM_PUBLIC_VIEW_H

#include <optional>
#include <string>
#include <vector>

#include "holdem/hand.h"

namespace holdem_table {

struct SeatView {
    SeatNumber seat = NO_SEAT;
    std::string occupant;
    Chips chip_count = 0;
    SeatStatus status = SeatStatus::PLAYING;
    bool is_turn = false;
    Chips committed_this_street = 0;
    bool has_cards = false;          // cartes reçues, visibles ou non
    std::vector<Card> cards;         // vide si cachées pour ce spectateur
};

// Partie non privée de l'état, poussée aux clients
struct PublicView {
    std::string table_id;
    TableStatus status = TableStatus::WAITING;
    std::vector<SeatView> seats;
    std::vector<Card> community_cards;
    Chips pot_size = 0;
    std::vector<Pot> pots;
    Chips current_bet = 0;
    std::optional<SeatNumber> seat_to_act;
    std::optional<SeatNumber> button_seat;
    std::optional<Street> street;
    int hand_number = 0;
    std::optional<HandResult> last_result;
};

// `viewer` voit ses propres cartes ; les mains montrées à l'abattage sont visibles de tous
PublicView build_public_view(const TableState& state,
                             std::optional<SeatNumber> viewer = std::nullopt);

} // namespace holdem_table

#endif // HOLDEM_PUBLIC_VIEW_H
