#include "holdem/public_view.h"

namespace holdem_table {

PublicView build_public_view(const TableState& state, std::optional<SeatNumber> viewer) {
    const Table& table = state.table;
    PublicView view;
    view.table_id = table.id;
    view.status = table.status;
    view.button_seat = table.button_seat;

    const Hand* hand = state.hand ? &*state.hand : nullptr;
    if (hand) {
        view.hand_number = hand->hand_number;
        view.street = hand->street;
        view.community_cards = hand->community_cards;
        view.seat_to_act = hand->round.seat_to_act();
        if (hand->complete) {
            view.last_result = hand->result;
        } else {
            view.pot_size = hand->pots.total();
            view.pots = hand->pots.pots();
            view.current_bet = hand->round.current_bet();
        }
    }

    for (const auto& seat : table.seats) {
        SeatView sv;
        sv.seat = seat.seat_number;
        sv.occupant = seat.occupant;
        sv.chip_count = seat.chip_count;
        sv.status = seat.status;
        sv.has_cards = !seat.hole_cards.empty();
        if (hand && !hand->complete) {
            sv.is_turn = view.seat_to_act == seat.seat_number;
            sv.committed_this_street = hand->round.committed(seat.seat_number);
        }

        bool revealed = viewer && *viewer == seat.seat_number;
        if (hand && hand->complete && hand->result) {
            for (const auto& shown : hand->result->showdown) {
                if (shown.seat == seat.seat_number) revealed = true;
            }
        }
        if (revealed) sv.cards = seat.hole_cards;
        view.seats.push_back(std::move(sv));
    }
    return view;
}

} // namespace holdem_table
