#include "holdem/position_resolver.h"
#include "holdem/errors.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <string>

namespace holdem_table {

std::vector<SeatNumber> eligible_seats(const std::vector<Seat>& seats) {
    std::vector<SeatNumber> out;
    for (const auto& s : seats) {
        if (s.status == SeatStatus::PLAYING) out.push_back(s.seat_number);
    }
    std::sort(out.begin(), out.end());
    return out;
}

SeatNumber next_seat_clockwise(const std::vector<SeatNumber>& candidates, SeatNumber from) {
    if (candidates.empty()) return NO_SEAT;
    auto it = std::upper_bound(candidates.begin(), candidates.end(), from);
    return it == candidates.end() ? candidates.front() : *it;
}

SeatNumber seat_at_or_after(const std::vector<SeatNumber>& candidates, SeatNumber from) {
    if (candidates.empty()) return NO_SEAT;
    auto it = std::lower_bound(candidates.begin(), candidates.end(), from);
    return it == candidates.end() ? candidates.front() : *it;
}

std::vector<SeatNumber> clockwise_from(const std::vector<SeatNumber>& candidates, SeatNumber from) {
    std::vector<SeatNumber> ordered;
    ordered.reserve(candidates.size());
    auto split = std::upper_bound(candidates.begin(), candidates.end(), from);
    ordered.insert(ordered.end(), split, candidates.end());
    ordered.insert(ordered.end(), candidates.begin(), split);
    return ordered;
}

SeatPositions resolve_positions(const std::vector<Seat>& seats,
                                std::optional<SeatNumber> previous_button) {
    const std::vector<SeatNumber> order = eligible_seats(seats);
    if (order.size() < 2) {
        throw InsufficientPlayersError("Need at least 2 playing seats, got " + std::to_string(order.size()));
    }

    SeatPositions pos;
    // Première main : plus petit siège. Sinon on tourne depuis l'ancien bouton.
    pos.button = previous_button ? next_seat_clockwise(order, *previous_button) : order.front();

    if (order.size() == 2) { // HU
        pos.small_blind  = pos.button;
        pos.big_blind    = next_seat_clockwise(order, pos.button);
        pos.first_to_act = pos.small_blind;
    } else { // 3+
        pos.small_blind  = next_seat_clockwise(order, pos.button);
        pos.big_blind    = next_seat_clockwise(order, pos.small_blind);
        pos.first_to_act = next_seat_clockwise(order, pos.big_blind); // UTG
    }

    spdlog::trace("Positions ({} seats, prev BTN {}): BTN {} SB {} BB {} first {}",
                  order.size(), previous_button ? std::to_string(*previous_button) : "none",
                  pos.button, pos.small_blind, pos.big_blind, pos.first_to_act);
    return pos;
}

} // namespace holdem_table
