#include "holdem/table.h"
#include "holdem/errors.h"

#include <algorithm>
#include <string>

namespace holdem_table {

void TableSettings::validate() const {
    if (small_blind <= 0) throw InvalidConfigurationError("small_blind must be > 0");
    if (big_blind < small_blind) {
        throw InvalidConfigurationError("Big blind must be greater than or equal to small blind.");
    }
    if (buy_in <= 0) throw InvalidConfigurationError("buy_in must be > 0");
    if (max_players < 2 || max_players > 8) {
        throw InvalidConfigurationError("max_players must be within [2, 8], got " + std::to_string(max_players));
    }
}

const Seat* Table::find_seat(SeatNumber seat) const {
    auto it = std::find_if(seats.begin(), seats.end(),
                           [seat](const Seat& s) { return s.seat_number == seat; });
    return it == seats.end() ? nullptr : &*it;
}

Seat* Table::find_seat(SeatNumber seat) {
    auto it = std::find_if(seats.begin(), seats.end(),
                           [seat](const Seat& s) { return s.seat_number == seat; });
    return it == seats.end() ? nullptr : &*it;
}

Seat& Table::seat_at(SeatNumber seat) {
    Seat* s = find_seat(seat);
    if (!s) throw InvalidActionError("Seat " + std::to_string(seat) + " is not at table " + id);
    return *s;
}

Chips Table::total_chips() const {
    Chips total = 0;
    for (const auto& s : seats) total += s.chip_count;
    return total;
}

} // namespace holdem_table
