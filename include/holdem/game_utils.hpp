#ifndef HOLDEM_GAME_UTILS_HPP
#define HOLDEM_GAME_UTILS_HPP

#include <string>
#include <vector>

#include "holdem/common_types.h"

namespace holdem_table {

std::string street_to_string(Street s);

std::string action_type_to_string(ActionType type);

// "seat 3 RAISE 40"
std::string action_to_string(const Action& action);

std::string seats_to_string(const std::vector<SeatNumber>& seats);

} // namespace holdem_table

#endif // HOLDEM_GAME_UTILS_HPP
