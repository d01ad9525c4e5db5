#include "holdem/game_utils.hpp"

#include <sstream>

namespace holdem_table {

std::string street_to_string(Street s) {
    switch (s) {
        case Street::PREFLOP:  return "Preflop";
        case Street::FLOP:     return "Flop";
        case Street::TURN:     return "Turn";
        case Street::RIVER:    return "River";
        case Street::SHOWDOWN: return "Showdown";
        default:               return "UnknownStreet";
    }
}

std::string action_type_to_string(ActionType type) {
    switch (type) {
        case ActionType::FOLD:  return "FOLD";
        case ActionType::CHECK: return "CHECK";
        case ActionType::CALL:  return "CALL";
        case ActionType::BET:   return "BET";
        case ActionType::RAISE: return "RAISE";
        default:                return "UNKNOWN_ACTION_TYPE";
    }
}

std::string action_to_string(const Action& action) {
    std::string out = "seat " + std::to_string(action.seat) + " " + action_type_to_string(action.type);
    // Le montant n'a de sens que pour BET et RAISE
    if (action.type == ActionType::BET || action.type == ActionType::RAISE) {
        out += " " + std::to_string(action.amount);
    }
    return out;
}

std::string seats_to_string(const std::vector<SeatNumber>& seats) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < seats.size(); ++i) {
        ss << seats[i];
        if (i + 1 < seats.size()) ss << " ";
    }
    ss << "]";
    return ss.str();
}

} // namespace holdem_table
