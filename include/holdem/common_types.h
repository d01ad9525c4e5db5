#ifndef HOLDEM_COMMON_TYPES_H
#define HOLDEM_COMMON_TYPES_H

#include <cstdint>
#include <string>

namespace holdem_table {

using SeatNumber = int;      // 1..max_players, stable pendant la session
using Chips      = int64_t;

constexpr SeatNumber NO_SEAT = 0;

enum class SeatStatus {
    PLAYING,
    FOLDED,
    ALL_IN,
    SITTING_OUT
};

enum class TableStatus {
    WAITING,
    IN_PROGRESS,
    PAUSED,
    FINISHED
};

// Les tours de mise, puis l'abattage
enum class Street {
    PREFLOP,
    FLOP,
    TURN,
    RIVER,
    SHOWDOWN
};

enum class ActionType {
    FOLD,
    CHECK,
    CALL,
    BET,
    RAISE
};

// Requête d'un siège, pas une entité.
// amount : BET = mise totale de la street, RAISE = nouveau total engagé
// sur la street ("raise to"). Doit rester à 0 pour FOLD / CHECK / CALL.
struct Action {
    SeatNumber seat = NO_SEAT;
    ActionType type = ActionType::FOLD;
    Chips amount = 0;

    bool operator==(const Action& other) const {
        return seat == other.seat && type == other.type && amount == other.amount;
    }
};

inline const char* seat_status_to_string(SeatStatus status) {
    switch (status) {
        case SeatStatus::PLAYING:     return "playing";
        case SeatStatus::FOLDED:      return "folded";
        case SeatStatus::ALL_IN:      return "all_in";
        case SeatStatus::SITTING_OUT: return "sitting_out";
        default:                      return "unknown";
    }
}

inline const char* table_status_to_string(TableStatus status) {
    switch (status) {
        case TableStatus::WAITING:     return "waiting";
        case TableStatus::IN_PROGRESS: return "in_progress";
        case TableStatus::PAUSED:      return "paused";
        case TableStatus::FINISHED:    return "finished";
        default:                       return "unknown";
    }
}

} // namespace holdem_table

#endif // HOLDEM_COMMON_TYPES_H
