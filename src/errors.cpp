#include "holdem/errors.h"

namespace holdem_table {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_YOUR_TURN:             return "NotYourTurn";
        case ErrorKind::INVALID_ACTION:            return "InvalidAction";
        case ErrorKind::INSUFFICIENT_PLAYERS:      return "InsufficientPlayers";
        case ErrorKind::DECK_EXHAUSTED:            return "DeckExhausted";
        case ErrorKind::STATE_PERSISTENCE_FAILURE: return "StatePersistenceFailure";
        case ErrorKind::TABLE_NOT_FOUND:           return "TableNotFound";
        case ErrorKind::INVALID_CONFIGURATION:     return "InvalidConfiguration";
        default:                                   return "Unknown";
    }
}

} // namespace holdem_table
