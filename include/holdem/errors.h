#ifndef HOLDEM_ERRORS_H
#define HOLDEM_ERRORS_H

#include <stdexcept>
#include <string>

namespace holdem_table {

enum class ErrorKind {
    NOT_YOUR_TURN,
    INVALID_ACTION,
    INSUFFICIENT_PLAYERS,
    DECK_EXHAUSTED,             // Erreur de programmation, ne doit pas arriver
    STATE_PERSISTENCE_FAILURE,
    TABLE_NOT_FOUND,
    INVALID_CONFIGURATION
};

const char* error_kind_to_string(ErrorKind kind);

// Base de toutes les erreurs du moteur
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NotYourTurnError : public EngineError {
public:
    explicit NotYourTurnError(const std::string& message)
        : EngineError(ErrorKind::NOT_YOUR_TURN, message) {}
};

class InvalidActionError : public EngineError {
public:
    explicit InvalidActionError(const std::string& message)
        : EngineError(ErrorKind::INVALID_ACTION, message) {}
};

class InsufficientPlayersError : public EngineError {
public:
    explicit InsufficientPlayersError(const std::string& message)
        : EngineError(ErrorKind::INSUFFICIENT_PLAYERS, message) {}
};

class DeckExhaustedError : public EngineError {
public:
    explicit DeckExhaustedError(const std::string& message)
        : EngineError(ErrorKind::DECK_EXHAUSTED, message) {}
};

// Remontée par le collaborateur de persistance (commitTableState)
class StatePersistenceError : public EngineError {
public:
    explicit StatePersistenceError(const std::string& message)
        : EngineError(ErrorKind::STATE_PERSISTENCE_FAILURE, message) {}
};

class TableNotFoundError : public EngineError {
public:
    explicit TableNotFoundError(const std::string& message)
        : EngineError(ErrorKind::TABLE_NOT_FOUND, message) {}
};

class InvalidConfigurationError : public EngineError {
public:
    explicit InvalidConfigurationError(const std::string& message)
        : EngineError(ErrorKind::INVALID_CONFIGURATION, message) {}
};

} // namespace holdem_table

#endif // HOLDEM_ERRORS_H
