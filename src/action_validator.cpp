#include "holdem/action_validator.h"
#include "holdem/errors.h"
#include "holdem/game_utils.hpp"

#include <algorithm>
#include <string>

namespace holdem_table {

ValidatedAction validate_action(const BettingRound& round,
                                const Seat& seat,
                                const Action& action,
                                Chips big_blind) {
    // Garde
    if (round.complete() || round.street() == Street::SHOWDOWN) {
        throw InvalidActionError("Hand is not accepting actions");
    }
    if (action.seat != seat.seat_number || action.seat != *round.seat_to_act()) {
        throw NotYourTurnError("Seat " + std::to_string(action.seat) + " is not to act (seat " +
                               std::to_string(*round.seat_to_act()) + " is)");
    }
    if (seat.status != SeatStatus::PLAYING) {
        throw InvalidActionError(std::string("Seat status is ") + seat_status_to_string(seat.status));
    }

    const bool sized = action.type == ActionType::BET || action.type == ActionType::RAISE;
    if (!sized && action.amount != 0) {
        throw InvalidActionError(action_type_to_string(action.type) + " does not take an amount");
    }

    ValidatedAction v;
    v.seat = seat.seat_number;
    v.type = action.type;

    const Chips committed = round.committed(seat.seat_number);
    const Chips current_bet = round.current_bet();
    const Chips stack = seat.chip_count;
    v.new_total = committed;

    switch (action.type) {
        case ActionType::FOLD:
            break;

        case ActionType::CHECK:
            if (committed != current_bet) {
                throw InvalidActionError("Cannot check when there is a bet to call (" +
                                         std::to_string(current_bet - committed) + ")");
            }
            break;

        case ActionType::CALL: {
            if (current_bet <= committed) throw InvalidActionError("Nothing to call");
            v.chips_to_commit = std::min(current_bet - committed, stack);
            v.new_total = committed + v.chips_to_commit;
            break;
        }

        case ActionType::BET: {
            if (current_bet != 0) throw InvalidActionError("Cannot bet when there is already a bet");
            if (action.amount <= 0) throw InvalidActionError("Bet amount must be positive");
            if (action.amount > stack) throw InvalidActionError("Bet exceeds stack");
            if (action.amount < big_blind && action.amount != stack) {
                throw InvalidActionError("Bet must be at least " + std::to_string(big_blind));
            }
            v.chips_to_commit = action.amount;
            v.new_total = committed + action.amount;
            v.full_raise = true;
            break;
        }

        case ActionType::RAISE: {
            if (current_bet == 0) throw InvalidActionError("Cannot raise when there is no bet");
            if (round.raise_locked(seat.seat_number)) {
                throw InvalidActionError("Action was not reopened, seat may only call or fold");
            }
            const Chips added = action.amount - committed;
            if (action.amount <= current_bet) {
                throw InvalidActionError("Raise must exceed the current bet of " + std::to_string(current_bet));
            }
            if (added > stack) throw InvalidActionError("Raise exceeds stack");
            const Chips increment = action.amount - current_bet;
            const bool all_in = added == stack;
            if (increment < round.min_raise() && !all_in) {
                throw InvalidActionError("Raise must be at least " + std::to_string(round.min_raise()) +
                                         " over " + std::to_string(current_bet));
            }
            v.chips_to_commit = added;
            v.new_total = action.amount;
            v.full_raise = increment >= round.min_raise();
            break;
        }

        default:
            throw InvalidActionError("Invalid action");
    }

    v.goes_all_in = action.type != ActionType::FOLD && v.chips_to_commit == stack && stack > 0;
    return v;
}

bool LegalActions::allows(ActionType type) const {
    return std::find(actions.begin(), actions.end(), type) != actions.end();
}

LegalActions legal_actions(const BettingRound& round, const Seat& seat, Chips big_blind) {
    LegalActions legal;
    if (round.complete() || *round.seat_to_act() != seat.seat_number ||
        seat.status != SeatStatus::PLAYING) {
        return legal;
    }

    const Chips committed = round.committed(seat.seat_number);
    const Chips current_bet = round.current_bet();
    const Chips stack = seat.chip_count;

    legal.actions.push_back(ActionType::FOLD);
    if (committed == current_bet) {
        legal.actions.push_back(ActionType::CHECK);
    } else {
        legal.actions.push_back(ActionType::CALL);
        legal.call_amount = std::min(current_bet - committed, stack);
    }

    if (current_bet == 0 && stack > 0) {
        legal.actions.push_back(ActionType::BET);
        legal.min_bet = std::min(big_blind, stack);
        legal.max_raise_to = stack;
    } else if (current_bet > 0 && committed + stack > current_bet && !round.raise_locked(seat.seat_number)) {
        legal.actions.push_back(ActionType::RAISE);
        legal.max_raise_to = committed + stack;
        legal.min_raise_to = std::min(current_bet + round.min_raise(), legal.max_raise_to);
    }
    return legal;
}

} // namespace holdem_table
