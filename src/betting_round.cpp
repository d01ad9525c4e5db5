#include "holdem/betting_round.h"
#include "holdem/position_resolver.h"
#include "holdem/game_utils.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <string>

namespace holdem_table {

namespace {

int count_status(const Table& table, SeatStatus status) {
    int n = 0;
    for (const auto& s : table.seats) {
        if (s.status == status) ++n;
    }
    return n;
}

} // namespace

BettingRound BettingRound::open(Street street,
                                Chips current_bet,
                                Chips min_raise,
                                std::map<SeatNumber, Chips> committed,
                                const Table& table,
                                SeatNumber first_candidate) {
    BettingRound round;
    round.street_ = street;
    round.current_bet_ = current_bet;
    round.min_raise_ = min_raise;
    round.committed_ = std::move(committed);
    for (SeatNumber s : eligible_seats(table.seats)) {
        round.pending_.insert(s);
    }
    round.prune(table);
    round.advance_from(first_candidate, /*inclusive=*/true);

    spdlog::debug("Round {} opened: bet {}, min raise {}, first to act {}",
                  street_to_string(street), current_bet, min_raise,
                  round.to_act_ ? std::to_string(*round.to_act_) : "none");
    return round;
}

Chips BettingRound::committed(SeatNumber seat) const {
    auto it = committed_.find(seat);
    return it == committed_.end() ? 0 : it->second;
}

Chips BettingRound::total_committed() const {
    Chips total = 0;
    for (const auto& [seat, amount] : committed_) total += amount;
    return total;
}

void BettingRound::apply(const ValidatedAction& action, const Table& table) {
    const SeatNumber seat = action.seat;
    committed_[seat] = action.new_total;
    pending_.erase(seat);
    no_reraise_.erase(seat);
    acted_since_full_raise_.insert(seat);

    if (action.new_total > current_bet_) {
        const Chips increment = action.new_total - current_bet_;
        current_bet_ = action.new_total;

        if (action.full_raise) {
            // Une mise courte all-in (< big blind) garde le min-raise actuel
            min_raise_ = std::max(min_raise_, increment);
            pending_.clear();
            no_reraise_.clear();
            acted_since_full_raise_ = {seat};
            for (SeatNumber s : eligible_seats(table.seats)) {
                if (s != seat) pending_.insert(s);
            }
        } else {
            // All-in incomplet : ceux qui ont déjà parlé doivent compléter
            // mais ne peuvent plus relancer
            for (SeatNumber s : eligible_seats(table.seats)) {
                if (s == seat || committed(s) >= current_bet_) continue;
                pending_.insert(s);
                if (acted_since_full_raise_.count(s)) no_reraise_.insert(s);
            }
            spdlog::debug("Short all-in by seat {} (+{}), action not reopened", seat, increment);
        }
    }

    prune(table);
    advance_from(seat, /*inclusive=*/false);
}

void BettingRound::close() {
    pending_.clear();
    no_reraise_.clear();
    to_act_.reset();
}

void BettingRound::prune(const Table& table) {
    for (auto it = pending_.begin(); it != pending_.end();) {
        const Seat* s = table.find_seat(*it);
        if (!s || s->status != SeatStatus::PLAYING) it = pending_.erase(it);
        else ++it;
    }

    const int playing = count_status(table, SeatStatus::PLAYING);
    const int contenders = playing + count_status(table, SeatStatus::ALL_IN);
    if (contenders <= 1) {
        pending_.clear();
        return;
    }
    // Un seul joueur avec des jetons : il ne parle que s'il doit suivre
    if (playing <= 1) {
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (committed(*it) >= current_bet_) it = pending_.erase(it);
            else ++it;
        }
    }
}

void BettingRound::advance_from(SeatNumber from, bool inclusive) {
    if (pending_.empty()) {
        to_act_.reset();
        return;
    }
    const std::vector<SeatNumber> candidates(pending_.begin(), pending_.end());
    to_act_ = inclusive ? seat_at_or_after(candidates, from)
                        : next_seat_clockwise(candidates, from);
    spdlog::trace("Next to act on {}: seat {}", street_to_string(street_), *to_act_);
}

} // namespace holdem_table
