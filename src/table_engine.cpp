#include "holdem/table_engine.h"
#include "holdem/errors.h"
#include "holdem/game_utils.hpp"
#include "holdem/hand_orchestrator.h"
#include "spdlog/spdlog.h"

#include <condition_variable>
#include <cstdint>

namespace holdem_table {

// -----------------------------------------------------------------------------
//  Verrou à tickets : sérialise une table dans l'ordre d'arrivée
// -----------------------------------------------------------------------------
class TableStrand {
public:
    void acquire() {
        std::unique_lock<std::mutex> lock(m_);
        const uint64_t ticket = next_ticket_++;
        cv_.wait(lock, [&] { return now_serving_ == ticket; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_);
            ++now_serving_;
        }
        cv_.notify_all();
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
};

namespace {

class StrandGuard {
public:
    explicit StrandGuard(TableStrand& strand) : strand_(strand) { strand_.acquire(); }
    ~StrandGuard() { strand_.release(); }
    StrandGuard(const StrandGuard&) = delete;
    StrandGuard& operator=(const StrandGuard&) = delete;

private:
    TableStrand& strand_;
};

} // namespace

TableEngine::TableEngine(TableRepository& repository, StateObserver& observer, EngineConfig config)
    : repository_(repository),
      observer_(observer),
      config_(std::move(config))
{
    if (config_.commit_attempts < 1) config_.commit_attempts = 1;
}

TableEngine::~TableEngine() = default;

TableStrand& TableEngine::strand_for(const std::string& table_id) {
    std::lock_guard<std::mutex> lock(strands_mutex_);
    auto& strand = strands_[table_id];
    if (!strand) strand = std::make_unique<TableStrand>();
    return *strand;
}

Deck TableEngine::new_deck() const {
    return config_.deck_factory ? config_.deck_factory() : Deck();
}

// -----------------------------------------------------------------------------
//  Transition atomique : copie tampon -> commit (1 retry) -> publication
// -----------------------------------------------------------------------------
void TableEngine::transition(const std::string& table_id, const char* what, const Mutation& mutate) {
    StrandGuard guard(strand_for(table_id));

    std::optional<TableState> committed;
    for (int attempt = 1; !committed; ++attempt) {
        TableState next = repository_.load_table_state(table_id);
        if (!mutate(next)) return;
        try {
            repository_.commit_table_state(table_id, next);
            committed = std::move(next);
        } catch (const StatePersistenceError& e) {
            spdlog::error("Table {}: commit of {} failed (attempt {}/{}): {}",
                          table_id, what, attempt, config_.commit_attempts, e.what());
            if (attempt >= config_.commit_attempts) throw;
        }
    }

    rearm_timer(table_id, *committed);
    observer_.notify_state_changed(table_id, build_public_view(*committed));
}

void TableEngine::start_table(const std::string& table_id) {
    transition(table_id, "startTable", [this](TableState& state) {
        HandOrchestrator(state).start_table(new_deck());
        return true;
    });
}

void TableEngine::start_hand(const std::string& table_id) {
    transition(table_id, "startHand", [this](TableState& state) {
        HandOrchestrator(state).start_hand(new_deck());
        return true;
    });
}

void TableEngine::submit_action(const std::string& table_id, SeatNumber seat, const Action& action) {
    Action normalized = action;
    normalized.seat = seat;
    try {
        transition(table_id, "submitAction", [&normalized](TableState& state) {
            HandOrchestrator(state).submit_action(normalized);
            return true;
        });
    } catch (const EngineError& e) {
        if (e.kind() == ErrorKind::NOT_YOUR_TURN || e.kind() == ErrorKind::INVALID_ACTION) {
            spdlog::warn("Table {}: rejected {}: {}", table_id, action_to_string(normalized), e.what());
        }
        throw;
    }
}

LegalActions TableEngine::legal_actions(const std::string& table_id, SeatNumber seat) {
    StrandGuard guard(strand_for(table_id));
    TableState state = repository_.load_table_state(table_id);
    return HandOrchestrator(state).legal_actions(seat);
}

PublicView TableEngine::view(const std::string& table_id, std::optional<SeatNumber> viewer) {
    StrandGuard guard(strand_for(table_id));
    return build_public_view(repository_.load_table_state(table_id), viewer);
}

// -----------------------------------------------------------------------------
//  Minuteur d'action
// -----------------------------------------------------------------------------
void TableEngine::rearm_timer(const std::string& table_id, const TableState& state) {
    timer_.cancel(table_id);
    if (config_.action_timeout.count() <= 0 || !state.awaiting_action()) return;

    const Hand& hand = *state.hand;
    const int hand_number = hand.hand_number;
    const uint64_t sequence = hand.action_sequence;
    const SeatNumber seat = *hand.round.seat_to_act();
    timer_.schedule(table_id, config_.action_timeout, [this, table_id, hand_number, sequence, seat] {
        on_action_timeout(table_id, hand_number, sequence, seat);
    });
}

void TableEngine::on_action_timeout(const std::string& table_id, int hand_number, uint64_t sequence, SeatNumber seat) {
    try {
        transition(table_id, "timeout", [&](TableState& state) {
            // Une action valide est arrivée entre-temps : rien à faire
            if (!state.awaiting_action() || state.hand->hand_number != hand_number ||
                state.hand->action_sequence != sequence || *state.hand->round.seat_to_act() != seat) {
                spdlog::debug("Table {}: stale timeout for seat {} ignored", table_id, seat);
                return false;
            }
            HandOrchestrator orchestrator(state);
            const ActionType auto_action = orchestrator.legal_actions(seat).allows(ActionType::CHECK)
                                               ? ActionType::CHECK
                                               : ActionType::FOLD;
            spdlog::warn("Table {}: seat {} timed out, auto {}", table_id, seat, action_type_to_string(auto_action));
            orchestrator.submit_action(Action{seat, auto_action, 0});
            return true;
        });
    } catch (const EngineError& e) {
        spdlog::error("Table {}: automatic action for seat {} failed: {}", table_id, seat, e.what());
    }
}

} // namespace holdem_table
