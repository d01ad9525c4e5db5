#ifndef HOLDEM_TABLE_ENGINE_H
#define HOLDEM_TABLE_ENGINE_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "holdem/action_timer.h"
#include "holdem/action_validator.h"
#include "holdem/config.h"
#include "holdem/public_view.h"
#include "holdem/table_repository.h"

namespace holdem_table {

class TableStrand;

/**
 * Point d'entrée : startTable / startHand / submitAction.
 *
 * Une transition = charger l'état, le modifier sur une copie, le persister
 * d'un bloc puis le publier. Au plus une transition en vol par table, dans
 * l'ordre de soumission ; les tables différentes avancent en parallèle.
 */
class TableEngine {
public:
    TableEngine(TableRepository& repository, StateObserver& observer, EngineConfig config = {});
    ~TableEngine();

    TableEngine(const TableEngine&) = delete;
    TableEngine& operator=(const TableEngine&) = delete;

    void start_table(const std::string& table_id);
    void start_hand(const std::string& table_id);

    // Refusée (NotYourTurnError) plutôt que mise en file si le siège n'a pas la parole
    void submit_action(const std::string& table_id, SeatNumber seat, const Action& action);

    LegalActions legal_actions(const std::string& table_id, SeatNumber seat);
    PublicView view(const std::string& table_id, std::optional<SeatNumber> viewer = std::nullopt);

    bool timer_armed(const std::string& table_id) const { return timer_.is_scheduled(table_id); }

private:
    // La mutation renvoie false si rien n'est à persister
    using Mutation = std::function<bool(TableState&)>;

    void transition(const std::string& table_id, const char* what, const Mutation& mutate);
    TableStrand& strand_for(const std::string& table_id);
    Deck new_deck() const;
    void rearm_timer(const std::string& table_id, const TableState& state);
    void on_action_timeout(const std::string& table_id, int hand_number, uint64_t sequence, SeatNumber seat);

    TableRepository& repository_;
    StateObserver& observer_;
    EngineConfig config_;

    std::mutex strands_mutex_;
    std::map<std::string, std::unique_ptr<TableStrand>> strands_;

    // Dernier membre : arrêté en premier, avant que les rappels ne perdent leur contexte
    ActionTimer timer_;
};

} // namespace holdem_table

#endif // HOLDEM_TABLE_ENGINE_H
