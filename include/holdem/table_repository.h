#ifndef HOLDEM_TABLE_REPOSITORY_H
#define HOLDEM_TABLE_REPOSITORY_H

#include <map>
#include <mutex>
#include <string>

#include "holdem/hand.h"
#include "holdem/public_view.h"

namespace holdem_table {

// Persistance, implémentée hors du moteur
class TableRepository {
public:
    virtual ~TableRepository() = default;

    // TableNotFoundError si l'id est inconnu
    virtual TableState load_table_state(const std::string& table_id) = 0;

    // Tout ou rien ; StatePersistenceError si l'état ne peut pas être appliqué en entier
    virtual void commit_table_state(const std::string& table_id, const TableState& state) = 0;
};

// Transport vers les clients, implémenté hors du moteur
class StateObserver {
public:
    virtual ~StateObserver() = default;
    virtual void notify_state_changed(const std::string& table_id, const PublicView& view) = 0;
};

// Stockage mémoire : simulation et tests
class InMemoryTableRepository : public TableRepository {
public:
    void put(const TableState& state);

    TableState load_table_state(const std::string& table_id) override;
    void commit_table_state(const std::string& table_id, const TableState& state) override;

    size_t commit_count() const;

private:
    mutable std::mutex m_;
    std::map<std::string, TableState> tables_;
    size_t commits_ = 0;
};

} // namespace holdem_table

#endif // HOLDEM_TABLE_REPOSITORY_H
