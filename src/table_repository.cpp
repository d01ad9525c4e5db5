#include "holdem/table_repository.h"
#include "holdem/errors.h"

namespace holdem_table {

void InMemoryTableRepository::put(const TableState& state) {
    std::lock_guard<std::mutex> lock(m_);
    tables_[state.table.id] = state;
}

TableState InMemoryTableRepository::load_table_state(const std::string& table_id) {
    std::lock_guard<std::mutex> lock(m_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) throw TableNotFoundError("Table not found: " + table_id);
    return it->second; // copie
}

void InMemoryTableRepository::commit_table_state(const std::string& table_id, const TableState& state) {
    std::lock_guard<std::mutex> lock(m_);
    if (state.table.id != table_id) {
        throw StatePersistenceError("State for table " + state.table.id + " committed under id " + table_id);
    }
    tables_[table_id] = state;
    ++commits_;
}

size_t InMemoryTableRepository::commit_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return commits_;
}

} // namespace holdem_table
