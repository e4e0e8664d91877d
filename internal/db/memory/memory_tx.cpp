#include "memory_tx.hpp"

#include <stdexcept>

namespace nsi::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_.connections; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Write(const model::Connection& connection) {
  if (!write_set_.count(connection.connection_id)) {
    auto it = working_.find(connection.connection_id);
    write_set_.emplace(connection.connection_id,
                       it == working_.end() ? std::nullopt : std::optional<uint64_t>(it->second.version));
  }
  working_[connection.connection_id] = connection;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("transaction already rolled back");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto&            committed = repo_.committed_;

  for (const auto& [id, base_version] : write_set_) {
    auto                    it      = committed.connections.find(id);
    std::optional<uint64_t> current = it == committed.connections.end() ? std::nullopt : std::optional<uint64_t>(it->second.version);
    if (current != base_version) {
      throw std::runtime_error("transaction conflict: connection " + id + " was modified by a concurrent transaction");
    }
  }

  for (const auto& [id, _] : write_set_) {
    committed.connections[id] = working_.at(id);
  }
  committed.anomalies.insert(committed.anomalies.end(), appended_.begin(), appended_.end());
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  write_set_.clear();
  appended_.clear();
  rolled_back_ = true;
}

} // namespace nsi::db::memory
