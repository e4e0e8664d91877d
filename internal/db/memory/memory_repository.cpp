#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace nsi::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Connections
// ------------------------------------------------------------------

Result MemoryRepository::InsertConnection(Transaction& t, const model::Connection& c) {
  auto& tx = TX(t);
  if (tx.Connections().count(c.connection_id)) return Result::Err(ErrorCode::AlreadyExists, c.connection_id);
  tx.Write(c);
  return Result::Ok();
}

std::optional<model::Connection> MemoryRepository::GetConnection(Transaction& t, const std::string& id) {
  const auto& connections = TX(t).Connections();
  auto        it          = connections.find(id);
  if (it == connections.end()) return std::nullopt;
  return it->second;
}

std::optional<model::Connection> MemoryRepository::FindByProviderId(Transaction& t, const std::string& provider_id) {
  if (provider_id.empty()) return std::nullopt;

  for (const auto& [_, c] : TX(t).Connections()) {
    if (c.provider_connection_id == provider_id) return c;
  }
  return std::nullopt;
}

std::vector<model::Connection> MemoryRepository::ListConnections(Transaction& t, bool include_archived) {
  std::vector<model::Connection> out;
  for (const auto& [_, c] : TX(t).Connections()) {
    if (!include_archived && c.IsArchived()) continue;
    out.push_back(c);
  }

  std::sort(out.begin(), out.end(), [](const model::Connection& a, const model::Connection& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.connection_id < b.connection_id;
  });
  return out;
}

Result MemoryRepository::UpdateConnection(Transaction& t, const model::Connection& c) {
  auto&       tx = TX(t);
  const auto& connections = tx.Connections();
  auto        it          = connections.find(c.connection_id);
  if (it == connections.end()) return Result::Err(ErrorCode::NotFound, c.connection_id);
  if (it->second.version + 1 != c.version) {
    return Result::Err(ErrorCode::Conflict, "stale version for connection " + c.connection_id);
  }
  tx.Write(c);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Anomaly log
// ------------------------------------------------------------------

Result MemoryRepository::AppendAnomaly(Transaction& t, const model::Anomaly& a) {
  TX(t).Append(a);
  return Result::Ok();
}

std::vector<model::Anomaly> MemoryRepository::ListAnomalies(Transaction& t, const std::optional<std::string>& id) {
  auto matches = [&](const model::Anomaly& a) { return !id || a.connection_id == *id; };

  std::vector<model::Anomaly> out;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& a : committed_.anomalies)
      if (matches(a)) out.push_back(a);
  }
  for (const auto& a : TX(t).Appended())
    if (matches(a)) out.push_back(a);
  return out;
}

} // namespace nsi::db::memory
