#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace nsi::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertConnection(Transaction&, const model::Connection&) override;
  std::optional<model::Connection> GetConnection(Transaction&, const std::string&) override;
  std::optional<model::Connection> FindByProviderId(Transaction&, const std::string&) override;
  std::vector<model::Connection>   ListConnections(Transaction&, bool include_archived) override;
  Result                           UpdateConnection(Transaction&, const model::Connection&) override;

  Result                      AppendAnomaly(Transaction&, const model::Anomaly&) override;
  std::vector<model::Anomaly> ListAnomalies(Transaction&, const std::optional<std::string>&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::Connection> connections;
    std::vector<model::Anomaly>                        anomalies;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace nsi::db::memory
