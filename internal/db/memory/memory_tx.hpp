#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace nsi::db::memory {

/*
  Transaction = connection snapshot + write set

  Commit only publishes rows this transaction wrote, so transactions on
  different connections never conflict. A row written concurrently by
  someone else since the snapshot fails the commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const std::unordered_map<std::string, model::Connection>& Connections() const {
    return working_;
  }

  void Write(const model::Connection& connection);

  void Append(const model::Anomaly& anomaly) {
    appended_.push_back(anomaly);
  }

  const std::vector<model::Anomaly>& Appended() const {
    return appended_;
  }

 private:
  MemoryRepository& repo_;

  std::unordered_map<std::string, model::Connection> working_;

  // connection id -> version at snapshot time (nullopt: row did not exist)
  std::unordered_map<std::string, std::optional<uint64_t>> write_set_;
  std::vector<model::Anomaly>                              appended_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace nsi::db::memory
