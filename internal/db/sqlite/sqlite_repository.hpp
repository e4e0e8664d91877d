#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace nsi::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertConnection(Transaction&, const model::Connection&) override;
  std::optional<model::Connection> GetConnection(Transaction&, const std::string&) override;
  std::optional<model::Connection> FindByProviderId(Transaction&, const std::string&) override;
  std::vector<model::Connection>   ListConnections(Transaction&, bool include_archived) override;
  Result                           UpdateConnection(Transaction&, const model::Connection&) override;

  Result                      AppendAnomaly(Transaction&, const model::Anomaly&) override;
  std::vector<model::Anomaly> ListAnomalies(Transaction&, const std::optional<std::string>&) override;

 private:
  std::shared_ptr<SqliteDB> db_;
  std::mutex                tx_mutex_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace nsi::db::sqlite
