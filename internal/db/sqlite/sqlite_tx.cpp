#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace nsi::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::unique_lock<std::mutex> lock)
    : db_(std::move(db)), lock_(std::move(lock)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    NSI_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace nsi::db::sqlite
