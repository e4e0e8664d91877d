#pragma once

#include "sqlite_db.hpp"

namespace nsi::db::sqlite {

// Creates the connection and anomaly tables if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace nsi::db::sqlite
