#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace nsi::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS connections ("
      "connection_id TEXT PRIMARY KEY, provider_connection_id TEXT NOT NULL DEFAULT '', "
      "global_reservation_id TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', "
      "source_stp TEXT NOT NULL, dest_stp TEXT NOT NULL, source_vlan INTEGER NOT NULL, dest_vlan INTEGER NOT NULL, "
      "bandwidth_mbps INTEGER NOT NULL, start_time_ms INTEGER, end_time_ms INTEGER, "
      "reservation_state INTEGER NOT NULL, provision_state INTEGER NOT NULL, lifecycle_state INTEGER NOT NULL, "
      "data_plane_state INTEGER NOT NULL, committed INTEGER NOT NULL, stalled_operation INTEGER NOT NULL, "
      "version INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, archived_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS connections_provider_id ON connections(provider_connection_id);",
      "CREATE TABLE IF NOT EXISTS anomalies ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, connection_id TEXT NOT NULL, kind INTEGER NOT NULL, "
      "operation INTEGER NOT NULL, correlation_id TEXT NOT NULL, "
      "reservation_state INTEGER NOT NULL, provision_state INTEGER NOT NULL, lifecycle_state INTEGER NOT NULL, "
      "data_plane_state INTEGER NOT NULL, committed INTEGER NOT NULL, detail TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS anomalies_connection ON anomalies(connection_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT connection_id,version,archived_at_ms FROM connections LIMIT 1;");
  db.Exec("SELECT seq,connection_id,kind,detail FROM anomalies LIMIT 1;");
}

} // namespace nsi::db::sqlite
