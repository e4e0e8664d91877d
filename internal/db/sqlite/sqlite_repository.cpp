#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace nsi::db::sqlite {

using nsi::db::ErrorCode;
using nsi::db::Result;

namespace {

constexpr const char* kConnectionColumns =
    "connection_id,provider_connection_id,global_reservation_id,description,"
    "source_stp,dest_stp,source_vlan,dest_vlan,bandwidth_mbps,start_time_ms,end_time_ms,"
    "reservation_state,provision_state,lifecycle_state,data_plane_state,committed,stalled_operation,"
    "version,created_at_ms,updated_at_ms,archived_at_ms";

constexpr const char* kAnomalyColumns =
    "connection_id,kind,operation,correlation_id,"
    "reservation_state,provision_state,lifecycle_state,data_plane_state,committed,detail,recorded_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindU64(st, idx, util::ToUnixMillis(tp));
}

void BindOptionalTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindTime(st, idx, *tp);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::optional<util::TimePoint> ColOptionalTime(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return util::FromUnixMillis(ColU64(st, col));
}

sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

// Binds the 20 state columns shared by INSERT and UPDATE, starting at idx.
int BindConnectionBody(sqlite3_stmt* st, int idx, const model::Connection& c) {
  BindText(st, idx++, c.provider_connection_id);
  BindText(st, idx++, c.global_reservation_id);
  BindText(st, idx++, c.description);
  BindText(st, idx++, c.params.source_stp);
  BindText(st, idx++, c.params.dest_stp);
  BindU64(st, idx++, c.params.source_vlan);
  BindU64(st, idx++, c.params.dest_vlan);
  BindU64(st, idx++, c.params.bandwidth_mbps);
  BindOptionalTime(st, idx++, c.params.start_time);
  BindOptionalTime(st, idx++, c.params.end_time);
  BindI32(st, idx++, static_cast<int>(c.states.reservation));
  BindI32(st, idx++, static_cast<int>(c.states.provision));
  BindI32(st, idx++, static_cast<int>(c.states.lifecycle));
  BindI32(st, idx++, static_cast<int>(c.states.data_plane));
  BindI32(st, idx++, c.states.committed ? 1 : 0);
  BindI32(st, idx++, static_cast<int>(c.stalled_operation));
  BindU64(st, idx++, c.version);
  BindTime(st, idx++, c.created_at);
  BindTime(st, idx++, c.updated_at);
  BindOptionalTime(st, idx++, c.archived_at);
  return idx;
}

model::Connection ReadConnection(sqlite3_stmt* st) {
  model::Connection c;
  c.connection_id          = ColText(st, 0);
  c.provider_connection_id = ColText(st, 1);
  c.global_reservation_id  = ColText(st, 2);
  c.description            = ColText(st, 3);
  c.params.source_stp      = ColText(st, 4);
  c.params.dest_stp        = ColText(st, 5);
  c.params.source_vlan     = static_cast<uint32_t>(ColU64(st, 6));
  c.params.dest_vlan       = static_cast<uint32_t>(ColU64(st, 7));
  c.params.bandwidth_mbps  = ColU64(st, 8);
  c.params.start_time      = ColOptionalTime(st, 9);
  c.params.end_time        = ColOptionalTime(st, 10);
  c.states.reservation     = static_cast<model::ReservationState>(ColI32(st, 11));
  c.states.provision       = static_cast<model::ProvisionState>(ColI32(st, 12));
  c.states.lifecycle       = static_cast<model::LifecycleState>(ColI32(st, 13));
  c.states.data_plane      = static_cast<model::DataPlaneState>(ColI32(st, 14));
  c.states.committed       = ColI32(st, 15) != 0;
  c.stalled_operation      = static_cast<model::OperationKind>(ColI32(st, 16));
  c.version                = ColU64(st, 17);
  c.created_at             = util::FromUnixMillis(ColU64(st, 18));
  c.updated_at             = util::FromUnixMillis(ColU64(st, 19));
  c.archived_at            = ColOptionalTime(st, 20);
  return c;
}

model::Anomaly ReadAnomaly(sqlite3_stmt* st) {
  model::Anomaly a;
  a.connection_id      = ColText(st, 0);
  a.kind               = static_cast<model::AnomalyKind>(ColI32(st, 1));
  a.operation          = static_cast<model::OperationKind>(ColI32(st, 2));
  a.correlation_id     = ColText(st, 3);
  a.states.reservation = static_cast<model::ReservationState>(ColI32(st, 4));
  a.states.provision   = static_cast<model::ProvisionState>(ColI32(st, 5));
  a.states.lifecycle   = static_cast<model::LifecycleState>(ColI32(st, 6));
  a.states.data_plane  = static_cast<model::DataPlaneState>(ColI32(st, 7));
  a.states.committed   = ColI32(st, 8) != 0;
  a.detail             = ColText(st, 9);
  a.recorded_at        = util::FromUnixMillis(ColU64(st, 10));
  return a;
}

std::vector<model::Connection> CollectConnections(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::Connection> out;
  int                            rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadConnection(st));
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, std::unique_lock<std::mutex>(tx_mutex_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Connections
// ------------------------------------------------------------------

Result SqliteRepository::InsertConnection(Transaction& t, const model::Connection& c) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO connections(") + kConnectionColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, c.connection_id);
  BindConnectionBody(st, 2, c);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) rc = sqlite3_extended_errcode(db);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::Connection> SqliteRepository::GetConnection(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kConnectionColumns + " FROM connections WHERE connection_id=?;");
  BindText(st, 1, id);

  auto rows = CollectConnections(db, st);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::optional<model::Connection> SqliteRepository::FindByProviderId(Transaction& t, const std::string& provider_id) {
  if (provider_id.empty()) return std::nullopt;

  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kConnectionColumns +
                                    " FROM connections WHERE provider_connection_id=? LIMIT 1;");
  BindText(st, 1, provider_id);

  auto rows = CollectConnections(db, st);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::Connection> SqliteRepository::ListConnections(Transaction& t, bool include_archived) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kConnectionColumns + " FROM connections";
  if (!include_archived) sql += " WHERE archived_at_ms IS NULL";
  sql += " ORDER BY created_at_ms, connection_id;";

  return CollectConnections(db, PrepareOrThrow(db, sql));
}

Result SqliteRepository::UpdateConnection(Transaction& t, const model::Connection& c) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE connections SET provider_connection_id=?,global_reservation_id=?,description=?,"
      "source_stp=?,dest_stp=?,source_vlan=?,dest_vlan=?,bandwidth_mbps=?,start_time_ms=?,end_time_ms=?,"
      "reservation_state=?,provision_state=?,lifecycle_state=?,data_plane_state=?,committed=?,stalled_operation=?,"
      "version=?,created_at_ms=?,updated_at_ms=?,archived_at_ms=? "
      "WHERE connection_id=? AND version=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int idx = BindConnectionBody(st, 1, c);
  BindText(st, idx++, c.connection_id);
  BindU64(st, idx, c.version - 1);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) rc = sqlite3_extended_errcode(db);
  sqlite3_finalize(st);

  if (auto result = Translate(db, rc); !result) return result;
  if (sqlite3_changes(db) == 1) return Result::Ok();

  // Zero rows: either missing or someone else bumped the version.
  auto existing = GetConnection(t, c.connection_id);
  if (!existing) return Result::Err(ErrorCode::NotFound, c.connection_id);
  return Result::Err(ErrorCode::Conflict, "stale version for connection " + c.connection_id);
}

// ------------------------------------------------------------------
// Anomaly log
// ------------------------------------------------------------------

Result SqliteRepository::AppendAnomaly(Transaction& t, const model::Anomaly& a) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO anomalies(") + kAnomalyColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, a.connection_id);
  BindI32(st, 2, static_cast<int>(a.kind));
  BindI32(st, 3, static_cast<int>(a.operation));
  BindText(st, 4, a.correlation_id);
  BindI32(st, 5, static_cast<int>(a.states.reservation));
  BindI32(st, 6, static_cast<int>(a.states.provision));
  BindI32(st, 7, static_cast<int>(a.states.lifecycle));
  BindI32(st, 8, static_cast<int>(a.states.data_plane));
  BindI32(st, 9, a.states.committed ? 1 : 0);
  BindText(st, 10, a.detail);
  BindTime(st, 11, a.recorded_at);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) rc = sqlite3_extended_errcode(db);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<model::Anomaly> SqliteRepository::ListAnomalies(Transaction& t, const std::optional<std::string>& id) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kAnomalyColumns + " FROM anomalies";
  if (id) sql += " WHERE connection_id=?";
  sql += " ORDER BY seq;";

  auto* st = PrepareOrThrow(db, sql);
  if (id) BindText(st, 1, *id);

  std::vector<model::Anomaly> out;
  int                         rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadAnomaly(st));
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace nsi::db::sqlite
