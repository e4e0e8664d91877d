#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/anomaly.hpp"
#include "internal/model/connection.hpp"

namespace nsi::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateConnection is optimistic: the stored version must be exactly
    one below the incoming record's version, otherwise Conflict
  - Connections are never deleted; terminated ones are archived
  - Anomalies are append-only

  The DB is the source of truth for:
    connection sub-states
    anomaly log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Connections
  // ---------------------------------------------------------------------

  virtual Result InsertConnection(Transaction&, const model::Connection&) = 0;

  virtual std::optional<model::Connection> GetConnection(Transaction&, const std::string& connection_id) = 0;

  virtual std::optional<model::Connection> FindByProviderId(Transaction&, const std::string& provider_connection_id) = 0;

  virtual std::vector<model::Connection> ListConnections(Transaction&, bool include_archived) = 0;

  virtual Result UpdateConnection(Transaction&, const model::Connection&) = 0;

  // ---------------------------------------------------------------------
  // Anomaly log
  // ---------------------------------------------------------------------

  virtual Result AppendAnomaly(Transaction&, const model::Anomaly&) = 0;

  // nullopt lists every anomaly, including unmatched messages.
  virtual std::vector<model::Anomaly> ListAnomalies(Transaction&, const std::optional<std::string>& connection_id) = 0;
};

} // namespace nsi::db
