#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/codec/message_codec.hpp"
#include "internal/correlation/correlation_tracker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fsm/connection_state_machine.hpp"
#include "internal/model/anomaly.hpp"
#include "internal/model/connection.hpp"
#include "internal/model/pending_operation.hpp"
#include "internal/timeout/retry_policy.hpp"
#include "internal/timeout/timeout_manager.hpp"
#include "internal/transport/message_sink.hpp"
#include "internal/util/time.hpp"
#include "nsi/requester/v1.hpp"

namespace nsi::core {

struct EngineOptions {
  std::chrono::milliseconds                                 default_timeout = std::chrono::seconds(30);
  std::map<model::OperationKind, std::chrono::milliseconds> timeouts;

  timeout::RetryPolicy query_retry;

  // Issue reserveCommit after a reserve confirm, provision after a commit confirm.
  bool auto_commit    = false;
  bool auto_provision = false;

  std::function<util::TimePoint()> clock = util::Now;

  std::chrono::milliseconds TimeoutFor(model::OperationKind kind) const;
};

struct ReserveParams {
  std::string              description;
  model::ServiceParameters params;
};

struct IntentResult {
  std::string             connection_id;
  std::string             correlation_id; // empty for ForceTerminate
  model::ConnectionStates states;
};

enum class InboundStatus : std::uint8_t {
  kApplied   = 0, // transition applied and saved
  kRejected  = 1, // matched a connection but no transition exists
  kDiscarded = 2, // matched nothing (unknown or already resolved)
};

struct InboundResult {
  InboundStatus status = InboundStatus::kDiscarded;
  std::string   connection_id;
};

/*
  Orchestrates the requester side of the provider exchange.

  Every state change of a connection happens here, under that
  connection's mutex, and is saved before the call returns. Replies,
  faults, notifications and timeouts that do not fit are recorded in the
  anomaly log instead of being thrown back to the transport.
*/
class ProtocolEngine {
 public:
  ProtocolEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::MessageSink> sink,
                 codec::MessageCodec codec, fsm::ConnectionStateMachine state_machine,
                 std::shared_ptr<correlation::CorrelationTracker> tracker,
                 std::shared_ptr<timeout::TimeoutManager> timeouts, EngineOptions options = {});

  // ------------------------------------------------------------------
  // Operator intents
  // ------------------------------------------------------------------

  IntentResult Reserve(const ReserveParams& request);
  // Sends a fresh reserve for a connection whose reservation is back at Start.
  IntentResult Rereserve(const std::string& connection_id);
  IntentResult ReserveCommit(const std::string& connection_id);
  IntentResult ReserveAbort(const std::string& connection_id);
  IntentResult Provision(const std::string& connection_id);
  IntentResult Release(const std::string& connection_id);
  IntentResult Terminate(const std::string& connection_id);
  IntentResult Query(const std::string& connection_id);

  IntentResult ForceTerminate(const std::string& connection_id);

  // ------------------------------------------------------------------
  // Provider side
  // ------------------------------------------------------------------

  InboundResult OnProviderMessage(const nsi::requester::v1::Envelope& envelope);
  InboundResult OnProviderPayload(const std::string& bytes);

  void Tick();
  void Tick(util::TimePoint now);

  // Returns the number of connections that had a lost operation.
  std::size_t RecoverAfterRestart();

  // ------------------------------------------------------------------
  // Projections
  // ------------------------------------------------------------------

  model::Connection                    GetConnection(const std::string& connection_id);
  std::vector<model::Connection>       ListConnections(bool include_archived = false);
  std::vector<model::Anomaly>          ListAnomalies(const std::optional<std::string>& connection_id = std::nullopt);
  std::vector<model::PendingOperation> PendingOperations(const std::string& connection_id) const;

 private:
  IntentResult Issue(const std::string& connection_id, model::OperationKind kind);
  IntentResult IssueLocked(const std::string& connection_id, model::OperationKind kind, uint32_t attempt);

  InboundResult OnReply(const codec::ProviderMessage& message);
  InboundResult OnNotification(const codec::ProviderMessage& message);

  InboundStatus ApplyAndSave(model::Connection& connection, const fsm::Event& event, model::OperationKind kind,
                             const std::string& correlation_id);
  void          ApplySideEffects(const model::Connection& connection, const fsm::Transition& transition);

  void OnDeadline(const std::string& correlation_id, util::TimePoint now);
  void OnQueryRetry(const std::string& connection_id);
  void OnReservationEnd(const std::string& connection_id);

  void RunFollowUp(const std::string& connection_id, model::OperationKind kind);
  void CancelPending(const std::string& connection_id, const std::string& keep_correlation_id = {});

  model::Connection Load(const std::string& connection_id);
  void              Save(model::Connection& connection, const std::optional<model::Anomaly>& anomaly);
  void              RecordAnomaly(const model::Anomaly& anomaly);

  model::Anomaly MakeAnomaly(const model::Connection& connection, model::AnomalyKind kind, model::OperationKind op,
                             const std::string& correlation_id, const std::string& detail) const;

  std::shared_ptr<std::shared_mutex> ConnectionMutex(const std::string& connection_id);

  std::shared_ptr<db::Repository>                  repository_;
  std::shared_ptr<transport::MessageSink>          sink_;
  codec::MessageCodec                              codec_;
  fsm::ConnectionStateMachine                      fsm_;
  std::shared_ptr<correlation::CorrelationTracker> tracker_;
  std::shared_ptr<timeout::TimeoutManager>         timeouts_;
  EngineOptions                                    options_;

  mutable std::mutex                                                  connection_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> connection_mutexes_;

  // connection id -> attempt number of the query waiting out its backoff
  std::mutex                                query_retries_guard_;
  std::unordered_map<std::string, uint32_t> query_retries_;
};

} // namespace nsi::core
