#include "protocol_engine.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace nsi::core {

using model::AnomalyKind;
using model::OperationKind;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kMinVlan = 2;
constexpr uint32_t kMaxVlan = 4094;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ToString(result.code)) + ")");
  }
}

void ValidateVlan(const char* which, uint32_t vlan) {
  if (vlan < kMinVlan || vlan > kMaxVlan) {
    throw util::InvalidArgument(std::string(which) + " vlan " + std::to_string(vlan) + " outside " +
                                std::to_string(kMinVlan) + ".." + std::to_string(kMaxVlan));
  }
}

void ValidateReserve(const ReserveParams& request) {
  const auto& p = request.params;
  if (p.source_stp.empty()) throw util::InvalidArgument("source stp is required");
  if (p.dest_stp.empty()) throw util::InvalidArgument("destination stp is required");
  ValidateVlan("source", p.source_vlan);
  ValidateVlan("destination", p.dest_vlan);
  if (p.bandwidth_mbps == 0) throw util::InvalidArgument("bandwidth must be positive");
  if (p.start_time && p.end_time && *p.end_time <= *p.start_time) {
    throw util::InvalidArgument("end time must be after start time");
  }
}

std::string FormatStates(const model::ConnectionStates& s) {
  std::ostringstream out;
  out << model::ToString(s.reservation) << (s.committed ? "+committed" : "") << '/' << model::ToString(s.provision) << '/'
      << model::ToString(s.lifecycle) << '/' << model::ToString(s.data_plane);
  return out.str();
}

void LogTransition(const std::string& connection_id, const fsm::Event& event, const model::ConnectionStates& before,
                   const model::ConnectionStates& after) {
  observability::Metrics::Instance().RecordTransition(fsm::Describe(event));
  NSI_LOG_INFO("connection transition", {StringField("connection_id", connection_id), StringField("event", fsm::Describe(event)),
                                         StringField("before", FormatStates(before)), StringField("after", FormatStates(after))});
}

std::string_view ReplyName(codec::MessageType type) {
  return type == codec::MessageType::kFault ? "fault" : "confirm";
}

} // namespace

std::chrono::milliseconds EngineOptions::TimeoutFor(OperationKind kind) const {
  auto it = timeouts.find(kind);
  return it == timeouts.end() ? default_timeout : it->second;
}

ProtocolEngine::ProtocolEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::MessageSink> sink,
                               codec::MessageCodec codec, fsm::ConnectionStateMachine state_machine,
                               std::shared_ptr<correlation::CorrelationTracker> tracker,
                               std::shared_ptr<timeout::TimeoutManager> timeouts, EngineOptions options)
    : repository_(std::move(repository)),
      sink_(std::move(sink)),
      codec_(std::move(codec)),
      fsm_(std::move(state_machine)),
      tracker_(std::move(tracker)),
      timeouts_(std::move(timeouts)),
      options_(std::move(options)) {
  if (!repository_ || !sink_ || !tracker_ || !timeouts_) {
    throw std::invalid_argument("protocol engine requires repository, sink, tracker and timeout manager");
  }
}

std::shared_ptr<std::shared_mutex> ProtocolEngine::ConnectionMutex(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(connection_mutexes_guard_);
  auto&                       connection_mutex = connection_mutexes_[connection_id];
  if (!connection_mutex) {
    connection_mutex = std::make_shared<std::shared_mutex>();
  }
  return connection_mutex;
}

// ------------------------------------------------------------------
// Operator intents
// ------------------------------------------------------------------

IntentResult ProtocolEngine::Reserve(const ReserveParams& request) {
  ValidateReserve(request);

  model::Connection connection;
  connection.connection_id         = util::ToString(util::GenerateUUID());
  connection.global_reservation_id = util::ToUrn(util::GenerateUUID());
  connection.description           = request.description;
  connection.params                = request.params;
  connection.version               = 1;
  connection.created_at            = options_.clock();
  connection.updated_at            = connection.created_at;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertConnection(*tx, connection), "insert connection " + connection.connection_id);
  tx->Commit();

  NSI_LOG_INFO("connection created", {StringField("connection_id", connection.connection_id),
                                      StringField("global_reservation_id", connection.global_reservation_id),
                                      StringField("source", model::StpWithVlan(connection.params.source_stp, connection.params.source_vlan)),
                                      StringField("dest", model::StpWithVlan(connection.params.dest_stp, connection.params.dest_vlan)),
                                      IntField("bandwidth_mbps", static_cast<int64_t>(connection.params.bandwidth_mbps))});

  return Issue(connection.connection_id, OperationKind::kReserve);
}

IntentResult ProtocolEngine::Rereserve(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kReserve);
}

IntentResult ProtocolEngine::ReserveCommit(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kReserveCommit);
}

IntentResult ProtocolEngine::ReserveAbort(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kReserveAbort);
}

IntentResult ProtocolEngine::Provision(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kProvision);
}

IntentResult ProtocolEngine::Release(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kRelease);
}

IntentResult ProtocolEngine::Terminate(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kTerminate);
}

IntentResult ProtocolEngine::Query(const std::string& connection_id) {
  return Issue(connection_id, OperationKind::kQuery);
}

IntentResult ProtocolEngine::ForceTerminate(const std::string& connection_id) {
  auto             connection_mutex = ConnectionMutex(connection_id);
  std::unique_lock lock(*connection_mutex);

  auto connection = Load(connection_id);
  if (connection.IsArchived()) {
    throw util::InvalidState("connection " + connection_id + " is archived");
  }

  const auto transition = fsm_.ForceTerminate(connection);
  if (!transition.applied) {
    throw util::InvalidTransition(transition.detail);
  }

  const auto before             = connection.states;
  connection.states             = transition.states;
  connection.stalled_operation  = transition.stalled_operation;
  connection.archived_at        = options_.clock();
  Save(connection, std::nullopt);

  NSI_LOG_WARN("connection force-terminated", {StringField("connection_id", connection_id), StringField("before", FormatStates(before))});
  ApplySideEffects(connection, transition);

  return IntentResult{connection_id, {}, connection.states};
}

IntentResult ProtocolEngine::Issue(const std::string& connection_id, OperationKind kind) {
  auto             connection_mutex = ConnectionMutex(connection_id);
  std::unique_lock lock(*connection_mutex);
  return IssueLocked(connection_id, kind, 0);
}

IntentResult ProtocolEngine::IssueLocked(const std::string& connection_id, OperationKind kind, uint32_t attempt) {
  auto connection = Load(connection_id);
  if (connection.IsArchived()) {
    throw util::InvalidState("connection " + connection_id + " is archived");
  }

  const fsm::Event event      = fsm::RequestAccepted{kind};
  const auto       transition = fsm_.Apply(connection, event);
  if (!transition.applied) {
    RecordAnomaly(MakeAnomaly(connection, AnomalyKind::kInvalidTransition, kind, {}, transition.detail));
    throw util::InvalidTransition(transition.detail);
  }

  const auto              now = options_.clock();
  model::PendingOperation op;
  try {
    op = tracker_->Register(connection_id, kind, now, now + options_.TimeoutFor(kind), attempt);
  } catch (const util::ConflictingOperation& e) {
    RecordAnomaly(MakeAnomaly(connection, AnomalyKind::kConflictingOperation, kind, {}, e.what()));
    throw;
  }

  transport::EmitReceipt receipt;
  try {
    const auto started_at = std::chrono::steady_clock::now();
    receipt               = sink_->Emit(codec_.EncodeRequest(connection, op));
    observability::Metrics::Instance().ObserveEmitDurationMs(
        model::ToString(kind), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  } catch (const util::TransportError& e) {
    tracker_->Cancel(op.correlation_id);
    RecordAnomaly(MakeAnomaly(connection, AnomalyKind::kEmitFailed, kind, op.correlation_id, e.what()));
    throw;
  } catch (const util::InvalidState& e) {
    tracker_->Cancel(op.correlation_id);
    RecordAnomaly(MakeAnomaly(connection, AnomalyKind::kEmitFailed, kind, op.correlation_id, e.what()));
    throw;
  }

  if (transition.Has(fsm::SideEffect::kCancelPendingOperations)) {
    CancelPending(connection_id, op.correlation_id);
  }

  const bool adopt_provider_id = !receipt.provider_connection_id.empty() && connection.provider_connection_id.empty();

  const auto before = connection.states;
  if (transition.states != connection.states || transition.stalled_operation != connection.stalled_operation || adopt_provider_id) {
    connection.states            = transition.states;
    connection.stalled_operation = transition.stalled_operation;
    if (adopt_provider_id) {
      connection.provider_connection_id = receipt.provider_connection_id;
    }
    try {
      Save(connection, std::nullopt);
    } catch (const std::exception&) {
      tracker_->Cancel(op.correlation_id);
      throw;
    }
    LogTransition(connection_id, event, before, connection.states);
  }

  timeouts_->Schedule(op.correlation_id, op.deadline, timeout::TimerKind::kOperationDeadline);
  observability::Metrics::Instance().SetPendingOperations(static_cast<std::int64_t>(tracker_->Size()));

  NSI_LOG_INFO("request issued", {StringField("connection_id", connection_id), StringField("operation", model::ToString(kind)),
                                  StringField("correlation_id", op.correlation_id), IntField("attempt", op.attempt)});

  return IntentResult{connection_id, op.correlation_id, connection.states};
}

// ------------------------------------------------------------------
// Provider side
// ------------------------------------------------------------------

InboundResult ProtocolEngine::OnProviderPayload(const std::string& bytes) {
  return OnProviderMessage(codec::MessageCodec::Parse(bytes));
}

InboundResult ProtocolEngine::OnProviderMessage(const nsi::requester::v1::Envelope& envelope) {
  const auto message = codec_.Decode(envelope);
  if (message.type == codec::MessageType::kNotification) {
    return OnNotification(message);
  }
  return OnReply(message);
}

InboundResult ProtocolEngine::OnReply(const codec::ProviderMessage& message) {
  const auto& correlation_id = message.correlation_id;
  const auto  described      = std::string(ReplyName(message.type)) + "(" + std::string(model::ToString(message.operation)) + ")";

  auto pending = tracker_->Lookup(correlation_id);
  if (!pending) {
    const auto outcome = tracker_->Resolve(correlation_id);
    const auto kind    = outcome.status == correlation::ResolveStatus::kAlreadyResolved ? AnomalyKind::kAlreadyResolved
                                                                                         : AnomalyKind::kUnknownCorrelation;

    std::optional<model::Connection> known;
    {
      auto tx = repository_->Begin();
      known   = repository_->FindByProviderId(*tx, message.connection_id);
      tx->Commit();
    }

    const auto detail = described + " " + correlation_id + " matches no pending operation (" +
                        std::string(correlation::ToString(outcome.status)) + ")";
    if (known) {
      RecordAnomaly(MakeAnomaly(*known, kind, message.operation, correlation_id, detail));
      return InboundResult{InboundStatus::kDiscarded, known->connection_id};
    }

    model::Anomaly anomaly;
    anomaly.kind           = kind;
    anomaly.operation      = message.operation;
    anomaly.correlation_id = correlation_id;
    anomaly.detail         = detail;
    anomaly.recorded_at    = options_.clock();
    RecordAnomaly(anomaly);
    return InboundResult{InboundStatus::kDiscarded, {}};
  }

  const auto&                         connection_id = pending->connection_id;
  std::optional<model::OperationKind> follow_up;
  InboundResult                       result{InboundStatus::kDiscarded, connection_id};
  {
    auto             connection_mutex = ConnectionMutex(connection_id);
    std::unique_lock lock(*connection_mutex);

    model::Connection connection;
    try {
      connection = Load(connection_id);
    } catch (const util::NotFound&) {
      tracker_->Cancel(correlation_id);
      timeouts_->Cancel(correlation_id);
      NSI_LOG_ERROR("pending operation references a missing connection",
                    {StringField("connection_id", connection_id), StringField("correlation_id", correlation_id)});
      throw;
    }

    if (message.operation != pending->kind) {
      RecordAnomaly(MakeAnomaly(connection, AnomalyKind::kInvalidTransition, message.operation, correlation_id,
                                described + " does not answer pending " + std::string(model::ToString(pending->kind))));
      return InboundResult{InboundStatus::kRejected, connection_id};
    }

    const auto outcome = tracker_->Resolve(correlation_id);
    if (outcome.status != correlation::ResolveStatus::kResolved) {
      const auto kind = outcome.status == correlation::ResolveStatus::kAlreadyResolved ? AnomalyKind::kAlreadyResolved
                                                                                      : AnomalyKind::kUnknownCorrelation;
      RecordAnomaly(MakeAnomaly(connection, kind, message.operation, correlation_id, described + " arrived after resolution"));
      return result;
    }
    timeouts_->Cancel(correlation_id, timeout::TimerKind::kOperationDeadline);

    fsm::Event event;
    if (message.type == codec::MessageType::kConfirm) {
      fsm::ConfirmReceived confirm{message.operation, std::nullopt, message.data_plane_active};
      if (!message.connection_id.empty()) confirm.provider_connection_id = message.connection_id;
      event = confirm;
    } else {
      fsm::FaultReceived fault{message.operation, message.reason, std::nullopt};
      if (!message.connection_id.empty()) fault.provider_connection_id = message.connection_id;
      event = fault;
    }

    result.status = ApplyAndSave(connection, event, message.operation, correlation_id);

    if (result.status == InboundStatus::kApplied && message.type == codec::MessageType::kConfirm) {
      if (message.operation == OperationKind::kReserve && options_.auto_commit) {
        follow_up = OperationKind::kReserveCommit;
      } else if (message.operation == OperationKind::kReserveCommit && options_.auto_provision) {
        follow_up = OperationKind::kProvision;
      }
    }
  }

  if (follow_up) {
    RunFollowUp(connection_id, *follow_up);
  }
  return result;
}

InboundResult ProtocolEngine::OnNotification(const codec::ProviderMessage& message) {
  std::optional<model::Connection> found;
  {
    auto tx = repository_->Begin();
    found   = repository_->FindByProviderId(*tx, message.connection_id);
    if (!found) found = repository_->GetConnection(*tx, message.connection_id);
    tx->Commit();
  }

  const fsm::Event event = fsm::NotificationReceived{message.notification, message.data_plane_active.value_or(false), message.text};

  if (!found) {
    model::Anomaly anomaly;
    anomaly.kind        = AnomalyKind::kUnknownCorrelation;
    anomaly.detail      = fsm::Describe(event) + " for unknown connection " + message.connection_id;
    anomaly.recorded_at = options_.clock();
    RecordAnomaly(anomaly);
    return InboundResult{InboundStatus::kDiscarded, {}};
  }

  const auto       connection_id    = found->connection_id;
  auto             connection_mutex = ConnectionMutex(connection_id);
  std::unique_lock lock(*connection_mutex);

  auto connection = Load(connection_id);
  return InboundResult{ApplyAndSave(connection, event, OperationKind::kUnspecified, {}), connection_id};
}

InboundStatus ProtocolEngine::ApplyAndSave(model::Connection& connection, const fsm::Event& event, OperationKind kind,
                                           const std::string& correlation_id) {
  const auto transition = fsm_.Apply(connection, event);
  if (!transition.applied) {
    RecordAnomaly(MakeAnomaly(connection, AnomalyKind::kInvalidTransition, kind, correlation_id, transition.detail));
    return InboundStatus::kRejected;
  }

  const auto before            = connection.states;
  connection.states            = transition.states;
  connection.stalled_operation = transition.stalled_operation;
  if (transition.provider_connection_id) {
    connection.provider_connection_id = *transition.provider_connection_id;
  }
  if (transition.Has(fsm::SideEffect::kArchive)) {
    connection.archived_at = options_.clock();
  }

  std::optional<model::Anomaly> anomaly;
  if (transition.anomaly) {
    anomaly = MakeAnomaly(connection, *transition.anomaly, kind, correlation_id, transition.detail);
  }
  Save(connection, anomaly);

  if (anomaly) {
    NSI_LOG_WARN("connection anomaly", {StringField("connection_id", connection.connection_id),
                                        StringField("kind", model::ToString(anomaly->kind)), StringField("detail", anomaly->detail)});
  }
  LogTransition(connection.connection_id, event, before, connection.states);

  ApplySideEffects(connection, transition);
  return InboundStatus::kApplied;
}

void ProtocolEngine::ApplySideEffects(const model::Connection& connection, const fsm::Transition& transition) {
  for (const auto effect : transition.side_effects) {
    switch (effect) {
      case fsm::SideEffect::kCancelPendingOperations:
        CancelPending(connection.connection_id);
        break;
      case fsm::SideEffect::kArchive:
        NSI_LOG_INFO("connection archived", {StringField("connection_id", connection.connection_id)});
        break;
      case fsm::SideEffect::kScheduleEndTime:
        if (connection.params.end_time) {
          timeouts_->Schedule(connection.connection_id, *connection.params.end_time, timeout::TimerKind::kReservationEnd);
        }
        break;
    }
  }
}

void ProtocolEngine::RunFollowUp(const std::string& connection_id, OperationKind kind) {
  try {
    const auto result = Issue(connection_id, kind);
    NSI_LOG_INFO("automatic follow-up issued", {StringField("connection_id", connection_id), StringField("operation", model::ToString(kind)),
                                                StringField("correlation_id", result.correlation_id)});
  } catch (const std::exception& e) {
    NSI_LOG_WARN("automatic follow-up failed", {StringField("connection_id", connection_id), StringField("operation", model::ToString(kind)),
                                                StringField("error", e.what())});
  }
}

void ProtocolEngine::CancelPending(const std::string& connection_id, const std::string& keep_correlation_id) {
  for (const auto& correlation_id : tracker_->CancelAll(connection_id, keep_correlation_id)) {
    timeouts_->Cancel(correlation_id, timeout::TimerKind::kOperationDeadline);
    NSI_LOG_INFO("pending operation canceled", {StringField("connection_id", connection_id), StringField("correlation_id", correlation_id)});
  }

  timeouts_->Cancel(connection_id, timeout::TimerKind::kReservationEnd);
  timeouts_->Cancel(connection_id, timeout::TimerKind::kQueryRetry);

  std::lock_guard lock(query_retries_guard_);
  query_retries_.erase(connection_id);
}

// ------------------------------------------------------------------
// Timers
// ------------------------------------------------------------------

void ProtocolEngine::Tick() {
  Tick(options_.clock());
}

void ProtocolEngine::Tick(util::TimePoint now) {
  for (const auto& timer : timeouts_->Sweep(now)) {
    try {
      switch (timer.kind) {
        case timeout::TimerKind::kOperationDeadline:
          OnDeadline(timer.key, now);
          break;
        case timeout::TimerKind::kReservationEnd:
          OnReservationEnd(timer.key);
          break;
        case timeout::TimerKind::kQueryRetry:
          OnQueryRetry(timer.key);
          break;
      }
    } catch (const std::exception& e) {
      NSI_LOG_ERROR("timer handling failed", {StringField("timer", timeout::ToString(timer.kind)), StringField("key", timer.key),
                                              StringField("error", e.what())});
    }
  }
  observability::Metrics::Instance().SetPendingOperations(static_cast<std::int64_t>(tracker_->Size()));
}

void ProtocolEngine::OnDeadline(const std::string& correlation_id, util::TimePoint now) {
  auto pending = tracker_->Lookup(correlation_id);
  if (!pending) return;

  auto             connection_mutex = ConnectionMutex(pending->connection_id);
  std::unique_lock lock(*connection_mutex);

  // A reply may have won the race while we waited for the lock.
  const auto outcome = tracker_->Resolve(correlation_id);
  if (outcome.status != correlation::ResolveStatus::kResolved) return;

  const auto& op         = *outcome.operation;
  auto        connection = Load(op.connection_id);

  if (op.kind == OperationKind::kQuery && options_.query_retry.ShouldRetry(op.attempt)) {
    const auto backoff = options_.query_retry.Backoff(op.attempt);
    {
      std::lock_guard retry_lock(query_retries_guard_);
      query_retries_[op.connection_id] = op.attempt + 1;
    }
    timeouts_->Schedule(op.connection_id, now + backoff, timeout::TimerKind::kQueryRetry);
    NSI_LOG_INFO("query timed out, retrying", {StringField("connection_id", op.connection_id), IntField("attempt", op.attempt + 1),
                                               IntField("backoff_ms", backoff.count())});
    return;
  }

  ApplyAndSave(connection, fsm::TimeoutExpired{op.kind}, op.kind, correlation_id);
}

void ProtocolEngine::OnQueryRetry(const std::string& connection_id) {
  uint32_t attempt = 0;
  {
    std::lock_guard retry_lock(query_retries_guard_);
    auto            it = query_retries_.find(connection_id);
    if (it == query_retries_.end()) return;
    attempt = it->second;
    query_retries_.erase(it);
  }

  auto             connection_mutex = ConnectionMutex(connection_id);
  std::unique_lock lock(*connection_mutex);
  try {
    IssueLocked(connection_id, OperationKind::kQuery, attempt);
  } catch (const util::ConflictingOperation&) {
    NSI_LOG_INFO("query retry skipped, a query is already pending", {StringField("connection_id", connection_id)});
  }
}

void ProtocolEngine::OnReservationEnd(const std::string& connection_id) {
  auto             connection_mutex = ConnectionMutex(connection_id);
  std::unique_lock lock(*connection_mutex);

  auto connection = Load(connection_id);
  if (connection.IsArchived()) return;

  ApplyAndSave(connection, fsm::NotificationReceived{fsm::NotificationType::kPassedEndTime, false, {}}, OperationKind::kUnspecified, {});
}

std::size_t ProtocolEngine::RecoverAfterRestart() {
  std::size_t recovered = 0;

  for (const auto& listed : ListConnections(false)) {
    auto             connection_mutex = ConnectionMutex(listed.connection_id);
    std::unique_lock lock(*connection_mutex);

    auto connection = Load(listed.connection_id);
    if (connection.IsArchived() || !tracker_->PendingFor(connection.connection_id).empty()) continue;

    std::vector<OperationKind> lost;
    switch (connection.states.reservation) {
      case model::ReservationState::kChecking:
        lost.push_back(OperationKind::kReserve);
        break;
      case model::ReservationState::kCommitting:
        lost.push_back(OperationKind::kReserveCommit);
        break;
      case model::ReservationState::kAborting:
        lost.push_back(OperationKind::kReserveAbort);
        break;
      default:
        break;
    }
    if (connection.states.provision == model::ProvisionState::kProvisioning) lost.push_back(OperationKind::kProvision);
    if (connection.states.provision == model::ProvisionState::kReleasing) lost.push_back(OperationKind::kRelease);
    if (connection.states.lifecycle == model::LifecycleState::kTerminating) lost.push_back(OperationKind::kTerminate);

    bool any_lost = false;
    for (const auto kind : lost) {
      // Already stalled before the restart: nothing new was lost.
      if (connection.IsStalled(kind)) continue;

      const auto transition = fsm_.Apply(connection, fsm::TimeoutExpired{kind});
      if (!transition.applied) continue;

      connection.states            = transition.states;
      connection.stalled_operation = transition.stalled_operation;
      Save(connection, MakeAnomaly(connection, AnomalyKind::kLostPendingOperation, kind, {},
                                   std::string(model::ToString(kind)) + " was in flight when the agent stopped"));
      NSI_LOG_WARN("pending operation lost across restart",
                   {StringField("connection_id", connection.connection_id), StringField("operation", model::ToString(kind))});
      any_lost = true;
    }
    if (any_lost) ++recovered;

    const auto lifecycle = connection.states.lifecycle;
    if (connection.states.IsCommittedHeld() && connection.params.end_time &&
        (lifecycle == model::LifecycleState::kCreated || lifecycle == model::LifecycleState::kFailed)) {
      timeouts_->Schedule(connection.connection_id, *connection.params.end_time, timeout::TimerKind::kReservationEnd);
    }
  }

  NSI_LOG_INFO("restart recovery complete", {IntField("recovered", static_cast<int64_t>(recovered))});
  return recovered;
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

model::Connection ProtocolEngine::GetConnection(const std::string& connection_id) {
  return Load(connection_id);
}

std::vector<model::Connection> ProtocolEngine::ListConnections(bool include_archived) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListConnections(*tx, include_archived);
  tx->Commit();
  return out;
}

std::vector<model::Anomaly> ProtocolEngine::ListAnomalies(const std::optional<std::string>& connection_id) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListAnomalies(*tx, connection_id);
  tx->Commit();
  return out;
}

std::vector<model::PendingOperation> ProtocolEngine::PendingOperations(const std::string& connection_id) const {
  return tracker_->PendingFor(connection_id);
}

// ------------------------------------------------------------------
// Persistence
// ------------------------------------------------------------------

model::Connection ProtocolEngine::Load(const std::string& connection_id) {
  auto tx         = repository_->Begin();
  auto connection = repository_->GetConnection(*tx, connection_id);
  tx->Commit();

  if (!connection) {
    throw util::NotFound("connection " + connection_id + " not found");
  }
  return *connection;
}

void ProtocolEngine::Save(model::Connection& connection, const std::optional<model::Anomaly>& anomaly) {
  connection.version += 1;
  connection.updated_at = options_.clock();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateConnection(*tx, connection), "save connection " + connection.connection_id);
  if (anomaly) {
    ThrowIfDbError(repository_->AppendAnomaly(*tx, *anomaly), "append anomaly");
  }
  tx->Commit();

  if (anomaly) {
    observability::Metrics::Instance().RecordAnomaly(model::ToString(anomaly->kind));
  }
}

void ProtocolEngine::RecordAnomaly(const model::Anomaly& anomaly) {
  observability::Metrics::Instance().RecordAnomaly(model::ToString(anomaly.kind));
  NSI_LOG_WARN("connection anomaly", {StringField("connection_id", anomaly.connection_id), StringField("kind", model::ToString(anomaly.kind)),
                                      StringField("correlation_id", anomaly.correlation_id), StringField("detail", anomaly.detail)});

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->AppendAnomaly(*tx, anomaly), "append anomaly");
  tx->Commit();
}

model::Anomaly ProtocolEngine::MakeAnomaly(const model::Connection& connection, AnomalyKind kind, OperationKind op,
                                           const std::string& correlation_id, const std::string& detail) const {
  model::Anomaly anomaly;
  anomaly.connection_id  = connection.connection_id;
  anomaly.kind           = kind;
  anomaly.operation      = op;
  anomaly.correlation_id = correlation_id;
  anomaly.states         = connection.states;
  anomaly.detail         = detail;
  anomaly.recorded_at    = options_.clock();
  return anomaly;
}

} // namespace nsi::core
