#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/protocol_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/transport/log_sink.hpp"
#include "internal/util/errors.hpp"
#include "nsi/requester/v1.hpp"

namespace {

namespace v1 = nsi::requester::v1;

using namespace std::chrono_literals;
using nsi::core::InboundStatus;
using nsi::core::ProtocolEngine;
using nsi::model::AnomalyKind;
using nsi::model::DataPlaneState;
using nsi::model::LifecycleState;
using nsi::model::OperationKind;
using nsi::model::ProvisionState;
using nsi::model::ReservationState;

constexpr uint64_t kStartMs = 1'800'000'000'000;

class FailingSink final : public nsi::transport::MessageSink {
 public:
  nsi::transport::EmitReceipt Emit(const v1::Envelope&) override {
    throw nsi::util::TransportError("relay unreachable");
  }
};

// Answers reserve requests with a provider connection id, as a relay does.
class AckingSink final : public nsi::transport::MessageSink {
 public:
  AckingSink(std::shared_ptr<nsi::transport::LogSink> log, std::string provider_id)
      : log_(std::move(log)), provider_id_(std::move(provider_id)) {
  }

  nsi::transport::EmitReceipt Emit(const v1::Envelope& envelope) override {
    log_->Emit(envelope);
    if (envelope.request().operation() == v1::OPERATION_RESERVE) return {provider_id_};
    return {};
  }

 private:
  std::shared_ptr<nsi::transport::LogSink> log_;
  std::string                              provider_id_;
};

struct Harness {
  std::shared_ptr<std::atomic<uint64_t>>             now_ms = std::make_shared<std::atomic<uint64_t>>(kStartMs);
  std::shared_ptr<nsi::db::Repository>               repository;
  std::shared_ptr<nsi::transport::LogSink>           sink = std::make_shared<nsi::transport::LogSink>();
  std::shared_ptr<ProtocolEngine>                    engine;

  explicit Harness(nsi::core::EngineOptions options = {}, nsi::fsm::FaultPolicy policy = {},
                   std::shared_ptr<nsi::db::Repository> repo = nullptr,
                   std::shared_ptr<nsi::transport::MessageSink> out = nullptr)
      : repository(repo ? std::move(repo) : std::make_shared<nsi::db::memory::MemoryRepository>()) {
    auto clock    = now_ms;
    options.clock = [clock] { return nsi::util::FromUnixMillis(clock->load()); };

    nsi::codec::CodecOptions codec_options;
    codec_options.requester_nsa = "urn:ogf:network:example.org:2013:nsa:requester";
    codec_options.provider_nsa  = "urn:ogf:network:example.net:2013:nsa:provider";

    engine = std::make_shared<ProtocolEngine>(repository, out ? std::move(out) : sink, nsi::codec::MessageCodec(codec_options),
                                              nsi::fsm::ConnectionStateMachine(std::move(policy)),
                                              std::make_shared<nsi::correlation::CorrelationTracker>(),
                                              std::make_shared<nsi::timeout::TimeoutManager>(), std::move(options));
  }

  void Advance(std::chrono::milliseconds by) {
    now_ms->fetch_add(static_cast<uint64_t>(by.count()));
  }

  void Tick() {
    engine->Tick();
  }

  v1::Envelope LastRequest() const {
    auto recent = sink->Recent();
    assert(!recent.empty());
    return recent.back();
  }

  std::size_t Emitted() const {
    return sink->Recent().size();
  }
};

nsi::core::ReserveParams MakeReserve() {
  nsi::core::ReserveParams request;
  request.description             = "lab circuit";
  request.params.source_stp       = "urn:ogf:network:example.net:2013:a";
  request.params.dest_stp         = "urn:ogf:network:example.net:2013:b";
  request.params.source_vlan      = 1780;
  request.params.dest_vlan        = 1781;
  request.params.bandwidth_mbps   = 100;
  return request;
}

v1::Envelope Confirm(const std::string& correlation_id, OperationKind kind, const std::string& provider_id = "prov-1") {
  v1::Envelope envelope;
  envelope.mutable_header()->set_correlation_id(correlation_id);
  envelope.mutable_confirm()->set_operation(nsi::codec::ToProto(kind));
  envelope.mutable_confirm()->set_connection_id(provider_id);
  return envelope;
}

v1::Envelope Fault(const std::string& correlation_id, OperationKind kind, const std::string& text,
                   const std::string& provider_id = "prov-1") {
  v1::Envelope envelope;
  envelope.mutable_header()->set_correlation_id(correlation_id);
  envelope.mutable_fault()->set_operation(nsi::codec::ToProto(kind));
  envelope.mutable_fault()->set_connection_id(provider_id);
  envelope.mutable_fault()->set_error_id("00500");
  envelope.mutable_fault()->set_text(text);
  return envelope;
}

bool HasAnomaly(ProtocolEngine& engine, const std::string& connection_id, AnomalyKind kind) {
  for (const auto& a : engine.ListAnomalies(connection_id)) {
    if (a.kind == kind) return true;
  }
  return false;
}

// Reserve, confirm, commit, confirm: a committed reservation with provider id prov-1.
std::string CommittedConnection(Harness& h) {
  auto reserve = h.engine->Reserve(MakeReserve());
  assert(h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve)).status == InboundStatus::kApplied);
  auto commit = h.engine->ReserveCommit(reserve.connection_id);
  assert(h.engine->OnProviderMessage(Confirm(commit.correlation_id, OperationKind::kReserveCommit)).status == InboundStatus::kApplied);
  return reserve.connection_id;
}

void TestFullLifecycle() {
  Harness h;

  auto reserve = h.engine->Reserve(MakeReserve());
  assert(reserve.states.reservation == ReservationState::kChecking);
  assert(!reserve.correlation_id.empty());

  const auto request = h.LastRequest();
  assert(request.header().correlation_id() == reserve.correlation_id);
  assert(request.request().operation() == v1::OPERATION_RESERVE);
  assert(request.request().criteria().source_stp() == "urn:ogf:network:example.net:2013:a?vlan=1780");

  const auto id = reserve.connection_id;
  auto       r  = h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve, "prov-42"));
  assert(r.status == InboundStatus::kApplied);
  assert(r.connection_id == id);

  auto c = h.engine->GetConnection(id);
  assert(c.states.reservation == ReservationState::kHeld);
  assert(!c.states.committed);
  assert(c.provider_connection_id == "prov-42");

  auto commit = h.engine->ReserveCommit(id);
  assert(h.LastRequest().request().connection_id() == "prov-42");
  h.engine->OnProviderMessage(Confirm(commit.correlation_id, OperationKind::kReserveCommit, "prov-42"));
  assert(h.engine->GetConnection(id).states.IsCommittedHeld());

  auto provision = h.engine->Provision(id);
  auto confirm   = Confirm(provision.correlation_id, OperationKind::kProvision, "prov-42");
  confirm.mutable_confirm()->mutable_data_plane()->set_active(true);
  h.engine->OnProviderMessage(confirm);
  c = h.engine->GetConnection(id);
  assert(c.states.provision == ProvisionState::kProvisioned);
  assert(c.states.data_plane == DataPlaneState::kUp);

  auto release = h.engine->Release(id);
  assert(release.states.provision == ProvisionState::kReleasing);
  h.engine->OnProviderMessage(Confirm(release.correlation_id, OperationKind::kRelease, "prov-42"));
  assert(h.engine->GetConnection(id).states.provision == ProvisionState::kReleased);

  auto terminate = h.engine->Terminate(id);
  assert(terminate.states.lifecycle == LifecycleState::kTerminating);
  h.engine->OnProviderMessage(Confirm(terminate.correlation_id, OperationKind::kTerminate, "prov-42"));

  c = h.engine->GetConnection(id);
  assert(c.states.lifecycle == LifecycleState::kTerminated);
  assert(c.states.data_plane == DataPlaneState::kDown);
  assert(c.IsArchived());
  assert(h.engine->PendingOperations(id).empty());
  assert(h.engine->ListConnections(false).empty());
  assert(h.engine->ListConnections(true).size() == 1);
  assert(h.Emitted() == 5);

  bool threw = false;
  try {
    h.engine->Query(id);
  } catch (const nsi::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestReserveFaultFailsReservation() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());

  auto r = h.engine->OnProviderMessage(Fault(reserve.correlation_id, OperationKind::kReserve, "no capacity"));
  assert(r.status == InboundStatus::kApplied);

  auto c = h.engine->GetConnection(reserve.connection_id);
  assert(c.states.reservation == ReservationState::kFailed);
  assert(c.states.lifecycle == LifecycleState::kCreated);

  const auto anomalies = h.engine->ListAnomalies(reserve.connection_id);
  assert(anomalies.size() == 1);
  assert(anomalies[0].kind == AnomalyKind::kFaultReceived);
  assert(anomalies[0].detail == "00500: no capacity");
  assert(anomalies[0].correlation_id == reserve.correlation_id);
}

void TestFatalFaultPolicy() {
  nsi::fsm::FaultPolicy policy;
  policy.fatal_operations.insert(OperationKind::kReserveCommit);
  Harness h({}, policy);

  auto reserve = h.engine->Reserve(MakeReserve());
  h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve));
  auto commit = h.engine->ReserveCommit(reserve.connection_id);
  h.engine->OnProviderMessage(Fault(commit.correlation_id, OperationKind::kReserveCommit, "commit failed"));

  auto c = h.engine->GetConnection(reserve.connection_id);
  assert(c.states.reservation == ReservationState::kFailed);
  assert(c.states.lifecycle == LifecycleState::kFailed);

  // Terminate still works from Failed.
  auto terminate = h.engine->Terminate(reserve.connection_id);
  assert(terminate.states.lifecycle == LifecycleState::kTerminating);
}

void TestDuplicateConfirmIsDiscarded() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());
  auto    confirm = Confirm(reserve.correlation_id, OperationKind::kReserve);

  assert(h.engine->OnProviderMessage(confirm).status == InboundStatus::kApplied);
  const auto version = h.engine->GetConnection(reserve.connection_id).version;

  auto again = h.engine->OnProviderMessage(confirm);
  assert(again.status == InboundStatus::kDiscarded);
  assert(again.connection_id == reserve.connection_id);
  assert(h.engine->GetConnection(reserve.connection_id).version == version);
  assert(HasAnomaly(*h.engine, reserve.connection_id, AnomalyKind::kAlreadyResolved));
}

void TestUnknownCorrelationIsDiscarded() {
  Harness h;

  auto r = h.engine->OnProviderMessage(Confirm("urn:uuid:nobody-asked", OperationKind::kReserve, "prov-x"));
  assert(r.status == InboundStatus::kDiscarded);
  assert(r.connection_id.empty());

  const auto anomalies = h.engine->ListAnomalies();
  assert(anomalies.size() == 1);
  assert(anomalies[0].kind == AnomalyKind::kUnknownCorrelation);
  assert(anomalies[0].connection_id.empty());
}

void TestMalformedPayloadIsRejected() {
  Harness h;
  bool    threw = false;
  try {
    h.engine->OnProviderPayload(std::string("\xff\xff\xff", 3));
  } catch (const nsi::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPayloadPathAppliesConfirm() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());

  const auto bytes = nsi::codec::MessageCodec::Serialize(Confirm(reserve.correlation_id, OperationKind::kReserve));
  assert(h.engine->OnProviderPayload(bytes).status == InboundStatus::kApplied);
}

void TestIllegalIntentIsRejectedWithoutSending() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());
  h.engine->OnProviderMessage(Fault(reserve.correlation_id, OperationKind::kReserve, "no"));
  const auto emitted = h.Emitted();

  bool threw = false;
  try {
    h.engine->Provision(reserve.connection_id);
  } catch (const nsi::util::InvalidTransition& e) {
    threw = true;
    assert(std::string(e.what()).find("reservation is ReserveFailed") != std::string::npos);
  }
  assert(threw);
  assert(h.Emitted() == emitted);
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kFailed);
  assert(HasAnomaly(*h.engine, reserve.connection_id, AnomalyKind::kInvalidTransition));
}

void TestConflictingQueryIsRejected() {
  Harness h;
  auto    id = CommittedConnection(h);

  h.engine->Query(id);
  bool threw = false;
  try {
    h.engine->Query(id);
  } catch (const nsi::util::ConflictingOperation&) {
    threw = true;
  }
  assert(threw);
  assert(h.engine->PendingOperations(id).size() == 1);
  assert(HasAnomaly(*h.engine, id, AnomalyKind::kConflictingOperation));
}

void TestReserveTimeoutThenLateConfirm() {
  nsi::core::EngineOptions options;
  options.default_timeout = 30s;
  Harness h(options);

  auto reserve = h.engine->Reserve(MakeReserve());
  h.Advance(29s);
  h.Tick();
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kChecking);

  h.Advance(1s);
  h.Tick();
  auto c = h.engine->GetConnection(reserve.connection_id);
  assert(c.states.reservation == ReservationState::kTimeout);
  assert(h.engine->PendingOperations(reserve.connection_id).empty());
  assert(HasAnomaly(*h.engine, reserve.connection_id, AnomalyKind::kOperationTimeout));

  auto late = h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve));
  assert(late.status == InboundStatus::kDiscarded);
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kTimeout);
}

void TestProvisionTimeoutStallsThenRetry() {
  Harness h;
  auto    id = CommittedConnection(h);

  h.engine->Provision(id);
  h.Advance(31s);
  h.Tick();

  auto c = h.engine->GetConnection(id);
  assert(c.states.provision == ProvisionState::kProvisioning);
  assert(c.stalled_operation == OperationKind::kProvision);

  auto retry = h.engine->Provision(id);
  assert(!retry.correlation_id.empty());
  assert(h.engine->GetConnection(id).stalled_operation == OperationKind::kUnspecified);
}

void TestQueryRetriesThenReportsStaleStatus() {
  nsi::core::EngineOptions options;
  options.timeouts[OperationKind::kQuery] = 5s;
  options.query_retry.max_attempts        = 3;
  options.query_retry.initial_backoff     = 1s;
  options.query_retry.multiplier          = 2.0;
  Harness h(options);

  auto id     = CommittedConnection(h);
  auto before = h.engine->GetConnection(id).states;
  auto start  = h.Emitted();

  h.engine->Query(id);
  assert(h.Emitted() == start + 1);

  h.Advance(5s); // deadline, retry in 1s
  h.Tick();
  assert(h.Emitted() == start + 1);
  h.Advance(1s);
  h.Tick();
  assert(h.Emitted() == start + 2);
  assert(h.engine->PendingOperations(id).size() == 1);
  assert(h.engine->PendingOperations(id)[0].attempt == 1);

  h.Advance(5s); // deadline, retry in 2s
  h.Tick();
  h.Advance(2s);
  h.Tick();
  assert(h.Emitted() == start + 3);

  h.Advance(5s); // third attempt exhausted
  h.Tick();
  assert(h.Emitted() == start + 3);
  assert(h.engine->PendingOperations(id).empty());
  assert(h.engine->GetConnection(id).states == before);
  assert(HasAnomaly(*h.engine, id, AnomalyKind::kStaleStatus));
}

void TestNotifications() {
  Harness h;
  auto    id = CommittedConnection(h);

  v1::Envelope dps;
  dps.mutable_notification()->set_connection_id("prov-1");
  dps.mutable_notification()->mutable_data_plane_state_change()->mutable_status()->set_active(true);
  auto r = h.engine->OnProviderMessage(dps);
  assert(r.status == InboundStatus::kApplied);
  assert(r.connection_id == id);
  assert(h.engine->GetConnection(id).states.data_plane == DataPlaneState::kUp);

  v1::Envelope error;
  error.mutable_notification()->set_connection_id("prov-1");
  error.mutable_notification()->mutable_error_event()->set_text("forced end");
  h.engine->OnProviderMessage(error);
  assert(h.engine->GetConnection(id).states.lifecycle == LifecycleState::kFailed);
  assert(HasAnomaly(*h.engine, id, AnomalyKind::kErrorEvent));

  v1::Envelope stranger;
  stranger.mutable_notification()->set_connection_id("prov-unknown");
  stranger.mutable_notification()->mutable_passed_end_time();
  assert(h.engine->OnProviderMessage(stranger).status == InboundStatus::kDiscarded);
}

void TestReservationEndTimerPassesEndTime() {
  Harness h;
  auto    request    = MakeReserve();
  request.params.end_time = nsi::util::FromUnixMillis(kStartMs + 60'000);

  auto reserve = h.engine->Reserve(request);
  h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve));
  auto commit = h.engine->ReserveCommit(reserve.connection_id);
  h.engine->OnProviderMessage(Confirm(commit.correlation_id, OperationKind::kReserveCommit));

  h.Advance(59s);
  h.Tick();
  assert(h.engine->GetConnection(reserve.connection_id).states.lifecycle == LifecycleState::kCreated);

  h.Advance(1s);
  h.Tick();
  assert(h.engine->GetConnection(reserve.connection_id).states.lifecycle == LifecycleState::kPassedEndTime);
}

void TestAutoCommitAndProvision() {
  nsi::core::EngineOptions options;
  options.auto_commit    = true;
  options.auto_provision = true;
  Harness h(options);

  auto reserve = h.engine->Reserve(MakeReserve());
  h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve));

  auto c = h.engine->GetConnection(reserve.connection_id);
  assert(c.states.reservation == ReservationState::kCommitting);
  const auto commit = h.LastRequest();
  assert(commit.request().operation() == v1::OPERATION_RESERVE_COMMIT);

  h.engine->OnProviderMessage(Confirm(commit.header().correlation_id(), OperationKind::kReserveCommit));
  c = h.engine->GetConnection(reserve.connection_id);
  assert(c.states.IsCommittedHeld());
  assert(c.states.provision == ProvisionState::kProvisioning);
  assert(h.LastRequest().request().operation() == v1::OPERATION_PROVISION);
}

void TestEmitFailureLeavesStateUnchanged() {
  Harness h({}, {}, nullptr, std::make_shared<FailingSink>());

  bool threw = false;
  try {
    h.engine->Reserve(MakeReserve());
  } catch (const nsi::util::TransportError&) {
    threw = true;
  }
  assert(threw);

  const auto connections = h.engine->ListConnections();
  assert(connections.size() == 1);
  const auto& c = connections[0];
  assert(c.states.reservation == ReservationState::kStart);
  assert(h.engine->PendingOperations(c.connection_id).empty());
  assert(HasAnomaly(*h.engine, c.connection_id, AnomalyKind::kEmitFailed));
}

void TestTerminateCancelsOtherPendingOperations() {
  nsi::core::EngineOptions options;
  options.default_timeout                     = 30s;
  options.timeouts[OperationKind::kTerminate] = 120s;
  Harness h(options);
  auto    id = CommittedConnection(h);

  auto provision = h.engine->Provision(id);
  auto query     = h.engine->Query(id);
  assert(h.engine->PendingOperations(id).size() == 2);

  auto terminate = h.engine->Terminate(id);
  const auto pending = h.engine->PendingOperations(id);
  assert(pending.size() == 1);
  assert(pending[0].correlation_id == terminate.correlation_id);

  // The canceled provision and query deadlines pass without effect.
  const auto version = h.engine->GetConnection(id).version;
  h.Advance(31s);
  h.Tick();
  auto c = h.engine->GetConnection(id);
  assert(c.version == version);
  assert(c.states.provision == ProvisionState::kProvisioning);
  assert(c.stalled_operation == OperationKind::kUnspecified);
  assert(!HasAnomaly(*h.engine, id, AnomalyKind::kOperationTimeout));
  assert(!HasAnomaly(*h.engine, id, AnomalyKind::kStaleStatus));

  // Replies to the canceled operations no longer change anything.
  auto late = h.engine->OnProviderMessage(Confirm(provision.correlation_id, OperationKind::kProvision));
  assert(late.status == InboundStatus::kDiscarded);
  assert(h.engine->OnProviderMessage(Confirm(query.correlation_id, OperationKind::kQuery)).status == InboundStatus::kDiscarded);
  assert(h.engine->GetConnection(id).states.provision == ProvisionState::kProvisioning);

  // The terminate confirm forces Provisioning back to Released.
  assert(h.engine->OnProviderMessage(Confirm(terminate.correlation_id, OperationKind::kTerminate)).status == InboundStatus::kApplied);
  c = h.engine->GetConnection(id);
  assert(c.states.lifecycle == LifecycleState::kTerminated);
  assert(c.states.provision == ProvisionState::kReleased);
  assert(h.engine->PendingOperations(id).empty());
}

void TestDeadlineAfterConfirmHasNoEffect() {
  nsi::core::EngineOptions options;
  options.default_timeout = 30s;
  Harness h(options);

  auto reserve = h.engine->Reserve(MakeReserve());
  assert(h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve)).status == InboundStatus::kApplied);
  const auto confirmed = h.engine->GetConnection(reserve.connection_id);

  h.Advance(31s);
  h.Tick();

  const auto after = h.engine->GetConnection(reserve.connection_id);
  assert(after.states == confirmed.states);
  assert(after.version == confirmed.version);
  assert(after.states.reservation == ReservationState::kHeld);
  assert(!HasAnomaly(*h.engine, reserve.connection_id, AnomalyKind::kOperationTimeout));
}

void TestProvisionFaultLeavesReleased() {
  Harness h;
  auto    id = CommittedConnection(h);

  auto provision = h.engine->Provision(id);
  auto r         = h.engine->OnProviderMessage(Fault(provision.correlation_id, OperationKind::kProvision, "resource_unavailable"));
  assert(r.status == InboundStatus::kApplied);

  auto c = h.engine->GetConnection(id);
  assert(c.states.provision == ProvisionState::kReleased);
  assert(c.states.IsCommittedHeld());
  assert(c.states.lifecycle == LifecycleState::kCreated);
  assert(h.engine->PendingOperations(id).empty());

  bool found = false;
  for (const auto& a : h.engine->ListAnomalies(id)) {
    if (a.kind == AnomalyKind::kFaultReceived && a.operation == OperationKind::kProvision) {
      found = a.detail.find("resource_unavailable") != std::string::npos;
    }
  }
  assert(found);
}

void TestReserveFaultThenAbortAndTerminate() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());
  h.engine->OnProviderMessage(Fault(reserve.correlation_id, OperationKind::kReserve, "no capacity", "prov-9"));
  assert(h.engine->GetConnection(reserve.connection_id).provider_connection_id == "prov-9");

  auto abort = h.engine->ReserveAbort(reserve.connection_id);
  assert(abort.states.reservation == ReservationState::kAborting);
  assert(h.LastRequest().request().operation() == v1::OPERATION_RESERVE_ABORT);
  assert(h.LastRequest().request().connection_id() == "prov-9");
  h.engine->OnProviderMessage(Confirm(abort.correlation_id, OperationKind::kReserveAbort, "prov-9"));
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kStart);

  // A second faulted reservation is terminated directly.
  auto other = h.engine->Reserve(MakeReserve());
  h.engine->OnProviderMessage(Fault(other.correlation_id, OperationKind::kReserve, "no capacity", "prov-10"));
  auto terminate = h.engine->Terminate(other.connection_id);
  assert(terminate.states.lifecycle == LifecycleState::kTerminating);
  assert(h.LastRequest().request().connection_id() == "prov-10");
}

void TestReserveTimeoutThenTerminateUsesAcknowledgedId() {
  nsi::core::EngineOptions options;
  options.default_timeout = 30s;
  auto log                = std::make_shared<nsi::transport::LogSink>();
  Harness h(options, {}, nullptr, std::make_shared<AckingSink>(log, "prov-ack-7"));

  auto reserve = h.engine->Reserve(MakeReserve());
  assert(h.engine->GetConnection(reserve.connection_id).provider_connection_id == "prov-ack-7");

  h.Advance(31s);
  h.Tick();
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kTimeout);

  auto terminate = h.engine->Terminate(reserve.connection_id);
  assert(terminate.states.lifecycle == LifecycleState::kTerminating);
  const auto sent = log->Recent().back();
  assert(sent.request().operation() == v1::OPERATION_TERMINATE);
  assert(sent.request().connection_id() == "prov-ack-7");

  h.engine->OnProviderMessage(Confirm(terminate.correlation_id, OperationKind::kTerminate, "prov-ack-7"));
  assert(h.engine->GetConnection(reserve.connection_id).states.lifecycle == LifecycleState::kTerminated);
}

void TestAbortedReservationCanBeReservedAgain() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());
  const auto id   = reserve.connection_id;
  h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve));

  bool threw = false;
  try {
    h.engine->Rereserve(id);
  } catch (const nsi::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  auto commit = h.engine->ReserveCommit(id);
  h.engine->OnProviderMessage(Fault(commit.correlation_id, OperationKind::kReserveCommit, "commit refused"));
  auto abort = h.engine->ReserveAbort(id);
  h.engine->OnProviderMessage(Confirm(abort.correlation_id, OperationKind::kReserveAbort));
  assert(h.engine->GetConnection(id).states.reservation == ReservationState::kStart);

  auto again = h.engine->Rereserve(id);
  assert(again.connection_id == id);
  assert(again.states.reservation == ReservationState::kChecking);
  assert(h.engine->ListConnections().size() == 1);

  const auto request = h.LastRequest();
  assert(request.request().operation() == v1::OPERATION_RESERVE);
  assert(request.request().connection_id() == "prov-1");
  assert(request.request().criteria().dest_stp() == "urn:ogf:network:example.net:2013:b?vlan=1781");

  h.engine->OnProviderMessage(Confirm(again.correlation_id, OperationKind::kReserve));
  auto c = h.engine->GetConnection(id);
  assert(c.states.reservation == ReservationState::kHeld);
  assert(!c.states.committed);
}

void TestReplyForWrongOperationIsRejected() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());

  auto r = h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kProvision));
  assert(r.status == InboundStatus::kRejected);
  assert(h.engine->PendingOperations(reserve.connection_id).size() == 1);
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kChecking);
}

void TestForceTerminate() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());

  auto forced = h.engine->ForceTerminate(reserve.connection_id);
  assert(forced.correlation_id.empty());
  assert(forced.states.lifecycle == LifecycleState::kTerminated);
  assert(forced.states.reservation == ReservationState::kFailed);

  auto c = h.engine->GetConnection(reserve.connection_id);
  assert(c.IsArchived());
  assert(h.engine->PendingOperations(reserve.connection_id).empty());

  auto late = h.engine->OnProviderMessage(Confirm(reserve.correlation_id, OperationKind::kReserve));
  assert(late.status == InboundStatus::kDiscarded);

  bool threw = false;
  try {
    h.engine->ForceTerminate(reserve.connection_id);
  } catch (const nsi::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestRecoveryAfterRestart() {
  auto repository = std::make_shared<nsi::db::memory::MemoryRepository>();

  std::string checking;
  std::string provisioning;
  {
    Harness first({}, {}, repository);
    checking     = first.engine->Reserve(MakeReserve()).connection_id;
    provisioning = CommittedConnection(first);
    first.engine->Provision(provisioning);
  }

  Harness second({}, {}, repository);
  assert(second.engine->RecoverAfterRestart() == 2);

  assert(second.engine->GetConnection(checking).states.reservation == ReservationState::kTimeout);
  assert(HasAnomaly(*second.engine, checking, AnomalyKind::kLostPendingOperation));

  auto c = second.engine->GetConnection(provisioning);
  assert(c.states.provision == ProvisionState::kProvisioning);
  assert(c.stalled_operation == OperationKind::kProvision);

  // Nothing left to recover the second time around.
  assert(second.engine->RecoverAfterRestart() == 0);
}

void TestUnknownConnection() {
  Harness h;
  bool    threw = false;
  try {
    h.engine->ReserveCommit("no-such-connection");
  } catch (const nsi::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidReserveParameters() {
  Harness h;
  auto    request           = MakeReserve();
  request.params.source_vlan = 5000;

  bool threw = false;
  try {
    h.engine->Reserve(request);
  } catch (const nsi::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(h.engine->ListConnections().empty());
}

void TestConcurrentDuplicateConfirmsApplyOnce() {
  Harness h;
  auto    reserve = h.engine->Reserve(MakeReserve());
  auto    confirm = Confirm(reserve.correlation_id, OperationKind::kReserve);

  std::atomic<int>         applied{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (h.engine->OnProviderMessage(confirm).status == InboundStatus::kApplied) applied.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  assert(applied.load() == 1);
  assert(h.engine->GetConnection(reserve.connection_id).states.reservation == ReservationState::kHeld);
}

} // namespace

int main() {
  TestFullLifecycle();
  TestReserveFaultFailsReservation();
  TestFatalFaultPolicy();
  TestDuplicateConfirmIsDiscarded();
  TestUnknownCorrelationIsDiscarded();
  TestMalformedPayloadIsRejected();
  TestPayloadPathAppliesConfirm();
  TestIllegalIntentIsRejectedWithoutSending();
  TestConflictingQueryIsRejected();
  TestReserveTimeoutThenLateConfirm();
  TestProvisionTimeoutStallsThenRetry();
  TestQueryRetriesThenReportsStaleStatus();
  TestNotifications();
  TestReservationEndTimerPassesEndTime();
  TestAutoCommitAndProvision();
  TestEmitFailureLeavesStateUnchanged();
  TestTerminateCancelsOtherPendingOperations();
  TestDeadlineAfterConfirmHasNoEffect();
  TestProvisionFaultLeavesReleased();
  TestReserveFaultThenAbortAndTerminate();
  TestReserveTimeoutThenTerminateUsesAcknowledgedId();
  TestAbortedReservationCanBeReservedAgain();
  TestReplyForWrongOperationIsRejected();
  TestForceTerminate();
  TestRecoveryAfterRestart();
  TestUnknownConnection();
  TestInvalidReserveParameters();
  TestConcurrentDuplicateConfirmsApplyOnce();

  std::cout << "nsi_requester_unit_protocol_engine: pass\n";
  return 0;
}
