#include "connection_state_machine.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/util/errors.hpp"

namespace nsi::fsm {

using model::AnomalyKind;
using model::Connection;
using model::DataPlaneState;
using model::LifecycleState;
using model::OperationKind;
using model::ProvisionState;
using model::ReservationState;

namespace {

std::string_view ToString(NotificationType type) {
  switch (type) {
    case NotificationType::kDataPlaneStateChange:
      return "dataPlaneStateChange";
    case NotificationType::kErrorEvent:
      return "errorEvent";
    case NotificationType::kPassedEndTime:
      return "passedEndTime";
    case NotificationType::kReserveTimeout:
      return "reserveTimeout";
  }
  return "unknownNotification";
}

void RequireKnown(OperationKind kind, std::string_view event) {
  if (!model::IsKnown(kind)) {
    throw util::ProtocolDefect(std::string(event) + ": operation kind " + std::to_string(static_cast<int>(kind)) +
                               " has no transition table");
  }
}

Transition Accept(const Connection& connection) {
  Transition t;
  t.applied           = true;
  t.states            = connection.states;
  t.stalled_operation = connection.stalled_operation;
  return t;
}

// The first provider id seen for a connection sticks.
void AdoptProviderId(const Connection& c, const std::optional<std::string>& provider_id, Transition& t) {
  if (provider_id && !provider_id->empty() && c.provider_connection_id.empty()) {
    t.provider_connection_id = provider_id;
  }
}

// No transition defined; the sub-state named here is the one that blocked it.
Transition Reject(const Connection& connection, const Event& event, std::string_view dimension, std::string_view state) {
  Transition t;
  t.applied           = false;
  t.states            = connection.states;
  t.stalled_operation = connection.stalled_operation;
  t.anomaly           = AnomalyKind::kInvalidTransition;

  std::ostringstream out;
  out << Describe(event) << " not allowed: " << dimension << " is " << state;
  t.detail = out.str();
  return t;
}

Transition RejectReservation(const Connection& c, const Event& e) {
  return Reject(c, e, "reservation", model::ToString(c.states.reservation));
}

Transition RejectProvision(const Connection& c, const Event& e) {
  return Reject(c, e, "provision", model::ToString(c.states.provision));
}

Transition RejectLifecycle(const Connection& c, const Event& e) {
  return Reject(c, e, "lifecycle", model::ToString(c.states.lifecycle));
}

bool ProvisionFamilyStalled(const Connection& c) {
  return c.IsStalled(OperationKind::kProvision) || c.IsStalled(OperationKind::kRelease);
}

// Terminated is absorbing: nothing may stay in flight or appear active.
void CleanupTerminated(model::ConnectionStates& states) {
  states.lifecycle  = LifecycleState::kTerminated;
  states.provision  = ProvisionState::kReleased;
  states.data_plane = DataPlaneState::kDown;
  if (model::IsTransient(states.reservation)) {
    states.reservation = ReservationState::kFailed;
  }
}

} // namespace

std::string Describe(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RequestAccepted>) {
          return "request(" + std::string(model::ToString(e.kind)) + ")";
        } else if constexpr (std::is_same_v<T, ConfirmReceived>) {
          return "confirm(" + std::string(model::ToString(e.kind)) + ")";
        } else if constexpr (std::is_same_v<T, FaultReceived>) {
          return "fault(" + std::string(model::ToString(e.kind)) + ")";
        } else if constexpr (std::is_same_v<T, TimeoutExpired>) {
          return "timeout(" + std::string(model::ToString(e.kind)) + ")";
        } else {
          return "notification(" + std::string(ToString(e.type)) + ")";
        }
      },
      event);
}

bool Transition::Has(SideEffect effect) const {
  return std::find(side_effects.begin(), side_effects.end(), effect) != side_effects.end();
}

ConnectionStateMachine::ConnectionStateMachine(FaultPolicy policy) : policy_(std::move(policy)) {
}

Transition ConnectionStateMachine::Apply(const Connection& connection, const Event& event) const {
  if (model::IsTerminal(connection.states.lifecycle)) {
    return RejectLifecycle(connection, event);
  }

  return std::visit(
      [&](const auto& e) -> Transition {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RequestAccepted>) {
          return OnRequest(connection, e);
        } else if constexpr (std::is_same_v<T, ConfirmReceived>) {
          return OnConfirm(connection, e);
        } else if constexpr (std::is_same_v<T, FaultReceived>) {
          return OnFault(connection, e);
        } else if constexpr (std::is_same_v<T, TimeoutExpired>) {
          return OnTimeout(connection, e);
        } else {
          return OnNotification(connection, e);
        }
      },
      event);
}

Transition ConnectionStateMachine::ForceTerminate(const Connection& connection) const {
  if (model::IsTerminal(connection.states.lifecycle)) {
    Transition t;
    t.states            = connection.states;
    t.stalled_operation = connection.stalled_operation;
    t.anomaly           = AnomalyKind::kInvalidTransition;
    t.detail            = "forced terminate not allowed: lifecycle is Terminated";
    return t;
  }

  auto t = Accept(connection);
  CleanupTerminated(t.states);
  t.stalled_operation = OperationKind::kUnspecified;
  t.side_effects.push_back(SideEffect::kCancelPendingOperations);
  t.side_effects.push_back(SideEffect::kArchive);
  return t;
}

// ------------------------------------------------------------------
// Operator intents
// ------------------------------------------------------------------

Transition ConnectionStateMachine::OnRequest(const Connection& c, const RequestAccepted& e) const {
  RequireKnown(e.kind, "request");

  const auto& s = c.states;
  auto        t = Accept(c);

  switch (e.kind) {
    case OperationKind::kReserve:
      if (s.lifecycle != LifecycleState::kCreated) return RejectLifecycle(c, e);
      if (s.reservation != ReservationState::kStart) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kChecking;
      break;

    case OperationKind::kReserveCommit:
      if (s.lifecycle != LifecycleState::kCreated) return RejectLifecycle(c, e);
      if (s.reservation != ReservationState::kHeld || s.committed) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kCommitting;
      break;

    case OperationKind::kReserveAbort:
      if (s.lifecycle != LifecycleState::kCreated && s.lifecycle != LifecycleState::kFailed) return RejectLifecycle(c, e);
      if (s.provision != ProvisionState::kReleased) return RejectProvision(c, e);
      if (s.reservation != ReservationState::kHeld && s.reservation != ReservationState::kFailed &&
          s.reservation != ReservationState::kTimeout) {
        return RejectReservation(c, e);
      }
      t.states.reservation = ReservationState::kAborting;
      break;

    case OperationKind::kProvision:
      if (s.lifecycle != LifecycleState::kCreated) return RejectLifecycle(c, e);
      if (s.provision == ProvisionState::kReleased) {
        if (!s.IsCommittedHeld()) return RejectReservation(c, e);
      } else if (!(model::IsTransient(s.provision) && ProvisionFamilyStalled(c))) {
        return RejectProvision(c, e);
      }
      t.states.provision = ProvisionState::kProvisioning;
      break;

    case OperationKind::kRelease:
      if (s.lifecycle == LifecycleState::kTerminating) return RejectLifecycle(c, e);
      if (s.provision != ProvisionState::kProvisioned && !(model::IsTransient(s.provision) && ProvisionFamilyStalled(c))) {
        return RejectProvision(c, e);
      }
      t.states.provision = ProvisionState::kReleasing;
      break;

    case OperationKind::kTerminate:
      if (s.lifecycle == LifecycleState::kTerminating && !c.IsStalled(OperationKind::kTerminate)) return RejectLifecycle(c, e);
      t.states.lifecycle = LifecycleState::kTerminating;
      t.side_effects.push_back(SideEffect::kCancelPendingOperations);
      break;

    case OperationKind::kQuery:
      return t;

    default:
      RequireKnown(OperationKind::kUnspecified, "request");
  }

  t.stalled_operation = OperationKind::kUnspecified;
  return t;
}

// ------------------------------------------------------------------
// Provider replies
// ------------------------------------------------------------------

Transition ConnectionStateMachine::OnConfirm(const Connection& c, const ConfirmReceived& e) const {
  RequireKnown(e.kind, "confirm");

  const auto& s = c.states;
  auto        t = Accept(c);

  switch (e.kind) {
    case OperationKind::kReserve:
      if (s.reservation != ReservationState::kChecking) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kHeld;
      AdoptProviderId(c, e.provider_connection_id, t);
      break;

    case OperationKind::kReserveCommit:
      if (s.reservation != ReservationState::kCommitting) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kHeld;
      t.states.committed   = true;
      if (c.params.end_time) {
        t.side_effects.push_back(SideEffect::kScheduleEndTime);
      }
      break;

    case OperationKind::kReserveAbort:
      if (s.reservation != ReservationState::kAborting) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kStart;
      t.states.committed   = false;
      break;

    case OperationKind::kProvision:
      if (s.provision != ProvisionState::kProvisioning) return RejectProvision(c, e);
      t.states.provision = ProvisionState::kProvisioned;
      break;

    case OperationKind::kRelease:
      if (s.provision != ProvisionState::kReleasing) return RejectProvision(c, e);
      t.states.provision = ProvisionState::kReleased;
      break;

    case OperationKind::kTerminate:
      if (s.lifecycle != LifecycleState::kTerminating) return RejectLifecycle(c, e);
      CleanupTerminated(t.states);
      t.stalled_operation = OperationKind::kUnspecified;
      t.side_effects.push_back(SideEffect::kCancelPendingOperations);
      t.side_effects.push_back(SideEffect::kArchive);
      return t;

    case OperationKind::kQuery:
      break;

    default:
      RequireKnown(OperationKind::kUnspecified, "confirm");
  }

  if (e.data_plane_active) {
    t.states.data_plane = *e.data_plane_active ? DataPlaneState::kUp : DataPlaneState::kDown;
  }
  return t;
}

Transition ConnectionStateMachine::OnFault(const Connection& c, const FaultReceived& e) const {
  RequireKnown(e.kind, "fault");

  const auto& s = c.states;
  auto        t = Accept(c);

  switch (e.kind) {
    case OperationKind::kReserve:
      if (s.reservation != ReservationState::kChecking) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kFailed;
      AdoptProviderId(c, e.provider_connection_id, t);
      break;

    case OperationKind::kReserveCommit:
      if (s.reservation != ReservationState::kCommitting) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kFailed;
      break;

    case OperationKind::kReserveAbort:
      if (s.reservation != ReservationState::kAborting) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kFailed;
      break;

    case OperationKind::kProvision:
      if (s.provision != ProvisionState::kProvisioning) return RejectProvision(c, e);
      t.states.provision = ProvisionState::kReleased;
      break;

    case OperationKind::kRelease:
      if (s.provision != ProvisionState::kReleasing) return RejectProvision(c, e);
      t.states.provision = ProvisionState::kProvisioned;
      break;

    case OperationKind::kTerminate:
      if (s.lifecycle != LifecycleState::kTerminating) return RejectLifecycle(c, e);
      t.stalled_operation = OperationKind::kTerminate;
      break;

    case OperationKind::kQuery:
      break;

    default:
      RequireKnown(OperationKind::kUnspecified, "fault");
  }

  if (policy_.IsFatal(e.kind) && t.states.lifecycle == LifecycleState::kCreated) {
    t.states.lifecycle = LifecycleState::kFailed;
  }

  t.anomaly = AnomalyKind::kFaultReceived;
  t.detail  = e.reason;
  return t;
}

Transition ConnectionStateMachine::OnTimeout(const Connection& c, const TimeoutExpired& e) const {
  RequireKnown(e.kind, "timeout");

  const auto& s = c.states;
  auto        t = Accept(c);

  switch (e.kind) {
    case OperationKind::kReserve:
      if (s.reservation != ReservationState::kChecking) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kTimeout;
      break;

    case OperationKind::kReserveCommit:
      if (s.reservation != ReservationState::kCommitting) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kTimeout;
      break;

    case OperationKind::kReserveAbort:
      if (s.reservation != ReservationState::kAborting) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kTimeout;
      break;

    case OperationKind::kProvision:
      if (s.provision != ProvisionState::kProvisioning) return RejectProvision(c, e);
      t.stalled_operation = OperationKind::kProvision;
      break;

    case OperationKind::kRelease:
      if (s.provision != ProvisionState::kReleasing) return RejectProvision(c, e);
      t.stalled_operation = OperationKind::kRelease;
      break;

    case OperationKind::kTerminate:
      if (s.lifecycle != LifecycleState::kTerminating) return RejectLifecycle(c, e);
      t.stalled_operation = OperationKind::kTerminate;
      break;

    case OperationKind::kQuery:
      t.anomaly = AnomalyKind::kStaleStatus;
      t.detail  = "status refresh exhausted its retries";
      return t;

    default:
      RequireKnown(OperationKind::kUnspecified, "timeout");
  }

  t.anomaly = AnomalyKind::kOperationTimeout;
  t.detail  = std::string(model::ToString(e.kind)) + " got no reply before its deadline";
  return t;
}

// ------------------------------------------------------------------
// Unsolicited provider events
// ------------------------------------------------------------------

Transition ConnectionStateMachine::OnNotification(const Connection& c, const NotificationReceived& e) const {
  const auto& s = c.states;
  auto        t = Accept(c);

  switch (e.type) {
    case NotificationType::kDataPlaneStateChange:
      t.states.data_plane = e.data_plane_active ? DataPlaneState::kUp : DataPlaneState::kDown;
      return t;

    case NotificationType::kErrorEvent:
      if (s.lifecycle == LifecycleState::kCreated) {
        t.states.lifecycle = LifecycleState::kFailed;
      }
      t.anomaly = AnomalyKind::kErrorEvent;
      t.detail  = e.text;
      return t;

    case NotificationType::kPassedEndTime:
      if (!model::CanAdvance(s.lifecycle, LifecycleState::kPassedEndTime)) return RejectLifecycle(c, e);
      t.states.lifecycle = LifecycleState::kPassedEndTime;
      return t;

    case NotificationType::kReserveTimeout:
      if (s.reservation != ReservationState::kHeld || s.committed) return RejectReservation(c, e);
      t.states.reservation = ReservationState::kTimeout;
      return t;
  }

  throw util::ProtocolDefect("notification: type " + std::to_string(static_cast<int>(e.type)) + " has no transition table");
}

} // namespace nsi::fsm
