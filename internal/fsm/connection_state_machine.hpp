#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/anomaly.hpp"
#include "internal/model/connection.hpp"
#include "internal/model/connection_state.hpp"
#include "internal/model/operation.hpp"

namespace nsi::fsm {

// ---------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------

struct RequestAccepted {
  model::OperationKind kind = model::OperationKind::kUnspecified;
};

struct ConfirmReceived {
  model::OperationKind       kind = model::OperationKind::kUnspecified;
  std::optional<std::string> provider_connection_id;
  std::optional<bool>        data_plane_active;
};

struct FaultReceived {
  model::OperationKind       kind = model::OperationKind::kUnspecified;
  std::string                reason;
  std::optional<std::string> provider_connection_id;
};

struct TimeoutExpired {
  model::OperationKind kind = model::OperationKind::kUnspecified;
};

enum class NotificationType : std::uint8_t {
  kDataPlaneStateChange = 0,
  kErrorEvent           = 1,
  kPassedEndTime        = 2,
  kReserveTimeout       = 3,
};

struct NotificationReceived {
  NotificationType type              = NotificationType::kDataPlaneStateChange;
  bool             data_plane_active = false;
  std::string      text;
};

using Event = std::variant<RequestAccepted, ConfirmReceived, FaultReceived, TimeoutExpired, NotificationReceived>;

std::string Describe(const Event& event);

// ---------------------------------------------------------------------
// Result of Apply
// ---------------------------------------------------------------------

enum class SideEffect : std::uint8_t {
  kCancelPendingOperations = 0,
  kArchive                 = 1,
  kScheduleEndTime         = 2,
};

struct Transition {
  // false: no transition defined for (state, event); states are unchanged.
  bool applied = false;

  model::ConnectionStates    states;
  model::OperationKind       stalled_operation = model::OperationKind::kUnspecified;
  std::optional<std::string> provider_connection_id;

  std::vector<SideEffect> side_effects;

  std::optional<model::AnomalyKind> anomaly;
  std::string                       detail;

  bool Has(SideEffect effect) const;
};

/*
  Which provider faults are unrecoverable. A fatal fault moves a Created
  lifecycle to Failed in addition to the per-operation fault branch.
*/
struct FaultPolicy {
  std::set<model::OperationKind> fatal_operations;

  bool IsFatal(model::OperationKind kind) const {
    return fatal_operations.count(kind) > 0;
  }
};

/*
  Transition tables for the four orthogonal sub-state machines
  (reservation, provision, lifecycle, data plane).

  Apply is pure: it reads the connection and returns what the connection
  should become. Persisting the result and carrying out side effects is
  the caller's job.
*/
class ConnectionStateMachine {
 public:
  explicit ConnectionStateMachine(FaultPolicy policy = {});

  Transition Apply(const model::Connection& connection, const Event& event) const;

  // Operator cleanup: Terminated without a provider exchange.
  Transition ForceTerminate(const model::Connection& connection) const;

  const FaultPolicy& Policy() const {
    return policy_;
  }

 private:
  Transition OnRequest(const model::Connection& connection, const RequestAccepted& event) const;
  Transition OnConfirm(const model::Connection& connection, const ConfirmReceived& event) const;
  Transition OnFault(const model::Connection& connection, const FaultReceived& event) const;
  Transition OnTimeout(const model::Connection& connection, const TimeoutExpired& event) const;
  Transition OnNotification(const model::Connection& connection, const NotificationReceived& event) const;

  FaultPolicy policy_;
};

} // namespace nsi::fsm
