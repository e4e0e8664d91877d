#include "internal/model/anomaly.hpp"
#include "internal/model/connection.hpp"
#include "internal/model/connection_state.hpp"
#include "internal/model/operation.hpp"

namespace nsi::model {

std::string_view ToString(ReservationState state) {
  switch (state) {
    case ReservationState::kStart:
      return "ReserveStart";
    case ReservationState::kChecking:
      return "ReserveChecking";
    case ReservationState::kHeld:
      return "ReserveHeld";
    case ReservationState::kFailed:
      return "ReserveFailed";
    case ReservationState::kAborting:
      return "ReserveAborting";
    case ReservationState::kCommitting:
      return "ReserveCommitting";
    case ReservationState::kTimeout:
      return "ReserveTimeout";
  }
  return "ReserveUnknown";
}

std::string_view ToString(ProvisionState state) {
  switch (state) {
    case ProvisionState::kReleased:
      return "Released";
    case ProvisionState::kProvisioning:
      return "Provisioning";
    case ProvisionState::kProvisioned:
      return "Provisioned";
    case ProvisionState::kReleasing:
      return "Releasing";
  }
  return "ProvisionUnknown";
}

std::string_view ToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kCreated:
      return "Created";
    case LifecycleState::kFailed:
      return "Failed";
    case LifecycleState::kPassedEndTime:
      return "PassedEndTime";
    case LifecycleState::kTerminating:
      return "Terminating";
    case LifecycleState::kTerminated:
      return "Terminated";
  }
  return "LifecycleUnknown";
}

std::string_view ToString(DataPlaneState state) {
  return state == DataPlaneState::kUp ? "Up" : "Down";
}

std::string_view ToString(OperationKind kind) {
  switch (kind) {
    case OperationKind::kReserve:
      return "reserve";
    case OperationKind::kReserveCommit:
      return "reserveCommit";
    case OperationKind::kReserveAbort:
      return "reserveAbort";
    case OperationKind::kProvision:
      return "provision";
    case OperationKind::kRelease:
      return "release";
    case OperationKind::kTerminate:
      return "terminate";
    case OperationKind::kQuery:
      return "query";
    case OperationKind::kUnspecified:
      break;
  }
  return "unspecified";
}

std::string_view ToString(OperationFamily family) {
  switch (family) {
    case OperationFamily::kReservation:
      return "reservation";
    case OperationFamily::kProvision:
      return "provision";
    case OperationFamily::kTerminate:
      return "terminate";
    case OperationFamily::kQuery:
      return "query";
    case OperationFamily::kNone:
      break;
  }
  return "none";
}

std::string_view ToString(AnomalyKind kind) {
  switch (kind) {
    case AnomalyKind::kInvalidTransition:
      return "InvalidTransition";
    case AnomalyKind::kConflictingOperation:
      return "ConflictingOperation";
    case AnomalyKind::kUnknownCorrelation:
      return "UnknownCorrelation";
    case AnomalyKind::kAlreadyResolved:
      return "AlreadyResolved";
    case AnomalyKind::kOperationTimeout:
      return "OperationTimeout";
    case AnomalyKind::kFaultReceived:
      return "FaultReceived";
    case AnomalyKind::kStaleStatus:
      return "StaleStatus";
    case AnomalyKind::kErrorEvent:
      return "ErrorEvent";
    case AnomalyKind::kLostPendingOperation:
      return "LostPendingOperation";
    case AnomalyKind::kEmitFailed:
      return "EmitFailed";
  }
  return "Unknown";
}

std::string StpWithVlan(const std::string& stp, uint32_t vlan) {
  if (vlan == 0) {
    return stp;
  }
  return stp + "?vlan=" + std::to_string(vlan);
}

} // namespace nsi::model
