#pragma once

#include <cstdint>
#include <string_view>

namespace nsi::model {

enum class ReservationState : std::uint8_t {
  kStart      = 0,
  kChecking   = 1,
  kHeld       = 2,
  kFailed     = 3,
  kAborting   = 4,
  kCommitting = 5,
  kTimeout    = 6,
};

enum class ProvisionState : std::uint8_t {
  kReleased     = 0,
  kProvisioning = 1,
  kProvisioned  = 2,
  kReleasing    = 3,
};

// Declaration order is the only direction lifecycle may move in.
enum class LifecycleState : std::uint8_t {
  kCreated       = 0,
  kFailed        = 1,
  kPassedEndTime = 2,
  kTerminating   = 3,
  kTerminated    = 4,
};

enum class DataPlaneState : std::uint8_t {
  kDown = 0,
  kUp   = 1,
};

constexpr bool IsTransient(ReservationState state) {
  return state == ReservationState::kChecking || state == ReservationState::kCommitting || state == ReservationState::kAborting;
}

constexpr bool IsTransient(ProvisionState state) {
  return state == ProvisionState::kProvisioning || state == ProvisionState::kReleasing;
}

constexpr bool IsTerminal(LifecycleState state) {
  return state == LifecycleState::kTerminated;
}

constexpr bool CanAdvance(LifecycleState from, LifecycleState to) {
  if (IsTerminal(from)) {
    return false;
  }
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

std::string_view ToString(ReservationState state);
std::string_view ToString(ProvisionState state);
std::string_view ToString(LifecycleState state);
std::string_view ToString(DataPlaneState state);

/*
  The tuple that makes up a connection's overall status.

  committed distinguishes a Held reservation that went through
  reserveCommit from one that is only tentatively held.
*/
struct ConnectionStates {
  ReservationState reservation = ReservationState::kStart;
  ProvisionState   provision   = ProvisionState::kReleased;
  LifecycleState   lifecycle   = LifecycleState::kCreated;
  DataPlaneState   data_plane  = DataPlaneState::kDown;
  bool             committed   = false;

  bool IsCommittedHeld() const {
    return reservation == ReservationState::kHeld && committed;
  }

  bool operator==(const ConnectionStates&) const = default;
};

} // namespace nsi::model
