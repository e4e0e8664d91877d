#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/connection_state.hpp"
#include "internal/model/operation.hpp"
#include "internal/util/time.hpp"

namespace nsi::model {

/*
  Requested service: two service termination points, the VLAN on each,
  capacity and an optional schedule window.
*/
struct ServiceParameters {
  std::string source_stp;
  std::string dest_stp;
  uint32_t    source_vlan    = 0;
  uint32_t    dest_vlan      = 0;
  uint64_t    bandwidth_mbps = 0;

  std::optional<util::TimePoint> start_time;
  std::optional<util::TimePoint> end_time;
};

/*
  Authoritative connection record.

  IMPORTANT:
  - Only the protocol engine mutates it, and only under the connection lock.
  - version is bumped on every save.
  - archived_at is set once lifecycle reaches Terminated; archived records
    are kept, never deleted.
*/
struct Connection {
  std::string connection_id;
  std::string provider_connection_id;
  std::string global_reservation_id;
  std::string description;

  ServiceParameters params;
  ConnectionStates  states;

  // Operation whose deadline passed without a reply.
  OperationKind stalled_operation = OperationKind::kUnspecified;

  uint64_t version = 0;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> archived_at;

  bool IsArchived() const {
    return archived_at.has_value();
  }

  bool IsStalled(OperationKind kind) const {
    return stalled_operation == kind;
  }
};

// STP URN as sent on the wire: <stp>?vlan=<id>
std::string StpWithVlan(const std::string& stp, uint32_t vlan);

} // namespace nsi::model
