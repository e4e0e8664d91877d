#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/connection_state.hpp"
#include "internal/model/operation.hpp"
#include "internal/util/time.hpp"

namespace nsi::model {

enum class AnomalyKind : std::uint8_t {
  kInvalidTransition    = 0,
  kConflictingOperation = 1,
  kUnknownCorrelation   = 2,
  kAlreadyResolved      = 3,
  kOperationTimeout     = 4,
  kFaultReceived        = 5,
  kStaleStatus          = 6,
  kErrorEvent           = 7,
  kLostPendingOperation = 8,
  kEmitFailed           = 9,
};

std::string_view ToString(AnomalyKind kind);

/*
  Append-only record of something an operator should see: a rejected
  intent, an unmatched reply, a fault or a timeout. Never mutates state.
*/
struct Anomaly {
  std::string   connection_id;  // empty when the message matched nothing
  AnomalyKind   kind      = AnomalyKind::kInvalidTransition;
  OperationKind operation = OperationKind::kUnspecified;
  std::string   correlation_id;

  ConnectionStates states;
  std::string      detail;

  util::TimePoint recorded_at{};
};

} // namespace nsi::model
