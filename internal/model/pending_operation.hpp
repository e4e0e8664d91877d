#pragma once

#include <cstdint>
#include <string>

#include "internal/model/operation.hpp"
#include "internal/util/time.hpp"

namespace nsi::model {

/*
  One request in flight, waiting for the provider's confirm or fault.
*/
struct PendingOperation {
  std::string   correlation_id;
  std::string   connection_id;
  OperationKind kind = OperationKind::kUnspecified;

  util::TimePoint issued_at{};
  util::TimePoint deadline{};

  // Retry counter; only idempotent operations ever go past 0.
  uint32_t attempt = 0;
};

} // namespace nsi::model
