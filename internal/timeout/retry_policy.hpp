#pragma once

#include <chrono>
#include <cstdint>

namespace nsi::timeout {

/*
  Bounded exponential backoff for status refresh (query).
  State-changing operations never go through this.
*/
struct RetryPolicy {
  uint32_t                  max_attempts    = 3;
  std::chrono::milliseconds initial_backoff = std::chrono::seconds(1);
  std::chrono::milliseconds max_backoff     = std::chrono::seconds(30);
  double                    multiplier      = 2.0;

  // attempt is zero based: the first send is attempt 0.
  bool ShouldRetry(uint32_t attempt) const;

  std::chrono::milliseconds Backoff(uint32_t attempt) const;
};

} // namespace nsi::timeout
