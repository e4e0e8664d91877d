#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace nsi::timeout {

bool RetryPolicy::ShouldRetry(uint32_t attempt) const {
  return attempt + 1 < max_attempts;
}

std::chrono::milliseconds RetryPolicy::Backoff(uint32_t attempt) const {
  const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(std::max(multiplier, 1.0), attempt);
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

} // namespace nsi::timeout
