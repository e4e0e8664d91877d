#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace nsi::timeout {

enum class TimerKind : std::uint8_t {
  kOperationDeadline = 0, // key is a correlation id
  kReservationEnd    = 1, // key is a connection id
  kQueryRetry        = 2, // key is a connection id
};

struct ExpiredTimer {
  std::string     key;
  TimerKind       kind = TimerKind::kOperationDeadline;
  util::TimePoint deadline{};
};

/*
  Deadline table.

  One timer per (kind, key); scheduling an existing one replaces its
  deadline.
  The manager only reports expiry. Deciding what an expired timer means is
  the protocol engine's job.
*/
class TimeoutManager {
 public:
  void Schedule(const std::string& key, util::TimePoint deadline, TimerKind kind);

  bool Cancel(const std::string& key, TimerKind kind = TimerKind::kOperationDeadline);

  // Removes and returns every timer with deadline <= now, earliest first.
  std::vector<ExpiredTimer> Sweep(util::TimePoint now);

  std::optional<util::TimePoint> NextDeadline() const;

  std::size_t Size() const;

 private:
  using TimerId = std::pair<TimerKind, std::string>;
  using Index   = std::multimap<util::TimePoint, TimerId>;

  mutable std::mutex mutex_;

  Index                              by_deadline_;
  std::map<TimerId, Index::iterator> timers_;
};

std::string_view ToString(TimerKind kind);

} // namespace nsi::timeout
