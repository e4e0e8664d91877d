#include "timeout_manager.hpp"

namespace nsi::timeout {

void TimeoutManager::Schedule(const std::string& key, util::TimePoint deadline, TimerKind kind) {
  std::lock_guard lock(mutex_);

  TimerId id{kind, key};
  if (auto existing = timers_.find(id); existing != timers_.end()) {
    by_deadline_.erase(existing->second);
    timers_.erase(existing);
  }

  auto position = by_deadline_.emplace(deadline, id);
  timers_.emplace(std::move(id), position);
}

bool TimeoutManager::Cancel(const std::string& key, TimerKind kind) {
  std::lock_guard lock(mutex_);

  auto it = timers_.find(TimerId{kind, key});
  if (it == timers_.end()) return false;

  by_deadline_.erase(it->second);
  timers_.erase(it);
  return true;
}

std::vector<ExpiredTimer> TimeoutManager::Sweep(util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::vector<ExpiredTimer> expired;
  auto                      it = by_deadline_.begin();
  while (it != by_deadline_.end() && it->first <= now) {
    expired.push_back(ExpiredTimer{it->second.second, it->second.first, it->first});
    timers_.erase(it->second);
    it = by_deadline_.erase(it);
  }
  return expired;
}

std::optional<util::TimePoint> TimeoutManager::NextDeadline() const {
  std::lock_guard lock(mutex_);

  if (by_deadline_.empty()) return std::nullopt;
  return by_deadline_.begin()->first;
}

std::size_t TimeoutManager::Size() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

std::string_view ToString(TimerKind kind) {
  switch (kind) {
    case TimerKind::kOperationDeadline:
      return "operation_deadline";
    case TimerKind::kReservationEnd:
      return "reservation_end";
    case TimerKind::kQueryRetry:
      return "query_retry";
  }
  return "unknown";
}

} // namespace nsi::timeout
