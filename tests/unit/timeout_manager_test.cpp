#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/timeout/retry_policy.hpp"
#include "internal/timeout/timeout_manager.hpp"

namespace {

using namespace std::chrono_literals;
using nsi::timeout::RetryPolicy;
using nsi::timeout::TimeoutManager;
using nsi::timeout::TimerKind;

nsi::util::TimePoint T0() {
  return nsi::util::TimePoint{} + std::chrono::hours(1000);
}

void TestSweepReturnsExpiredInDeadlineOrder() {
  TimeoutManager timeouts;
  timeouts.Schedule("late", T0() + 30s, TimerKind::kOperationDeadline);
  timeouts.Schedule("early", T0() + 10s, TimerKind::kOperationDeadline);
  timeouts.Schedule("future", T0() + 90s, TimerKind::kOperationDeadline);

  assert(timeouts.NextDeadline() == T0() + 10s);
  assert(timeouts.Sweep(T0() + 5s).empty());

  auto expired = timeouts.Sweep(T0() + 30s);
  assert(expired.size() == 2);
  assert(expired[0].key == "early");
  assert(expired[1].key == "late");
  assert(expired[1].deadline == T0() + 30s);
  assert(timeouts.Size() == 1);

  // Expired timers are reported once.
  assert(timeouts.Sweep(T0() + 30s).empty());
}

void TestCancelPreventsExpiry() {
  TimeoutManager timeouts;
  timeouts.Schedule("corr-1", T0() + 1s, TimerKind::kOperationDeadline);

  assert(timeouts.Cancel("corr-1"));
  assert(!timeouts.Cancel("corr-1"));
  assert(timeouts.Sweep(T0() + 1h).empty());
  assert(!timeouts.NextDeadline());
}

void TestRescheduleReplacesDeadline() {
  TimeoutManager timeouts;
  timeouts.Schedule("corr-1", T0() + 1s, TimerKind::kOperationDeadline);
  timeouts.Schedule("corr-1", T0() + 60s, TimerKind::kOperationDeadline);

  assert(timeouts.Size() == 1);
  assert(timeouts.Sweep(T0() + 30s).empty());
  assert(timeouts.Sweep(T0() + 60s).size() == 1);
}

void TestKindsDoNotCollide() {
  TimeoutManager timeouts;
  timeouts.Schedule("conn-1", T0() + 1s, TimerKind::kReservationEnd);
  timeouts.Schedule("conn-1", T0() + 2s, TimerKind::kQueryRetry);

  assert(timeouts.Size() == 2);
  assert(!timeouts.Cancel("conn-1"));
  assert(timeouts.Cancel("conn-1", TimerKind::kQueryRetry));

  auto expired = timeouts.Sweep(T0() + 5s);
  assert(expired.size() == 1);
  assert(expired[0].kind == TimerKind::kReservationEnd);
}

void TestRetryPolicyBounds() {
  RetryPolicy policy;
  policy.max_attempts    = 3;
  policy.initial_backoff = 1s;
  policy.max_backoff     = 3s;
  policy.multiplier      = 2.0;

  assert(policy.ShouldRetry(0));
  assert(policy.ShouldRetry(1));
  assert(!policy.ShouldRetry(2));

  assert(policy.Backoff(0) == 1s);
  assert(policy.Backoff(1) == 2s);
  assert(policy.Backoff(2) == 3s);
  assert(policy.Backoff(10) == 3s);
}

void TestSingleAttemptNeverRetries() {
  RetryPolicy policy;
  policy.max_attempts = 1;
  assert(!policy.ShouldRetry(0));
}

} // namespace

int main() {
  TestSweepReturnsExpiredInDeadlineOrder();
  TestCancelPreventsExpiry();
  TestRescheduleReplacesDeadline();
  TestKindsDoNotCollide();
  TestRetryPolicyBounds();
  TestSingleAttemptNeverRetries();

  std::cout << "nsi_requester_unit_timeout_manager: pass\n";
  return 0;
}
