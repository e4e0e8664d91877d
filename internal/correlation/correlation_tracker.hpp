#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/operation.hpp"
#include "internal/model/pending_operation.hpp"
#include "internal/util/time.hpp"

namespace nsi::correlation {

enum class ResolveStatus : std::uint8_t {
  kResolved           = 0,
  kAlreadyResolved    = 1,
  kUnknownCorrelation = 2,
};

struct ResolveOutcome {
  ResolveStatus                          status = ResolveStatus::kUnknownCorrelation;
  std::optional<model::PendingOperation> operation;
};

/*
  Pending request table keyed by correlation id.

  IMPORTANT:
  - At most one entry per (connection, operation family).
  - An entry leaves the table exactly once, through Resolve or Cancel.
  - Ids that left the table are remembered in a bounded ring so a late
    duplicate reply can be told apart from a reply nobody asked for.
*/
class CorrelationTracker {
 public:
  static constexpr std::size_t kDefaultTombstoneCapacity = 4096;

  explicit CorrelationTracker(std::size_t tombstone_capacity = kDefaultTombstoneCapacity);

  model::PendingOperation Register(const std::string& connection_id, model::OperationKind kind, util::TimePoint issued_at,
                                   util::TimePoint deadline, uint32_t attempt = 0);

  std::optional<model::PendingOperation> Lookup(const std::string& correlation_id) const;

  ResolveOutcome Resolve(const std::string& correlation_id);

  bool Cancel(const std::string& correlation_id);

  // Cancels every pending operation of the connection except `keep`;
  // returns the canceled correlation ids.
  std::vector<std::string> CancelAll(const std::string& connection_id, const std::string& keep = {});

  std::vector<model::PendingOperation> PendingFor(const std::string& connection_id) const;

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;

  std::unordered_map<std::string, model::PendingOperation> pending_;
  std::unordered_multimap<std::string, std::string>        by_connection_;

  std::size_t                     tombstone_capacity_;
  std::deque<std::string>         tombstone_order_;
  std::unordered_set<std::string> tombstones_;

  // Caller holds mutex_.
  void EraseLocked(std::unordered_map<std::string, model::PendingOperation>::iterator it);
  void BuryLocked(const std::string& correlation_id);
};

std::string_view ToString(ResolveStatus status);

} // namespace nsi::correlation
