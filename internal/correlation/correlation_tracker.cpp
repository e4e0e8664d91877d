#include "correlation_tracker.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace nsi::correlation {

CorrelationTracker::CorrelationTracker(std::size_t tombstone_capacity) : tombstone_capacity_(tombstone_capacity) {
}

model::PendingOperation CorrelationTracker::Register(const std::string& connection_id, model::OperationKind kind,
                                                     util::TimePoint issued_at, util::TimePoint deadline, uint32_t attempt) {
  if (!model::IsKnown(kind)) {
    throw util::ProtocolDefect("register: unknown operation kind " + std::to_string(static_cast<int>(kind)));
  }

  std::lock_guard lock(mutex_);

  const auto family = model::FamilyOf(kind);
  auto       range  = by_connection_.equal_range(connection_id);
  for (auto it = range.first; it != range.second; ++it) {
    auto existing = pending_.find(it->second);
    if (existing != pending_.end() && model::FamilyOf(existing->second.kind) == family) {
      throw util::ConflictingOperation("connection " + connection_id + " already has " +
                                       std::string(model::ToString(existing->second.kind)) + " pending as " +
                                       existing->second.correlation_id);
    }
  }

  model::PendingOperation op;
  op.correlation_id = util::ToUrn(util::GenerateUUID());
  op.connection_id  = connection_id;
  op.kind           = kind;
  op.issued_at      = issued_at;
  op.deadline       = deadline;
  op.attempt        = attempt;

  pending_.emplace(op.correlation_id, op);
  by_connection_.emplace(connection_id, op.correlation_id);
  return op;
}

std::optional<model::PendingOperation> CorrelationTracker::Lookup(const std::string& correlation_id) const {
  std::lock_guard lock(mutex_);

  auto it = pending_.find(correlation_id);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

ResolveOutcome CorrelationTracker::Resolve(const std::string& correlation_id) {
  std::lock_guard lock(mutex_);

  ResolveOutcome outcome;
  auto           it = pending_.find(correlation_id);
  if (it == pending_.end()) {
    outcome.status =
        tombstones_.count(correlation_id) ? ResolveStatus::kAlreadyResolved : ResolveStatus::kUnknownCorrelation;
    return outcome;
  }

  outcome.status    = ResolveStatus::kResolved;
  outcome.operation = it->second;
  EraseLocked(it);
  return outcome;
}

bool CorrelationTracker::Cancel(const std::string& correlation_id) {
  std::lock_guard lock(mutex_);

  auto it = pending_.find(correlation_id);
  if (it == pending_.end()) return false;

  EraseLocked(it);
  return true;
}

std::vector<std::string> CorrelationTracker::CancelAll(const std::string& connection_id, const std::string& keep) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> canceled;
  auto                     range = by_connection_.equal_range(connection_id);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second != keep) canceled.push_back(it->second);
  }

  for (const auto& id : canceled) {
    auto it = pending_.find(id);
    if (it != pending_.end()) EraseLocked(it);
  }
  return canceled;
}

std::vector<model::PendingOperation> CorrelationTracker::PendingFor(const std::string& connection_id) const {
  std::lock_guard lock(mutex_);

  std::vector<model::PendingOperation> out;
  auto                                 range = by_connection_.equal_range(connection_id);
  for (auto it = range.first; it != range.second; ++it) {
    auto op = pending_.find(it->second);
    if (op != pending_.end()) out.push_back(op->second);
  }
  return out;
}

std::size_t CorrelationTracker::Size() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void CorrelationTracker::EraseLocked(std::unordered_map<std::string, model::PendingOperation>::iterator it) {
  const auto correlation_id = it->first;

  auto range = by_connection_.equal_range(it->second.connection_id);
  for (auto i = range.first; i != range.second; ++i) {
    if (i->second == correlation_id) {
      by_connection_.erase(i);
      break;
    }
  }

  pending_.erase(it);
  BuryLocked(correlation_id);
}

void CorrelationTracker::BuryLocked(const std::string& correlation_id) {
  if (tombstone_capacity_ == 0) return;

  if (tombstone_order_.size() >= tombstone_capacity_) {
    tombstones_.erase(tombstone_order_.front());
    tombstone_order_.pop_front();
  }

  tombstone_order_.push_back(correlation_id);
  tombstones_.insert(correlation_id);
}

std::string_view ToString(ResolveStatus status) {
  switch (status) {
    case ResolveStatus::kResolved:
      return "resolved";
    case ResolveStatus::kAlreadyResolved:
      return "already_resolved";
    case ResolveStatus::kUnknownCorrelation:
      return "unknown_correlation";
  }
  return "unknown";
}

} // namespace nsi::correlation
