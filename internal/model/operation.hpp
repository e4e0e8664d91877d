#pragma once

#include <cstdint>
#include <string_view>

namespace nsi::model {

enum class OperationKind : std::uint8_t {
  kUnspecified   = 0,
  kReserve       = 1,
  kReserveCommit = 2,
  kReserveAbort  = 3,
  kProvision     = 4,
  kRelease       = 5,
  kTerminate     = 6,
  kQuery         = 7,
};

// Operations of one family are mutually exclusive per connection.
enum class OperationFamily : std::uint8_t {
  kNone        = 0,
  kReservation = 1,
  kProvision   = 2,
  kTerminate   = 3,
  kQuery       = 4,
};

constexpr OperationFamily FamilyOf(OperationKind kind) {
  switch (kind) {
    case OperationKind::kReserve:
    case OperationKind::kReserveCommit:
    case OperationKind::kReserveAbort:
      return OperationFamily::kReservation;
    case OperationKind::kProvision:
    case OperationKind::kRelease:
      return OperationFamily::kProvision;
    case OperationKind::kTerminate:
      return OperationFamily::kTerminate;
    case OperationKind::kQuery:
      return OperationFamily::kQuery;
    default:
      return OperationFamily::kNone;
  }
}

constexpr bool IsKnown(OperationKind kind) {
  return FamilyOf(kind) != OperationFamily::kNone;
}

// Only status refresh may be retried automatically.
constexpr bool IsIdempotent(OperationKind kind) {
  return kind == OperationKind::kQuery;
}

std::string_view ToString(OperationKind kind);
std::string_view ToString(OperationFamily family);

} // namespace nsi::model
