#pragma once

#include <cstdint>
#include <string_view>

namespace autopilot::model {

enum class ActionStatus : std::uint8_t {
  kUnspecified = 0,
  kSuggested   = 1,
  kPending     = 2,
  kExecuting   = 3,
  kExecuted    = 4,
  kFailed      = 5,
  kCancelled   = 6,
};

constexpr bool IsTerminal(ActionStatus status) {
  return status == ActionStatus::kExecuted || status == ActionStatus::kFailed || status == ActionStatus::kCancelled;
}

/*
  SUGGESTED -> PENDING            approve
  SUGGESTED|PENDING -> EXECUTING  execute
  EXECUTING -> EXECUTED|FAILED    executor outcome
  SUGGESTED|PENDING -> CANCELLED  cancel / expiry
*/
constexpr bool CanTransition(ActionStatus from, ActionStatus to) {
  switch (from) {
    case ActionStatus::kSuggested:
      return to == ActionStatus::kPending || to == ActionStatus::kExecuting || to == ActionStatus::kCancelled;
    case ActionStatus::kPending:
      return to == ActionStatus::kExecuting || to == ActionStatus::kCancelled;
    case ActionStatus::kExecuting:
      return to == ActionStatus::kExecuted || to == ActionStatus::kFailed;
    case ActionStatus::kExecuted:
    case ActionStatus::kFailed:
    case ActionStatus::kCancelled:
    case ActionStatus::kUnspecified:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(ActionStatus status) {
  switch (status) {
    case ActionStatus::kSuggested:
      return "suggested";
    case ActionStatus::kPending:
      return "pending";
    case ActionStatus::kExecuting:
      return "executing";
    case ActionStatus::kExecuted:
      return "executed";
    case ActionStatus::kFailed:
      return "failed";
    case ActionStatus::kCancelled:
      return "cancelled";
    case ActionStatus::kUnspecified:
    default:
      return "unspecified";
  }
}

} // namespace autopilot::model
