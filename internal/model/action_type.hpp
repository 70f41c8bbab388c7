#pragma once

#include <cstdint>
#include <string_view>

namespace autopilot::model {

// Closed set; every switch over it is exhaustive.
enum class ActionType : std::uint8_t {
  kUnspecified = 0,
  kScaleUp     = 1,
  kScaleDown   = 2,
  kPause       = 3,
  kResume      = 4,
  kReallocate  = 5,
};

enum class TargetLevel : std::uint8_t {
  kUnspecified = 0,
  kAd          = 1,
  kAdSet       = 2,
  kCampaign    = 3,
};

constexpr std::string_view ToString(ActionType type) {
  switch (type) {
    case ActionType::kScaleUp:
      return "scale_up";
    case ActionType::kScaleDown:
      return "scale_down";
    case ActionType::kPause:
      return "pause";
    case ActionType::kResume:
      return "resume";
    case ActionType::kReallocate:
      return "reallocate";
    case ActionType::kUnspecified:
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(TargetLevel level) {
  switch (level) {
    case TargetLevel::kAd:
      return "ad";
    case TargetLevel::kAdSet:
      return "ad_set";
    case TargetLevel::kCampaign:
      return "campaign";
    case TargetLevel::kUnspecified:
    default:
      return "unspecified";
  }
}

// Budget-changing types carry amount_pct and move daily_budget.
constexpr bool ChangesBudget(ActionType type) {
  return type == ActionType::kScaleUp || type == ActionType::kScaleDown;
}

} // namespace autopilot::model
