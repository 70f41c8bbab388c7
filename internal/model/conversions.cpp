#include "conversions.hpp"

#include "internal/util/errors.hpp"

namespace autopilot::model {

ActionType ParseActionType(const std::string& name) {
  for (auto type : {ActionType::kScaleUp, ActionType::kScaleDown, ActionType::kPause, ActionType::kResume, ActionType::kReallocate}) {
    if (ToString(type) == name) {
      return type;
    }
  }
  throw util::ValidationError("unknown action type: " + name);
}

ActionStatus ParseActionStatus(const std::string& name) {
  for (auto status : {ActionStatus::kSuggested, ActionStatus::kPending, ActionStatus::kExecuting, ActionStatus::kExecuted, ActionStatus::kFailed,
                      ActionStatus::kCancelled}) {
    if (ToString(status) == name) {
      return status;
    }
  }
  throw util::ValidationError("unknown action status: " + name);
}

TargetLevel ParseTargetLevel(const std::string& name) {
  for (auto level : {TargetLevel::kAd, TargetLevel::kAdSet, TargetLevel::kCampaign}) {
    if (ToString(level) == name) {
      return level;
    }
  }
  throw util::ValidationError("unknown target level: " + name);
}

autopilot::v1::ActionType ToProto(ActionType type) {
  switch (type) {
    case ActionType::kScaleUp:
      return autopilot::v1::ACTION_TYPE_SCALE_UP;
    case ActionType::kScaleDown:
      return autopilot::v1::ACTION_TYPE_SCALE_DOWN;
    case ActionType::kPause:
      return autopilot::v1::ACTION_TYPE_PAUSE;
    case ActionType::kResume:
      return autopilot::v1::ACTION_TYPE_RESUME;
    case ActionType::kReallocate:
      return autopilot::v1::ACTION_TYPE_REALLOCATE;
    case ActionType::kUnspecified:
      break;
  }
  return autopilot::v1::ACTION_TYPE_UNSPECIFIED;
}

autopilot::v1::ActionStatus ToProto(ActionStatus status) {
  switch (status) {
    case ActionStatus::kSuggested:
      return autopilot::v1::ACTION_STATUS_SUGGESTED;
    case ActionStatus::kPending:
      return autopilot::v1::ACTION_STATUS_PENDING;
    case ActionStatus::kExecuting:
      return autopilot::v1::ACTION_STATUS_EXECUTING;
    case ActionStatus::kExecuted:
      return autopilot::v1::ACTION_STATUS_EXECUTED;
    case ActionStatus::kFailed:
      return autopilot::v1::ACTION_STATUS_FAILED;
    case ActionStatus::kCancelled:
      return autopilot::v1::ACTION_STATUS_CANCELLED;
    case ActionStatus::kUnspecified:
      break;
  }
  return autopilot::v1::ACTION_STATUS_UNSPECIFIED;
}

autopilot::v1::TargetLevel ToProto(TargetLevel level) {
  switch (level) {
    case TargetLevel::kAd:
      return autopilot::v1::TARGET_LEVEL_AD;
    case TargetLevel::kAdSet:
      return autopilot::v1::TARGET_LEVEL_AD_SET;
    case TargetLevel::kCampaign:
      return autopilot::v1::TARGET_LEVEL_CAMPAIGN;
    case TargetLevel::kUnspecified:
      break;
  }
  return autopilot::v1::TARGET_LEVEL_UNSPECIFIED;
}

ActionType FromProto(autopilot::v1::ActionType type) {
  switch (type) {
    case autopilot::v1::ACTION_TYPE_SCALE_UP:
      return ActionType::kScaleUp;
    case autopilot::v1::ACTION_TYPE_SCALE_DOWN:
      return ActionType::kScaleDown;
    case autopilot::v1::ACTION_TYPE_PAUSE:
      return ActionType::kPause;
    case autopilot::v1::ACTION_TYPE_RESUME:
      return ActionType::kResume;
    case autopilot::v1::ACTION_TYPE_REALLOCATE:
      return ActionType::kReallocate;
    default:
      return ActionType::kUnspecified;
  }
}

ActionStatus FromProto(autopilot::v1::ActionStatus status) {
  switch (status) {
    case autopilot::v1::ACTION_STATUS_SUGGESTED:
      return ActionStatus::kSuggested;
    case autopilot::v1::ACTION_STATUS_PENDING:
      return ActionStatus::kPending;
    case autopilot::v1::ACTION_STATUS_EXECUTING:
      return ActionStatus::kExecuting;
    case autopilot::v1::ACTION_STATUS_EXECUTED:
      return ActionStatus::kExecuted;
    case autopilot::v1::ACTION_STATUS_FAILED:
      return ActionStatus::kFailed;
    case autopilot::v1::ACTION_STATUS_CANCELLED:
      return ActionStatus::kCancelled;
    default:
      return ActionStatus::kUnspecified;
  }
}

TargetLevel FromProto(autopilot::v1::TargetLevel level) {
  switch (level) {
    case autopilot::v1::TARGET_LEVEL_AD:
      return TargetLevel::kAd;
    case autopilot::v1::TARGET_LEVEL_AD_SET:
      return TargetLevel::kAdSet;
    case autopilot::v1::TARGET_LEVEL_CAMPAIGN:
      return TargetLevel::kCampaign;
    default:
      return TargetLevel::kUnspecified;
  }
}

} // namespace autopilot::model
