#pragma once

#include <string>

#include "autopilot/v1/types.pb.h"
#include "internal/model/action_state.hpp"
#include "internal/model/action_type.hpp"

namespace autopilot::model {

/*
  Domain enum <-> wire/storage conversions.

  Parse* throw util::ValidationError on unknown names.
*/

ActionType   ParseActionType(const std::string& name);
ActionStatus ParseActionStatus(const std::string& name);
TargetLevel  ParseTargetLevel(const std::string& name);

autopilot::v1::ActionType   ToProto(ActionType type);
autopilot::v1::ActionStatus ToProto(ActionStatus status);
autopilot::v1::TargetLevel  ToProto(TargetLevel level);

ActionType   FromProto(autopilot::v1::ActionType type);
ActionStatus FromProto(autopilot::v1::ActionStatus status);
TargetLevel  FromProto(autopilot::v1::TargetLevel level);

} // namespace autopilot::model
