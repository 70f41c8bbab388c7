#pragma once

#include <memory>

#include "autopilot/v1/types.pb.h"
#include "internal/db/model/action_record.hpp"
#include "internal/gateway/ad_platform_gateway.hpp"

namespace autopilot::optimization {

/*
  Applies one action through the ad-platform gateway, dispatching on
  its type. Returns the result payload on success; any failure is
  thrown and becomes the action's execution_error.
*/
class ActionExecutor {
 public:
  explicit ActionExecutor(std::shared_ptr<gateway::AdPlatformGateway> gateway);

  autopilot::v1::ExecutionResult Execute(const db::model::ActionRecord& action);

 private:
  autopilot::v1::ExecutionResult ScaleUp(const db::model::ActionRecord& action);
  autopilot::v1::ExecutionResult ScaleDown(const db::model::ActionRecord& action);
  autopilot::v1::ExecutionResult Pause(const db::model::ActionRecord& action);
  autopilot::v1::ExecutionResult Resume(const db::model::ActionRecord& action);
  autopilot::v1::ExecutionResult Reallocate(const db::model::ActionRecord& action);

  std::shared_ptr<gateway::AdPlatformGateway> gateway_;
};

} // namespace autopilot::optimization
