#pragma once

#include "autopilot/v1.hpp"
#include "service_context.hpp"

namespace autopilot::service {

// Action queue operations behind autopilot.v1.OptimizationService.
class ActionService {
 public:
  explicit ActionService(ServiceContext ctx);

  autopilot::v1::ListActionsResponse ListActions(const autopilot::v1::ListActionsRequest& req);

  autopilot::v1::OptimizationAction GetAction(const autopilot::v1::GetActionRequest& req);

  autopilot::v1::OptimizationAction ApproveAction(const autopilot::v1::ApproveActionRequest& req);

  // Runs policy and safety (manual mode) before a live execution; a block
  // comes back as result.status "blocked" and leaves the action as it was.
  autopilot::v1::ExecuteActionResponse ExecuteAction(const autopilot::v1::ExecuteActionRequest& req);

  autopilot::v1::OptimizationAction CancelAction(const autopilot::v1::CancelActionRequest& req);

  autopilot::v1::RunOptimizationResponse RunOptimization(const autopilot::v1::RunOptimizationRequest& req);

  autopilot::v1::QueueStats GetQueueStats(const autopilot::v1::GetQueueStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace autopilot::service
