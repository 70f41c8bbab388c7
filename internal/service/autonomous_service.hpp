#pragma once

#include "autopilot/v1.hpp"
#include "service_context.hpp"

namespace autopilot::service {

// Worker control behind autopilot.v1.AutonomousService.
class AutonomousService {
 public:
  explicit AutonomousService(ServiceContext ctx);

  autopilot::v1::TickStats RunOnce(const autopilot::v1::RunOnceRequest& req);

  autopilot::v1::WorkerStatus GetStatus(const autopilot::v1::GetStatusRequest& req);

  autopilot::v1::PolicySettings GetPolicies(const autopilot::v1::GetPoliciesRequest& req);

  autopilot::v1::WorkerStatus SetMode(const autopilot::v1::SetModeRequest& req);

  autopilot::v1::WorkerStatus StartWorker(const autopilot::v1::WorkerControlRequest& req);
  autopilot::v1::WorkerStatus StopWorker(const autopilot::v1::WorkerControlRequest& req);

 private:
  autopilot::v1::WorkerStatus Status() const;

  ServiceContext ctx_;
};

} // namespace autopilot::service
