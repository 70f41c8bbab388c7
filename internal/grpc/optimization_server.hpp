#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "autopilot/v1/optimization_service.grpc.pb.h"
#include "internal/service/action_service.hpp"

namespace autopilot::grpc {

class OptimizationServer final : public autopilot::v1::OptimizationService::Service {
 public:
  explicit OptimizationServer(std::shared_ptr<autopilot::service::ActionService> svc);

  ::grpc::Status ListActions(::grpc::ServerContext*, const autopilot::v1::ListActionsRequest*, autopilot::v1::ListActionsResponse*) override;
  ::grpc::Status GetAction(::grpc::ServerContext*, const autopilot::v1::GetActionRequest*, autopilot::v1::OptimizationAction*) override;
  ::grpc::Status ApproveAction(::grpc::ServerContext*, const autopilot::v1::ApproveActionRequest*, autopilot::v1::OptimizationAction*) override;
  ::grpc::Status ExecuteAction(::grpc::ServerContext*, const autopilot::v1::ExecuteActionRequest*, autopilot::v1::ExecuteActionResponse*) override;
  ::grpc::Status CancelAction(::grpc::ServerContext*, const autopilot::v1::CancelActionRequest*, autopilot::v1::OptimizationAction*) override;
  ::grpc::Status RunOptimization(::grpc::ServerContext*, const autopilot::v1::RunOptimizationRequest*, autopilot::v1::RunOptimizationResponse*) override;
  ::grpc::Status GetQueueStats(::grpc::ServerContext*, const autopilot::v1::GetQueueStatsRequest*, autopilot::v1::QueueStats*) override;

 private:
  std::shared_ptr<autopilot::service::ActionService> service_;
};

} // namespace autopilot::grpc
