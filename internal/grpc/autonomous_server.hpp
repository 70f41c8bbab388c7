#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "autopilot/v1/autonomous_service.grpc.pb.h"
#include "internal/service/autonomous_service.hpp"

namespace autopilot::grpc {

class AutonomousServer final : public autopilot::v1::AutonomousService::Service {
 public:
  explicit AutonomousServer(std::shared_ptr<autopilot::service::AutonomousService> svc);

  ::grpc::Status RunOnce(::grpc::ServerContext*, const autopilot::v1::RunOnceRequest*, autopilot::v1::TickStats*) override;
  ::grpc::Status GetStatus(::grpc::ServerContext*, const autopilot::v1::GetStatusRequest*, autopilot::v1::WorkerStatus*) override;
  ::grpc::Status GetPolicies(::grpc::ServerContext*, const autopilot::v1::GetPoliciesRequest*, autopilot::v1::PolicySettings*) override;
  ::grpc::Status SetMode(::grpc::ServerContext*, const autopilot::v1::SetModeRequest*, autopilot::v1::WorkerStatus*) override;
  ::grpc::Status StartWorker(::grpc::ServerContext*, const autopilot::v1::WorkerControlRequest*, autopilot::v1::WorkerStatus*) override;
  ::grpc::Status StopWorker(::grpc::ServerContext*, const autopilot::v1::WorkerControlRequest*, autopilot::v1::WorkerStatus*) override;

 private:
  std::shared_ptr<autopilot::service::AutonomousService> service_;
};

} // namespace autopilot::grpc
