#include "optimization_server.hpp"

#include "grpc_error.hpp"

namespace autopilot::grpc {

OptimizationServer::OptimizationServer(std::shared_ptr<autopilot::service::ActionService> svc) : service_(std::move(svc)) {
}

::grpc::Status OptimizationServer::ListActions(::grpc::ServerContext*, const autopilot::v1::ListActionsRequest* req, autopilot::v1::ListActionsResponse* resp) {
  try {
    *resp = service_->ListActions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OptimizationServer::GetAction(::grpc::ServerContext*, const autopilot::v1::GetActionRequest* req, autopilot::v1::OptimizationAction* resp) {
  try {
    *resp = service_->GetAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OptimizationServer::ApproveAction(::grpc::ServerContext*, const autopilot::v1::ApproveActionRequest* req, autopilot::v1::OptimizationAction* resp) {
  try {
    *resp = service_->ApproveAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OptimizationServer::ExecuteAction(::grpc::ServerContext*, const autopilot::v1::ExecuteActionRequest* req, autopilot::v1::ExecuteActionResponse* resp) {
  try {
    *resp = service_->ExecuteAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OptimizationServer::CancelAction(::grpc::ServerContext*, const autopilot::v1::CancelActionRequest* req, autopilot::v1::OptimizationAction* resp) {
  try {
    *resp = service_->CancelAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OptimizationServer::RunOptimization(::grpc::ServerContext*, const autopilot::v1::RunOptimizationRequest* req, autopilot::v1::RunOptimizationResponse* resp) {
  try {
    *resp = service_->RunOptimization(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OptimizationServer::GetQueueStats(::grpc::ServerContext*, const autopilot::v1::GetQueueStatsRequest* req, autopilot::v1::QueueStats* resp) {
  try {
    *resp = service_->GetQueueStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace autopilot::grpc
