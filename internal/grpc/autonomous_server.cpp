#include "autonomous_server.hpp"

#include "grpc_error.hpp"

namespace autopilot::grpc {

AutonomousServer::AutonomousServer(std::shared_ptr<autopilot::service::AutonomousService> svc) : service_(std::move(svc)) {
}

::grpc::Status AutonomousServer::RunOnce(::grpc::ServerContext*, const autopilot::v1::RunOnceRequest* req, autopilot::v1::TickStats* resp) {
  try {
    *resp = service_->RunOnce(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutonomousServer::GetStatus(::grpc::ServerContext*, const autopilot::v1::GetStatusRequest* req, autopilot::v1::WorkerStatus* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutonomousServer::GetPolicies(::grpc::ServerContext*, const autopilot::v1::GetPoliciesRequest* req, autopilot::v1::PolicySettings* resp) {
  try {
    *resp = service_->GetPolicies(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutonomousServer::SetMode(::grpc::ServerContext*, const autopilot::v1::SetModeRequest* req, autopilot::v1::WorkerStatus* resp) {
  try {
    *resp = service_->SetMode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutonomousServer::StartWorker(::grpc::ServerContext*, const autopilot::v1::WorkerControlRequest* req, autopilot::v1::WorkerStatus* resp) {
  try {
    *resp = service_->StartWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutonomousServer::StopWorker(::grpc::ServerContext*, const autopilot::v1::WorkerControlRequest* req, autopilot::v1::WorkerStatus* resp) {
  try {
    *resp = service_->StopWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace autopilot::grpc
