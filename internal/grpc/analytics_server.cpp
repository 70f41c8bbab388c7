#include "analytics_server.hpp"

#include "grpc_error.hpp"

namespace autopilot::grpc {

AnalyticsServer::AnalyticsServer(std::shared_ptr<autopilot::service::AnalyticsService> svc) : service_(std::move(svc)) {
}

::grpc::Status AnalyticsServer::CalculateRoas(::grpc::ServerContext*, const autopilot::v1::CalculateRoasRequest* req, autopilot::v1::RoasResult* resp) {
  try {
    *resp = service_->CalculateRoas(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalyticsServer::PredictRoas(::grpc::ServerContext*, const autopilot::v1::PredictRoasRequest* req, autopilot::v1::PredictRoasResponse* resp) {
  try {
    *resp = service_->PredictRoas(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalyticsServer::ConversionProbability(::grpc::ServerContext*, const autopilot::v1::ConversionProbabilityRequest* req, autopilot::v1::ConversionProbabilityResponse* resp) {
  try {
    *resp = service_->ConversionProbability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalyticsServer::ExpectedValue(::grpc::ServerContext*, const autopilot::v1::ExpectedValueRequest* req, autopilot::v1::ExpectedValueResponse* resp) {
  try {
    *resp = service_->ExpectedValue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalyticsServer::ApplyAttribution(::grpc::ServerContext*, const autopilot::v1::ApplyAttributionRequest* req, autopilot::v1::ApplyAttributionResponse* resp) {
  try {
    *resp = service_->ApplyAttribution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalyticsServer::RecordDailyMetrics(::grpc::ServerContext*, const autopilot::v1::RecordDailyMetricsRequest* req, autopilot::v1::RoasMetrics* resp) {
  try {
    *resp = service_->RecordDailyMetrics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AnalyticsServer::GetBudgetPlan(::grpc::ServerContext*, const autopilot::v1::GetBudgetPlanRequest* req, autopilot::v1::GetBudgetPlanResponse* resp) {
  try {
    *resp = service_->GetBudgetPlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace autopilot::grpc
