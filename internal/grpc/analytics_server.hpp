#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "autopilot/v1/analytics_service.grpc.pb.h"
#include "internal/service/analytics_service.hpp"

namespace autopilot::grpc {

class AnalyticsServer final : public autopilot::v1::AnalyticsService::Service {
 public:
  explicit AnalyticsServer(std::shared_ptr<autopilot::service::AnalyticsService> svc);

  ::grpc::Status CalculateRoas(::grpc::ServerContext*, const autopilot::v1::CalculateRoasRequest*, autopilot::v1::RoasResult*) override;
  ::grpc::Status PredictRoas(::grpc::ServerContext*, const autopilot::v1::PredictRoasRequest*, autopilot::v1::PredictRoasResponse*) override;
  ::grpc::Status ConversionProbability(::grpc::ServerContext*, const autopilot::v1::ConversionProbabilityRequest*, autopilot::v1::ConversionProbabilityResponse*) override;
  ::grpc::Status ExpectedValue(::grpc::ServerContext*, const autopilot::v1::ExpectedValueRequest*, autopilot::v1::ExpectedValueResponse*) override;
  ::grpc::Status ApplyAttribution(::grpc::ServerContext*, const autopilot::v1::ApplyAttributionRequest*, autopilot::v1::ApplyAttributionResponse*) override;
  ::grpc::Status RecordDailyMetrics(::grpc::ServerContext*, const autopilot::v1::RecordDailyMetricsRequest*, autopilot::v1::RoasMetrics*) override;
  ::grpc::Status GetBudgetPlan(::grpc::ServerContext*, const autopilot::v1::GetBudgetPlanRequest*, autopilot::v1::GetBudgetPlanResponse*) override;

 private:
  std::shared_ptr<autopilot::service::AnalyticsService> service_;
};

} // namespace autopilot::grpc
