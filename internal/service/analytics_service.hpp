#pragma once

#include "autopilot/v1.hpp"
#include "service_context.hpp"

namespace autopilot::service {

// ROAS, prediction, attribution and budget-plan queries behind autopilot.v1.AnalyticsService.
class AnalyticsService {
 public:
  explicit AnalyticsService(ServiceContext ctx);

  autopilot::v1::RoasResult CalculateRoas(const autopilot::v1::CalculateRoasRequest& req);

  autopilot::v1::PredictRoasResponse PredictRoas(const autopilot::v1::PredictRoasRequest& req);

  autopilot::v1::ConversionProbabilityResponse ConversionProbability(const autopilot::v1::ConversionProbabilityRequest& req);

  autopilot::v1::ExpectedValueResponse ExpectedValue(const autopilot::v1::ExpectedValueRequest& req);

  autopilot::v1::ApplyAttributionResponse ApplyAttribution(const autopilot::v1::ApplyAttributionRequest& req);

  autopilot::v1::RoasMetrics RecordDailyMetrics(const autopilot::v1::RecordDailyMetricsRequest& req);

  autopilot::v1::GetBudgetPlanResponse GetBudgetPlan(const autopilot::v1::GetBudgetPlanRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace autopilot::service
