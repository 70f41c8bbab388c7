#include "analytics_service.hpp"

#include <chrono>
#include <optional>
#include <unordered_set>

#include "internal/analytics/attribution_engine.hpp"
#include "internal/analytics/budget_allocator.hpp"
#include "internal/analytics/metrics_recorder.hpp"
#include "internal/analytics/prediction_engine.hpp"
#include "internal/analytics/roas_calculator.hpp"
#include "internal/db/api/check.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace autopilot::service {

using namespace autopilot::v1;

namespace {

constexpr uint32_t kDefaultPlanLookbackDays = 7;

std::optional<util::TimePoint> OptionalTime(bool present, const google::protobuf::Timestamp& ts) {
  if (!present) return std::nullopt;
  return util::FromProto(ts);
}

RankedAd ToRanked(const db::model::RoasMetricsRecord& row, const std::string& name) {
  RankedAd ad;
  ad.set_ad_id(row.scope.ad_id);
  ad.set_ad_name(name);
  ad.set_roas(row.actual_roas);
  ad.set_revenue(row.total_revenue_usd);
  ad.set_cost(row.total_cost_usd);
  ad.set_conversions(row.conversions);
  ad.set_performance_tier(row.performance_tier);
  return ad;
}

} // namespace

AnalyticsService::AnalyticsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RoasResult AnalyticsService::CalculateRoas(const CalculateRoasRequest& req) {
  return ObserveRpc("AnalyticsService.CalculateRoas", [&] {
    const auto result = ctx_.calculator->Calculate(FromProto(req.scope()), OptionalTime(req.has_date_start(), req.date_start()),
                                                   OptionalTime(req.has_date_end(), req.date_end()));
    return ToProto(result);
  });
}

PredictRoasResponse AnalyticsService::PredictRoas(const PredictRoasRequest& req) {
  return ObserveRpc("AnalyticsService.PredictRoas", [&] {
    const auto forecast = ctx_.prediction->PredictRoas(FromProto(req.scope()), req.lookback_days());

    PredictRoasResponse resp;
    resp.set_predicted_roas(forecast.predicted_roas);
    resp.set_confidence(forecast.confidence);
    resp.set_historical_points(forecast.historical_points);
    resp.set_trend(forecast.trend);
    return resp;
  });
}

ConversionProbabilityResponse AnalyticsService::ConversionProbability(const ConversionProbabilityRequest& req) {
  return ObserveRpc("AnalyticsService.ConversionProbability", [&] {
    // proto3 zero means "use the uniform prior"
    const double alpha = req.prior_alpha() == 0.0 ? 1.0 : req.prior_alpha();
    const double beta  = req.prior_beta() == 0.0 ? 1.0 : req.prior_beta();

    const auto p = analytics::PredictionEngine::CalculateConversionProbability(req.clicks(), req.conversions(), alpha, beta);

    ConversionProbabilityResponse resp;
    resp.set_probability(p.probability);
    resp.set_ci_low(p.ci_low);
    resp.set_ci_high(p.ci_high);
    return resp;
  });
}

ExpectedValueResponse AnalyticsService::ExpectedValue(const ExpectedValueRequest& req) {
  return ObserveRpc("AnalyticsService.ExpectedValue", [&] {
    const auto ev =
        analytics::PredictionEngine::CalculateExpectedValue(req.conversion_probability(), req.avg_order_value(), req.cost_per_click());

    ExpectedValueResponse resp;
    resp.set_expected_value(ev.expected_value);
    resp.set_expected_revenue(ev.expected_revenue);
    resp.set_expected_cost(ev.expected_cost);
    resp.set_breakeven_rate(ev.breakeven_rate);
    resp.set_is_profitable(ev.is_profitable);
    return resp;
  });
}

ApplyAttributionResponse AnalyticsService::ApplyAttribution(const ApplyAttributionRequest& req) {
  return ObserveRpc("AnalyticsService.ApplyAttribution", [&] {
    const auto model = analytics::ParseAttributionModel(req.model());
    if (!model) {
      throw util::ValidationError("unknown attribution model: " + req.model());
    }
    if (!req.has_date_start() || !req.has_date_end()) {
      throw util::ValidationError("date_start and date_end are required");
    }

    const auto start = util::FromProto(req.date_start());
    const auto end   = util::FromProto(req.date_end());
    if (end <= start) {
      throw util::ValidationError("date_end must be after date_start");
    }

    auto tx       = ctx_.repository->Begin();
    auto outcomes = ctx_.repository->ListOutcomes(*tx, FromProto(req.scope()), util::ToUnixMillis(start), util::ToUnixMillis(end));

    analytics::AttributionEngine::Apply(outcomes, *model);

    ApplyAttributionResponse resp;
    for (const auto& outcome : outcomes) {
      db::ThrowIfDbError(
          ctx_.repository->UpdateOutcomeAttribution(*tx, outcome.outcome_id, outcome.attribution_model, outcome.attribution_weight),
          "update attribution for " + outcome.outcome_id);
      resp.set_total_weight(resp.total_weight() + outcome.attribution_weight);
    }
    tx->Commit();

    resp.set_outcomes_updated(outcomes.size());
    AUTOPILOT_LOG_INFO("Attribution applied", {observability::StringField("model", analytics::ToString(*model)),
                                               observability::IntField("outcomes", static_cast<int64_t>(outcomes.size()))});
    return resp;
  });
}

RoasMetrics AnalyticsService::RecordDailyMetrics(const RecordDailyMetricsRequest& req) {
  return ObserveRpc("AnalyticsService.RecordDailyMetrics", [&] {
    const auto scope = FromProto(req.scope());
    if (scope.Empty()) {
      throw util::ValidationError("scope is required");
    }
    const auto day = req.has_day() ? util::FromProto(req.day()) : ctx_.clock->Now();
    return ToProto(ctx_.recorder->RecordDailyMetrics(scope, day));
  });
}

GetBudgetPlanResponse AnalyticsService::GetBudgetPlan(const GetBudgetPlanRequest& req) {
  return ObserveRpc("AnalyticsService.GetBudgetPlan", "campaign.id", req.campaign_id(), [&] {
    if (req.campaign_id().empty()) {
      throw util::ValidationError("campaign_id is required");
    }
    if (req.total_budget() < 0.0) {
      throw util::ValidationError("total_budget must not be negative");
    }

    const auto lookback = req.lookback_days() == 0 ? kDefaultPlanLookbackDays : req.lookback_days();

    db::RoasMetricsQuery query;
    query.scope.campaign_id = req.campaign_id();
    query.ad_level_only     = true;
    query.since_ms          = util::ToUnixMillis(ctx_.clock->Now() - std::chrono::hours(24 * static_cast<int64_t>(lookback)));

    auto tx = ctx_.repository->Begin();

    std::vector<db::model::RoasMetricsRecord> latest;
    std::unordered_set<std::string>           seen;
    for (auto& row : ctx_.repository->ListRoasMetrics(*tx, query)) {
      if (seen.insert(row.scope.ad_id).second) latest.push_back(std::move(row));
    }

    double total_budget = req.total_budget();
    if (total_budget == 0.0) {
      for (const auto& row : latest) {
        if (const auto ad = ctx_.repository->GetEntity(*tx, row.scope.ad_id)) total_budget += ad->daily_budget_usd;
      }
    }

    const auto split = ctx_.allocator->DetectWinnersLosers(latest);

    GetBudgetPlanResponse resp;
    *resp.mutable_plan() = ctx_.allocator->ComputeReallocations(latest, total_budget);

    const auto name_of = [&](const std::string& ad_id) {
      const auto ad = ctx_.repository->GetEntity(*tx, ad_id);
      return ad ? ad->name : std::string();
    };
    for (const auto& row : split.winners) *resp.add_winners() = ToRanked(row, name_of(row.scope.ad_id));
    for (const auto& row : split.losers) *resp.add_losers() = ToRanked(row, name_of(row.scope.ad_id));
    resp.set_median_roas(split.median_roas);
    resp.set_total_ads_analyzed(split.total_analyzed);

    tx->Commit();
    return resp;
  });
}

} // namespace autopilot::service
