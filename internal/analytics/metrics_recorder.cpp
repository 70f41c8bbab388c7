#include "metrics_recorder.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

#include "internal/db/api/check.hpp"
#include "internal/observability/logging.hpp"

namespace autopilot::analytics {

namespace {

constexpr double kExcellentSessionSeconds = 300.0;
constexpr double kRepeatConversionsTarget = 3.0;
constexpr double kLifetimePurchases       = 5.0;

double Round(double value, int places) {
  const double scale = std::pow(10.0, places);
  return std::round(value * scale) / scale;
}

bool IsHighValueConversion(const std::string& type) {
  return type == "purchase" || type == "lead" || type == "complete_registration";
}

} // namespace

MetricsRecorder::MetricsRecorder(std::shared_ptr<db::Repository> repository, std::shared_ptr<RoasCalculator> calculator,
                                 std::shared_ptr<PredictionEngine> prediction, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), calculator_(std::move(calculator)), prediction_(std::move(prediction)), clock_(std::move(clock)) {
}

BlendedMetrics MetricsRecorder::CalculateBlendedMetrics(db::Transaction& tx, const db::model::Scope& scope, util::TimePoint date_start,
                                                        util::TimePoint date_end) {
  BlendedMetrics m;
  m.roas = calculator_->Calculate(tx, scope, date_start, date_end);

  const auto outcomes = repository_->ListOutcomes(tx, scope, util::ToUnixMillis(date_start), util::ToUnixMillis(date_end));

  m.impressions = m.roas.impressions;
  m.clicks      = m.roas.clicks;
  m.conversions = m.roas.total_conversions;
  m.spend_usd   = m.roas.total_cost_usd;

  const auto impressions = static_cast<double>(m.impressions);
  const auto clicks      = static_cast<double>(m.clicks);

  m.blended_ctr     = m.impressions > 0 ? clicks / impressions * 100.0 : 0.0;
  m.conversion_rate = m.roas.conversion_rate;
  m.blended_cpc     = m.clicks > 0 ? m.spend_usd / clicks : 0.0;
  m.blended_cpm     = m.impressions > 0 ? m.spend_usd / impressions * 1000.0 : 0.0;

  m.session_quality_score      = SessionQualityScore(outcomes);
  m.user_retention_probability = RetentionProbability(outcomes);
  m.lifetime_value_estimate    = LifetimeValueEstimate(outcomes);
  return m;
}

db::model::RoasMetricsRecord MetricsRecorder::RecordDailyMetrics(const db::model::Scope& scope, util::TimePoint day) {
  const auto start = util::StartOfDay(day);
  const auto end   = start + std::chrono::hours(24);

  auto tx = repository_->Begin();

  const auto blended  = CalculateBlendedMetrics(*tx, scope, start, end);
  const auto forecast = prediction_->PredictRoas(*tx, scope, 30);
  const auto prob     = PredictionEngine::CalculateConversionProbability(blended.clicks, std::min(blended.conversions, blended.clicks));

  db::model::RoasMetricsRecord r;
  r.scope                    = scope;
  r.date_ms                  = util::ToUnixMillis(start);
  r.actual_roas              = blended.roas.actual_roas;
  r.smoothed_roas            = blended.roas.smoothed_roas;
  r.predicted_roas           = forecast.predicted_roas;
  r.confidence_score         = forecast.confidence;
  r.confidence_interval_low  = blended.roas.confidence_interval_low;
  r.confidence_interval_high = blended.roas.confidence_interval_high;
  r.sample_size              = blended.roas.sample_size;
  r.is_outlier               = blended.roas.is_outlier;
  r.outlier_reason           = blended.roas.outlier_reason;

  r.performance_tier = PerformanceTier(r.actual_roas, blended.conversion_rate);

  const auto recommendation       = Recommend(r.performance_tier, r.smoothed_roas, r.predicted_roas);
  r.recommendation                = recommendation.action;
  r.recommended_budget_change_pct = recommendation.budget_change_pct;

  r.impressions                = blended.impressions;
  r.clicks                     = blended.clicks;
  r.conversions                = blended.conversions;
  r.total_cost_usd             = blended.spend_usd;
  r.total_revenue_usd          = blended.roas.total_revenue_usd;
  r.conversion_probability     = prob.probability;
  r.session_quality_score      = blended.session_quality_score;
  r.user_retention_probability = blended.user_retention_probability;
  r.lifetime_value_estimate    = blended.lifetime_value_estimate;
  r.blended_ctr                = blended.blended_ctr;
  r.blended_cpc                = blended.blended_cpc;
  r.blended_cpm                = blended.blended_cpm;
  r.created_at_ms              = util::ToUnixMillis(clock_->Now());

  db::ThrowIfDbError(repository_->InsertRoasMetrics(*tx, r), "record daily metrics");
  tx->Commit();

  AUTOPILOT_LOG_INFO("Recorded daily ROAS metrics", {observability::StringField("campaign_id", scope.campaign_id),
                                                     observability::StringField("adset_id", scope.adset_id),
                                                     observability::StringField("ad_id", scope.ad_id),
                                                     observability::DoubleField("actual_roas", r.actual_roas),
                                                     observability::StringField("tier", r.performance_tier)});
  return r;
}

double MetricsRecorder::SessionQualityScore(const std::vector<db::model::OutcomeRecord>& outcomes) {
  if (outcomes.empty()) return 0.0;

  double   total_duration = 0.0;
  uint64_t high_value     = 0;
  for (const auto& outcome : outcomes) {
    total_duration += outcome.session_duration_seconds.value_or(0.0);
    if (IsHighValueConversion(outcome.conversion_type)) ++high_value;
  }

  const auto   n                = static_cast<double>(outcomes.size());
  const double duration_score   = std::min(total_duration / n / kExcellentSessionSeconds * 100.0, 100.0);
  const double conversion_score = static_cast<double>(high_value) / n * 100.0;
  return Round(duration_score * 0.6 + conversion_score * 0.4, 2);
}

double MetricsRecorder::RetentionProbability(const std::vector<db::model::OutcomeRecord>& outcomes) {
  std::unordered_set<std::string> sessions;
  for (const auto& outcome : outcomes) {
    if (!outcome.session_id.empty()) sessions.insert(outcome.session_id);
  }
  if (sessions.empty()) return 0.0;

  const double repeat_rate = static_cast<double>(outcomes.size()) / static_cast<double>(sessions.size());
  return Round(std::min(repeat_rate / kRepeatConversionsTarget, 1.0), 4);
}

double MetricsRecorder::LifetimeValueEstimate(const std::vector<db::model::OutcomeRecord>& outcomes) {
  double   revenue   = 0.0;
  uint64_t purchases = 0;
  for (const auto& outcome : outcomes) {
    if (outcome.conversion_type != "purchase") continue;
    revenue += outcome.value_usd;
    ++purchases;
  }
  if (purchases == 0) return 0.0;

  return Round(revenue / static_cast<double>(purchases) * kLifetimePurchases, 2);
}

std::string MetricsRecorder::PerformanceTier(double actual_roas, double conversion_rate) {
  if (actual_roas >= 5.0 && conversion_rate >= 0.05) return "excellent";
  if (actual_roas >= 3.0 && conversion_rate >= 0.03) return "good";
  if (actual_roas >= 2.0 && conversion_rate >= 0.02) return "average";
  if (actual_roas >= 1.0 && conversion_rate >= 0.01) return "poor";
  return "failing";
}

MetricsRecorder::Recommendation MetricsRecorder::Recommend(const std::string& tier, double smoothed_roas, double predicted_roas) {
  if (tier == "excellent") return {"scale_up", 50.0};
  if (tier == "good" && predicted_roas >= smoothed_roas) return {"scale_up", 25.0};
  if (tier == "good") return {"monitor", 0.0};
  if (tier == "average") return {"test", 0.0};
  if (tier == "poor") return {"scale_down", -30.0};
  return {"pause", -100.0};
}

} // namespace autopilot::analytics
