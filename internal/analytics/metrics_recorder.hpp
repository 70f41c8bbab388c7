#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/analytics/prediction_engine.hpp"
#include "internal/analytics/roas_calculator.hpp"
#include "internal/db/api/repository.hpp"

namespace autopilot::analytics {

struct BlendedMetrics {
  RoasResult roas;

  uint64_t impressions = 0;
  uint64_t clicks      = 0;
  uint64_t conversions = 0;
  double   spend_usd   = 0.0;

  double blended_ctr     = 0.0; // percent
  double blended_cpc     = 0.0;
  double blended_cpm     = 0.0;
  double conversion_rate = 0.0;

  double session_quality_score      = 0.0; // 0..100
  double user_retention_probability = 0.0; // 0..1
  double lifetime_value_estimate    = 0.0;
};

/*
  MetricsRecorder

  Produces the once-per-day RoasMetricsRecord for a scope: blended
  delivery metrics, the ROAS result, a 30-day forecast and the
  conversion probability, plus a tier and a budget recommendation.
*/
class MetricsRecorder {
 public:
  MetricsRecorder(std::shared_ptr<db::Repository> repository, std::shared_ptr<RoasCalculator> calculator,
                  std::shared_ptr<PredictionEngine> prediction, std::shared_ptr<util::Clock> clock);

  BlendedMetrics CalculateBlendedMetrics(db::Transaction& tx, const db::model::Scope& scope, util::TimePoint date_start, util::TimePoint date_end);

  // `day` is truncated to UTC midnight. AlreadyExists if the row is taken.
  db::model::RoasMetricsRecord RecordDailyMetrics(const db::model::Scope& scope, util::TimePoint day);

  static double SessionQualityScore(const std::vector<db::model::OutcomeRecord>& outcomes);
  static double RetentionProbability(const std::vector<db::model::OutcomeRecord>& outcomes);
  static double LifetimeValueEstimate(const std::vector<db::model::OutcomeRecord>& outcomes);

  static std::string PerformanceTier(double actual_roas, double conversion_rate);

  struct Recommendation {
    std::string action;
    double      budget_change_pct = 0.0;
  };
  static Recommendation Recommend(const std::string& tier, double smoothed_roas, double predicted_roas);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<RoasCalculator>   calculator_;
  std::shared_ptr<PredictionEngine> prediction_;
  std::shared_ptr<util::Clock>      clock_;
};

} // namespace autopilot::analytics
