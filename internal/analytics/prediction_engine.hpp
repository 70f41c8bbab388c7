#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace autopilot::analytics {

struct RoasForecast {
  double      predicted_roas    = 0.0;
  double      confidence        = 0.0;
  uint64_t    historical_points = 0;
  std::string trend; // "increasing" | "decreasing"; empty without history
};

struct ConversionProbability {
  double probability = 0.0;
  double ci_low      = 0.0;
  double ci_high     = 0.0;
};

struct ExpectedValue {
  double expected_value   = 0.0;
  double expected_revenue = 0.0;
  double expected_cost    = 0.0;
  double breakeven_rate   = 0.0;
  bool   is_profitable    = false;
};

/*
  PredictionEngine

  - PredictRoas: EMA over daily actual_roas, oldest to newest.
  - CalculateConversionProbability: Beta-Binomial posterior mean and
    95% credible interval.
  - CalculateExpectedValue: per-click economics.
*/
class PredictionEngine {
 public:
  PredictionEngine(config::PredictionSettings settings, double default_prior_roas, std::shared_ptr<db::Repository> repository,
                   std::shared_ptr<util::Clock> clock);

  // lookback_days == 0 uses the configured default.
  RoasForecast PredictRoas(const db::model::Scope& scope, uint32_t lookback_days = 0);
  RoasForecast PredictRoas(db::Transaction& tx, const db::model::Scope& scope, uint32_t lookback_days = 0);

  // `history` is newest first.
  RoasForecast Forecast(const std::vector<db::model::RoasMetricsRecord>& history) const;

  static ConversionProbability CalculateConversionProbability(uint64_t clicks, uint64_t conversions, double prior_alpha = 1.0,
                                                              double prior_beta = 1.0);

  static ExpectedValue CalculateExpectedValue(double conversion_probability, double avg_order_value, double cost_per_click);

 private:
  config::PredictionSettings      settings_;
  double                          default_prior_roas_;
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace autopilot::analytics
