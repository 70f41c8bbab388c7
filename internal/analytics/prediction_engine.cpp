#include "prediction_engine.hpp"

#include <algorithm>
#include <boost/math/distributions/beta.hpp>
#include <chrono>
#include <iterator>

#include "internal/util/errors.hpp"

namespace autopilot::analytics {

PredictionEngine::PredictionEngine(config::PredictionSettings settings, double default_prior_roas, std::shared_ptr<db::Repository> repository,
                                   std::shared_ptr<util::Clock> clock)
    : settings_(std::move(settings)), default_prior_roas_(default_prior_roas), repository_(std::move(repository)), clock_(std::move(clock)) {
}

RoasForecast PredictionEngine::PredictRoas(const db::model::Scope& scope, uint32_t lookback_days) {
  auto tx       = repository_->Begin();
  auto forecast = PredictRoas(*tx, scope, lookback_days);
  tx->Commit();
  return forecast;
}

RoasForecast PredictionEngine::PredictRoas(db::Transaction& tx, const db::model::Scope& scope, uint32_t lookback_days) {
  const uint32_t days = lookback_days == 0 ? settings_.lookback_days : lookback_days;

  db::RoasMetricsQuery query;
  query.scope    = scope;
  query.since_ms = util::ToUnixMillis(clock_->Now() - std::chrono::hours(24) * days);
  query.limit    = days;

  return Forecast(repository_->ListRoasMetrics(tx, query));
}

RoasForecast PredictionEngine::Forecast(const std::vector<db::model::RoasMetricsRecord>& history) const {
  RoasForecast forecast;
  if (history.empty()) {
    forecast.predicted_roas = default_prior_roas_;
    return forecast;
  }

  // Seed with the oldest value and fold toward the newest.
  double ema = history.back().actual_roas;
  for (auto it = std::next(history.rbegin()); it != history.rend(); ++it) {
    ema = settings_.ema_alpha * it->actual_roas + (1.0 - settings_.ema_alpha) * ema;
  }

  forecast.predicted_roas    = ema;
  forecast.historical_points = history.size();
  forecast.confidence        = std::min(static_cast<double>(history.size()) / static_cast<double>(settings_.full_confidence_at), 1.0);
  forecast.trend             = history.front().actual_roas > history.back().actual_roas ? "increasing" : "decreasing";
  return forecast;
}

ConversionProbability PredictionEngine::CalculateConversionProbability(uint64_t clicks, uint64_t conversions, double prior_alpha,
                                                                       double prior_beta) {
  if (clicks == 0) return {};
  if (conversions > clicks) {
    throw util::ValidationError("conversion probability: conversions cannot exceed clicks");
  }
  if (prior_alpha <= 0.0 || prior_beta <= 0.0) {
    throw util::ValidationError("conversion probability: prior parameters must be positive");
  }

  const double alpha = prior_alpha + static_cast<double>(conversions);
  const double beta  = prior_beta + static_cast<double>(clicks - conversions);

  const boost::math::beta_distribution<double> posterior(alpha, beta);

  ConversionProbability out;
  out.probability = alpha / (alpha + beta);
  out.ci_low      = boost::math::quantile(posterior, 0.025);
  out.ci_high     = boost::math::quantile(posterior, 0.975);
  return out;
}

ExpectedValue PredictionEngine::CalculateExpectedValue(double conversion_probability, double avg_order_value, double cost_per_click) {
  ExpectedValue out;
  out.expected_revenue = conversion_probability * avg_order_value;
  out.expected_value   = out.expected_revenue - cost_per_click;
  out.expected_cost    = cost_per_click;
  out.breakeven_rate   = avg_order_value > 0.0 ? cost_per_click / avg_order_value : 0.0;
  out.is_profitable    = out.expected_value > 0.0;
  return out;
}

} // namespace autopilot::analytics
