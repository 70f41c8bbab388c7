#include "roas_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>

#include "internal/util/errors.hpp"

namespace autopilot::analytics {

namespace {

constexpr double kConfidenceLevel = 0.95;

// Linear interpolation between closest ranks; `sorted` must be ascending.
double Percentile(const std::vector<double>& sorted, double pct) {
  if (sorted.empty()) return 0.0;

  const double pos   = pct / 100.0 * static_cast<double>(sorted.size() - 1);
  const auto   lower = static_cast<size_t>(std::floor(pos));
  const auto   upper = std::min(lower + 1, sorted.size() - 1);
  const double frac  = pos - static_cast<double>(lower);
  return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

struct OutlierRule {
  std::function<bool(double roas, uint64_t conversions, double spend)> matches;
  std::function<std::string(uint64_t conversions)>                     reason;
};

const std::vector<OutlierRule>& OutlierRules() {
  static const std::vector<OutlierRule> kRules = {
      {[](double roas, uint64_t, double) { return roas > 50.0; }, [](uint64_t) { return std::string("Extremely high ROAS (>50x)"); }},
      {[](double roas, uint64_t, double) { return roas < 0.0; }, [](uint64_t) { return std::string("Negative ROAS"); }},
      {[](double roas, uint64_t, double spend) { return spend < 10.0 && roas > 10.0; },
       [](uint64_t) { return std::string("Low spend (<$10) with high ROAS"); }},
      {[](double roas, uint64_t conversions, double) { return conversions < 3 && roas > 5.0; },
       [](uint64_t conversions) { return "Too few conversions (" + std::to_string(conversions) + ") for reliable ROAS"; }},
  };
  return kRules;
}

} // namespace

RoasCalculator::RoasCalculator(config::RoasSettings settings, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                               std::optional<uint64_t> seed)
    : settings_(std::move(settings)), repository_(std::move(repository)), clock_(std::move(clock)),
      rng_(seed ? *seed : std::random_device{}()) {
}

RoasResult RoasCalculator::Calculate(const db::model::Scope& scope, std::optional<util::TimePoint> date_start,
                                     std::optional<util::TimePoint> date_end) {
  const auto [start, end] = ResolveWindow(date_start, date_end);

  auto tx     = repository_->Begin();
  auto result = Calculate(*tx, scope, start, end);
  tx->Commit();
  return result;
}

RoasResult RoasCalculator::Calculate(db::Transaction& tx, const db::model::Scope& scope, util::TimePoint date_start, util::TimePoint date_end) {
  if (date_end <= date_start) {
    throw util::ValidationError("calculate roas: date_end must be after date_start");
  }

  const auto start_ms = util::ToUnixMillis(date_start);
  const auto end_ms   = util::ToUnixMillis(date_end);

  const auto outcomes = repository_->ListOutcomes(tx, scope, start_ms, end_ms);
  const auto insights = repository_->ListInsights(tx, scope, start_ms, end_ms);

  RoasResult result;
  result.date_start = date_start;
  result.date_end   = date_end;

  std::vector<double> values;
  values.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    values.push_back(outcome.value_usd);
    result.total_revenue_usd += outcome.value_usd;
  }
  for (const auto& insight : insights) {
    result.total_cost_usd += insight.spend_usd;
    result.impressions += insight.impressions;
    result.clicks += insight.clicks;
  }

  result.total_conversions = outcomes.size();
  result.sample_size       = outcomes.size();
  result.actual_roas       = result.total_cost_usd > 0.0 ? result.total_revenue_usd / result.total_cost_usd : 0.0;
  result.smoothed_roas     = Smooth(result.actual_roas, result.total_conversions);

  const auto [low, high]          = ConfidenceInterval(values, result.total_cost_usd);
  result.confidence_interval_low  = low;
  result.confidence_interval_high = high;

  const auto verdict    = DetectOutlier(result.actual_roas, result.total_conversions, result.total_cost_usd);
  result.is_outlier     = verdict.is_outlier;
  result.outlier_reason = verdict.reason;

  result.conversion_rate = result.clicks > 0 ? static_cast<double>(result.total_conversions) / static_cast<double>(result.clicks) : 0.0;
  return result;
}

double RoasCalculator::Smooth(double raw_roas, uint64_t conversions) const {
  if (conversions == 0) return settings_.default_prior_roas;

  const double data_weight  = std::min(static_cast<double>(conversions) / static_cast<double>(settings_.min_sample_size), 1.0);
  const double prior_weight = settings_.prior_weight_base * (1.0 - data_weight);
  if (prior_weight == 0.0) return raw_roas;

  return (prior_weight * settings_.default_prior_roas + data_weight * raw_roas) / (prior_weight + data_weight);
}

std::pair<double, double> RoasCalculator::ConfidenceInterval(const std::vector<double>& values, double spend) {
  if (values.size() < 3 || spend == 0.0) return {0.0, 0.0};

  std::vector<double> samples;
  samples.reserve(settings_.bootstrap_samples);
  {
    std::lock_guard                       lock(rng_mutex_);
    std::uniform_int_distribution<size_t> pick(0, values.size() - 1);
    for (uint32_t i = 0; i < settings_.bootstrap_samples; ++i) {
      double revenue = 0.0;
      for (size_t j = 0; j < values.size(); ++j) {
        revenue += values[pick(rng_)];
      }
      samples.push_back(revenue / spend);
    }
  }
  std::sort(samples.begin(), samples.end());

  const double alpha = 1.0 - kConfidenceLevel;
  return {Percentile(samples, alpha / 2.0 * 100.0), Percentile(samples, (1.0 - alpha / 2.0) * 100.0)};
}

OutlierVerdict RoasCalculator::DetectOutlier(double roas, uint64_t conversions, double spend) {
  for (const auto& rule : OutlierRules()) {
    if (rule.matches(roas, conversions, spend)) {
      return {true, rule.reason(conversions)};
    }
  }
  return {};
}

std::pair<util::TimePoint, util::TimePoint> RoasCalculator::ResolveWindow(std::optional<util::TimePoint> date_start,
                                                                          std::optional<util::TimePoint> date_end) const {
  const auto end   = date_end.value_or(clock_->Now());
  const auto start = date_start.value_or(end - std::chrono::hours(24) * settings_.default_window_days);
  return {start, end};
}

} // namespace autopilot::analytics
