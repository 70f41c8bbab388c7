#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace autopilot::analytics {

struct OutlierVerdict {
  bool        is_outlier = false;
  std::string reason;
};

struct RoasResult {
  double   actual_roas       = 0.0;
  double   smoothed_roas     = 0.0;
  double   total_revenue_usd = 0.0;
  double   total_cost_usd    = 0.0;
  uint64_t total_conversions = 0;
  uint64_t impressions       = 0;
  uint64_t clicks            = 0;
  double   conversion_rate   = 0.0;

  double confidence_interval_low  = 0.0;
  double confidence_interval_high = 0.0;

  bool        is_outlier = false;
  std::string outlier_reason;

  uint64_t sample_size = 0;

  util::TimePoint date_start;
  util::TimePoint date_end;
};

/*
  RoasCalculator

  Smoothed, confidence-bounded ROAS for one scope and window:

    raw      = revenue / spend                     (0 when spend == 0)
    smoothed = Bayesian blend toward the prior, weighted by conversions
    CI       = bootstrap percentiles of resampled revenue / spend

  Read-only. The bootstrap RNG is the only mutable state.
*/
class RoasCalculator {
 public:
  RoasCalculator(config::RoasSettings settings, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                 std::optional<uint64_t> seed = std::nullopt);

  // Unset bounds default to [now - default_window_days, now).
  RoasResult Calculate(const db::model::Scope& scope, std::optional<util::TimePoint> date_start = std::nullopt,
                       std::optional<util::TimePoint> date_end = std::nullopt);

  RoasResult Calculate(db::Transaction& tx, const db::model::Scope& scope, util::TimePoint date_start, util::TimePoint date_end);

  double                    Smooth(double raw_roas, uint64_t conversions) const;
  std::pair<double, double> ConfidenceInterval(const std::vector<double>& values, double spend);

  // Ordered rules; the first match wins.
  static OutlierVerdict DetectOutlier(double roas, uint64_t conversions, double spend);

  const config::RoasSettings& Settings() const {
    return settings_;
  }

 private:
  std::pair<util::TimePoint, util::TimePoint> ResolveWindow(std::optional<util::TimePoint> date_start,
                                                            std::optional<util::TimePoint> date_end) const;

  config::RoasSettings            settings_;
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;

  std::mutex      rng_mutex_;
  std::mt19937_64 rng_;
};

} // namespace autopilot::analytics
