#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/scope.hpp"

namespace autopilot::db::model {

/*
  Daily ROAS snapshot. Unique per (scope, date_ms); written once.
*/
struct RoasMetricsRecord {
  uint64_t id = 0;
  Scope    scope;
  uint64_t date_ms = 0; // UTC midnight

  double actual_roas              = 0.0;
  double smoothed_roas            = 0.0;
  double predicted_roas           = 0.0;
  double confidence_score         = 0.0;
  double confidence_interval_low  = 0.0;
  double confidence_interval_high = 0.0;

  uint64_t    sample_size = 0;
  bool        is_outlier  = false;
  std::string outlier_reason;

  std::string performance_tier;
  std::string recommendation;
  double      recommended_budget_change_pct = 0.0;

  // window aggregates
  uint64_t impressions       = 0;
  uint64_t clicks            = 0;
  uint64_t conversions       = 0;
  double   total_cost_usd    = 0.0;
  double   total_revenue_usd = 0.0;

  double conversion_probability     = 0.0;
  double session_quality_score      = 0.0;
  double user_retention_probability = 0.0;
  double lifetime_value_estimate    = 0.0;
  double blended_ctr                = 0.0;
  double blended_cpc                = 0.0;
  double blended_cpm                = 0.0;

  uint64_t created_at_ms = 0;
};

} // namespace autopilot::db::model
