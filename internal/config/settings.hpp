#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace autopilot::config {

/*
  Settings

  Immutable threshold bundle built once at startup from RuntimeConfig.
  Engines take a copy in their constructor; nothing reads thresholds
  from global state.
*/

struct RoasSettings {
  uint32_t min_sample_size     = 30;
  double   prior_weight_base   = 0.2;
  double   default_prior_roas  = 2.0;
  uint32_t bootstrap_samples   = 1000;
  uint32_t default_window_days = 7;
};

struct PredictionSettings {
  double   ema_alpha          = 0.3;
  uint32_t lookback_days      = 30;
  uint32_t full_confidence_at = 30;
};

struct OptimizerSettings {
  double   scale_up_min_roas           = 2.0;
  double   scale_down_max_roas         = 1.5;
  double   pause_roas                  = 0.8;
  double   max_daily_change_pct        = 0.20;
  double   min_confidence              = 0.65;
  uint32_t reallocate_min_ads          = 3;
  double   reallocate_threshold_diff   = 1.5;
  uint32_t max_actions_per_campaign    = 5;
  uint32_t embargo_hours               = 48;
  uint32_t cooldown_hours              = 24;
  uint32_t action_ttl_hours            = 48;
  uint32_t lookback_days               = 7;
  uint32_t max_actions_per_run         = 50;
  double   reallocation_min_confidence = 0.6;
};

struct PolicySettings {
  double      max_daily_change_pct             = 0.20;
  double      max_auto_change_pct              = 0.10;
  double      max_campaign_budget_usd          = 5000.0;
  double      hard_stop_roas                   = 0.9;
  double      hard_stop_confidence             = 0.70;
  double      min_spend_usd                    = 100.0;
  std::string home_market                      = "ES";
  double      min_home_pct                     = 0.35;
  double      max_single_country_pct           = 0.70;
  uint32_t    creative_embargo_hours           = 48;
  bool        require_human_approval_creatives = true;
};

struct SafetySettings {
  double   max_daily_spend_usd              = 10000.0;
  uint32_t min_age_hours                    = 48;
  uint64_t min_impressions                  = 1000;
  double   min_spend_usd                    = 100.0;
  uint32_t action_cooldown_hours            = 24;
  bool     require_human_approval_creatives = true;
};

enum class WorkerMode {
  kSuggest,
  kAuto,
};

std::string ToString(WorkerMode mode);
WorkerMode  ParseWorkerMode(const std::string& value);

struct WorkerSettings {
  bool       enabled                = true;
  WorkerMode mode                   = WorkerMode::kSuggest;
  uint32_t   interval_seconds       = 1800;
  uint32_t   error_backoff_seconds  = 60;
  uint32_t   max_campaigns_per_tick = 100;
  uint32_t   max_actions_per_tick   = 50;
  double     auto_min_confidence    = 0.75;
  uint32_t   metrics_lookback_days  = 7;
};

struct Settings {
  RoasSettings       roas;
  PredictionSettings prediction;
  OptimizerSettings  optimizer;
  PolicySettings     policy;
  SafetySettings     safety;
  WorkerSettings     worker;
};

// Unset fields keep the defaults above. Throws std::invalid_argument on
// out-of-range values.
Settings BuildSettings(const autopilot::runtime::config::RuntimeConfig& config);

} // namespace autopilot::config
