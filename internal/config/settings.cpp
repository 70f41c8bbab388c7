#include "settings.hpp"

#include <stdexcept>

namespace autopilot::config {

namespace {

void RequireFraction(double value, const char* section, const char* field) {
  if (value < 0.0 || value > 1.0) {
    throw std::invalid_argument(std::string("invalid setting ") + section + "." + field + "=" + std::to_string(value) + " (expected 0..1)");
  }
}

void RequirePositive(double value, const char* section, const char* field) {
  if (value <= 0.0) {
    throw std::invalid_argument(std::string("invalid setting ") + section + "." + field + "=" + std::to_string(value) + " (expected > 0)");
  }
}

RoasSettings BuildRoas(const autopilot::runtime::config::RoasConfig& c) {
  RoasSettings s;
  if (c.has_min_sample_size()) s.min_sample_size = c.min_sample_size();
  if (c.has_prior_weight_base()) s.prior_weight_base = c.prior_weight_base();
  if (c.has_default_prior_roas()) s.default_prior_roas = c.default_prior_roas();
  if (c.has_bootstrap_samples()) s.bootstrap_samples = c.bootstrap_samples();
  if (c.has_default_window_days()) s.default_window_days = c.default_window_days();

  RequirePositive(s.min_sample_size, "roas", "min_sample_size");
  RequirePositive(s.bootstrap_samples, "roas", "bootstrap_samples");
  RequirePositive(s.default_window_days, "roas", "default_window_days");
  return s;
}

PredictionSettings BuildPrediction(const autopilot::runtime::config::PredictionConfig& c) {
  PredictionSettings s;
  if (c.has_ema_alpha()) s.ema_alpha = c.ema_alpha();
  if (c.has_lookback_days()) s.lookback_days = c.lookback_days();
  if (c.has_full_confidence_at()) s.full_confidence_at = c.full_confidence_at();

  RequireFraction(s.ema_alpha, "prediction", "ema_alpha");
  RequirePositive(s.full_confidence_at, "prediction", "full_confidence_at");
  return s;
}

OptimizerSettings BuildOptimizer(const autopilot::runtime::config::OptimizerConfig& c) {
  OptimizerSettings s;
  if (c.has_scale_up_min_roas()) s.scale_up_min_roas = c.scale_up_min_roas();
  if (c.has_scale_down_max_roas()) s.scale_down_max_roas = c.scale_down_max_roas();
  if (c.has_pause_roas()) s.pause_roas = c.pause_roas();
  if (c.has_max_daily_change_pct()) s.max_daily_change_pct = c.max_daily_change_pct();
  if (c.has_min_confidence()) s.min_confidence = c.min_confidence();
  if (c.has_reallocate_min_ads()) s.reallocate_min_ads = c.reallocate_min_ads();
  if (c.has_reallocate_threshold_diff()) s.reallocate_threshold_diff = c.reallocate_threshold_diff();
  if (c.has_max_actions_per_campaign()) s.max_actions_per_campaign = c.max_actions_per_campaign();
  if (c.has_embargo_hours()) s.embargo_hours = c.embargo_hours();
  if (c.has_cooldown_hours()) s.cooldown_hours = c.cooldown_hours();
  if (c.has_action_ttl_hours()) s.action_ttl_hours = c.action_ttl_hours();
  if (c.has_lookback_days()) s.lookback_days = c.lookback_days();
  if (c.has_max_actions_per_run()) s.max_actions_per_run = c.max_actions_per_run();
  if (c.has_reallocation_min_confidence()) s.reallocation_min_confidence = c.reallocation_min_confidence();

  RequireFraction(s.max_daily_change_pct, "optimizer", "max_daily_change_pct");
  RequireFraction(s.min_confidence, "optimizer", "min_confidence");
  RequireFraction(s.reallocation_min_confidence, "optimizer", "reallocation_min_confidence");
  RequirePositive(s.action_ttl_hours, "optimizer", "action_ttl_hours");
  RequirePositive(s.cooldown_hours, "optimizer", "cooldown_hours");
  if (s.pause_roas > s.scale_down_max_roas) {
    throw std::invalid_argument("invalid setting optimizer.pause_roas: must not exceed scale_down_max_roas");
  }
  return s;
}

PolicySettings BuildPolicy(const autopilot::runtime::config::PolicyConfig& c) {
  PolicySettings s;
  if (c.has_max_daily_change_pct()) s.max_daily_change_pct = c.max_daily_change_pct();
  if (c.has_max_auto_change_pct()) s.max_auto_change_pct = c.max_auto_change_pct();
  if (c.has_max_campaign_budget_usd()) s.max_campaign_budget_usd = c.max_campaign_budget_usd();
  if (c.has_hard_stop_roas()) s.hard_stop_roas = c.hard_stop_roas();
  if (c.has_hard_stop_confidence()) s.hard_stop_confidence = c.hard_stop_confidence();
  if (c.has_min_spend_usd()) s.min_spend_usd = c.min_spend_usd();
  if (c.has_home_market()) s.home_market = c.home_market();
  if (c.has_min_home_pct()) s.min_home_pct = c.min_home_pct();
  if (c.has_max_single_country_pct()) s.max_single_country_pct = c.max_single_country_pct();
  if (c.has_creative_embargo_hours()) s.creative_embargo_hours = c.creative_embargo_hours();
  if (c.has_require_human_approval_creatives()) s.require_human_approval_creatives = c.require_human_approval_creatives();

  RequireFraction(s.max_daily_change_pct, "policy", "max_daily_change_pct");
  RequireFraction(s.max_auto_change_pct, "policy", "max_auto_change_pct");
  RequireFraction(s.hard_stop_confidence, "policy", "hard_stop_confidence");
  RequireFraction(s.min_home_pct, "policy", "min_home_pct");
  RequireFraction(s.max_single_country_pct, "policy", "max_single_country_pct");
  RequirePositive(s.max_campaign_budget_usd, "policy", "max_campaign_budget_usd");
  return s;
}

SafetySettings BuildSafety(const autopilot::runtime::config::SafetyConfig& c) {
  SafetySettings s;
  if (c.has_max_daily_spend_usd()) s.max_daily_spend_usd = c.max_daily_spend_usd();
  if (c.has_min_age_hours()) s.min_age_hours = c.min_age_hours();
  if (c.has_min_impressions()) s.min_impressions = c.min_impressions();
  if (c.has_min_spend_usd()) s.min_spend_usd = c.min_spend_usd();
  if (c.has_action_cooldown_hours()) s.action_cooldown_hours = c.action_cooldown_hours();
  if (c.has_require_human_approval_creatives()) s.require_human_approval_creatives = c.require_human_approval_creatives();

  RequirePositive(s.max_daily_spend_usd, "safety", "max_daily_spend_usd");
  RequirePositive(s.action_cooldown_hours, "safety", "action_cooldown_hours");
  return s;
}

WorkerSettings BuildWorker(const autopilot::runtime::config::WorkerConfig& c) {
  WorkerSettings s;
  if (c.has_enabled()) s.enabled = c.enabled();
  if (c.has_mode()) s.mode = ParseWorkerMode(c.mode());
  if (c.has_interval_seconds()) s.interval_seconds = c.interval_seconds();
  if (c.has_error_backoff_seconds()) s.error_backoff_seconds = c.error_backoff_seconds();
  if (c.has_max_campaigns_per_tick()) s.max_campaigns_per_tick = c.max_campaigns_per_tick();
  if (c.has_max_actions_per_tick()) s.max_actions_per_tick = c.max_actions_per_tick();
  if (c.has_auto_min_confidence()) s.auto_min_confidence = c.auto_min_confidence();
  if (c.has_metrics_lookback_days()) s.metrics_lookback_days = c.metrics_lookback_days();

  RequirePositive(s.interval_seconds, "worker", "interval_seconds");
  RequirePositive(s.error_backoff_seconds, "worker", "error_backoff_seconds");
  RequireFraction(s.auto_min_confidence, "worker", "auto_min_confidence");
  return s;
}

} // namespace

std::string ToString(WorkerMode mode) {
  switch (mode) {
    case WorkerMode::kSuggest:
      return "suggest";
    case WorkerMode::kAuto:
      return "auto";
  }
  return "suggest";
}

WorkerMode ParseWorkerMode(const std::string& value) {
  if (value == "suggest") {
    return WorkerMode::kSuggest;
  }
  if (value == "auto") {
    return WorkerMode::kAuto;
  }
  throw std::invalid_argument("invalid worker mode '" + value + "' (expected suggest|auto)");
}

Settings BuildSettings(const autopilot::runtime::config::RuntimeConfig& config) {
  Settings settings;
  settings.roas       = BuildRoas(config.roas());
  settings.prediction = BuildPrediction(config.prediction());
  settings.optimizer  = BuildOptimizer(config.optimizer());
  settings.policy     = BuildPolicy(config.policy());
  settings.safety     = BuildSafety(config.safety());
  settings.worker     = BuildWorker(config.worker());
  return settings;
}

} // namespace autopilot::config
