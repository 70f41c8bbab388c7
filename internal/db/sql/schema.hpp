#pragma once

#include <string>
#include <vector>

namespace autopilot::db::sql {

/*
  Bootstrap DDL, applied with CREATE ... IF NOT EXISTS on every start.

  Enums are stored as their integer value; execution_result,
  reallocation_plan and affected_ad_ids as protobuf JSON text.
  Empty hierarchy ids are '' (never NULL) so the (scope, date)
  uniqueness constraint holds.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS entities (id TEXT PRIMARY KEY, level INTEGER NOT NULL, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', name TEXT NOT NULL DEFAULT '', status TEXT NOT NULL, daily_budget_usd REAL NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS insights (id INTEGER PRIMARY KEY AUTOINCREMENT, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', date_start_ms INTEGER NOT NULL, date_stop_ms INTEGER NOT NULL, impressions INTEGER NOT NULL, clicks INTEGER NOT NULL, spend_usd REAL NOT NULL);",
      "CREATE TABLE IF NOT EXISTS outcomes (outcome_id TEXT PRIMARY KEY, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', value_usd REAL NOT NULL, conversion_type TEXT NOT NULL, event_timestamp_ms INTEGER NOT NULL, session_id TEXT NOT NULL DEFAULT '', session_duration_seconds REAL, attribution_model TEXT NOT NULL, attribution_weight REAL NOT NULL);",
      "CREATE TABLE IF NOT EXISTS roas_metrics (id INTEGER PRIMARY KEY AUTOINCREMENT, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', date_ms INTEGER NOT NULL, actual_roas REAL NOT NULL, smoothed_roas REAL NOT NULL, predicted_roas REAL NOT NULL, confidence_score REAL NOT NULL, confidence_interval_low REAL NOT NULL, confidence_interval_high REAL NOT NULL, sample_size INTEGER NOT NULL, is_outlier INTEGER NOT NULL, outlier_reason TEXT NOT NULL DEFAULT '', performance_tier TEXT NOT NULL DEFAULT '', recommendation TEXT NOT NULL DEFAULT '', recommended_budget_change_pct REAL NOT NULL DEFAULT 0, impressions INTEGER NOT NULL DEFAULT 0, clicks INTEGER NOT NULL DEFAULT 0, conversions INTEGER NOT NULL DEFAULT 0, total_cost_usd REAL NOT NULL DEFAULT 0, total_revenue_usd REAL NOT NULL DEFAULT 0, conversion_probability REAL NOT NULL DEFAULT 0, session_quality_score REAL NOT NULL DEFAULT 0, user_retention_probability REAL NOT NULL DEFAULT 0, lifetime_value_estimate REAL NOT NULL DEFAULT 0, blended_ctr REAL NOT NULL DEFAULT 0, blended_cpc REAL NOT NULL DEFAULT 0, blended_cpm REAL NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, UNIQUE(campaign_id, adset_id, ad_id, date_ms));",
      "CREATE TABLE IF NOT EXISTS actions (action_id TEXT PRIMARY KEY, type INTEGER NOT NULL, status INTEGER NOT NULL, target_level INTEGER NOT NULL, target_id TEXT NOT NULL, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', amount_pct REAL NOT NULL DEFAULT 0, amount_usd REAL NOT NULL DEFAULT 0, old_budget_usd REAL NOT NULL DEFAULT 0, new_budget_usd REAL NOT NULL DEFAULT 0, reason TEXT NOT NULL DEFAULT '', reason_details TEXT NOT NULL DEFAULT '', confidence REAL NOT NULL DEFAULT 0, roas_value REAL NOT NULL DEFAULT 0, safety_score REAL NOT NULL DEFAULT 0, created_by TEXT NOT NULL DEFAULT '', approved_by TEXT NOT NULL DEFAULT '', executed_by TEXT NOT NULL DEFAULT '', execution_result TEXT, execution_error TEXT NOT NULL DEFAULT '', reallocation_plan TEXT, affected_ad_ids TEXT NOT NULL DEFAULT '[]', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL DEFAULT 0, approved_at_ms INTEGER NOT NULL DEFAULT 0, executed_at_ms INTEGER NOT NULL DEFAULT 0, expires_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS ledger_events (id INTEGER PRIMARY KEY AUTOINCREMENT, event_type TEXT NOT NULL, action_id TEXT NOT NULL DEFAULT '', entity_id TEXT NOT NULL DEFAULT '', actor TEXT NOT NULL DEFAULT '', payload_json TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_actions_status ON actions(status);",
      "CREATE INDEX IF NOT EXISTS idx_actions_target_type ON actions(target_id, type, status);",
      "CREATE INDEX IF NOT EXISTS idx_insights_campaign_date ON insights(campaign_id, date_start_ms);",
      "CREATE INDEX IF NOT EXISTS idx_outcomes_campaign_ts ON outcomes(campaign_id, event_timestamp_ms);",
      "CREATE INDEX IF NOT EXISTS idx_roas_metrics_campaign_date ON roas_metrics(campaign_id, date_ms);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS entities (id TEXT PRIMARY KEY, level SMALLINT NOT NULL, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', name TEXT NOT NULL DEFAULT '', status TEXT NOT NULL, daily_budget_usd DOUBLE PRECISION NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS insights (id BIGSERIAL PRIMARY KEY, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', date_start_ms BIGINT NOT NULL, date_stop_ms BIGINT NOT NULL, impressions BIGINT NOT NULL, clicks BIGINT NOT NULL, spend_usd DOUBLE PRECISION NOT NULL);",
      "CREATE TABLE IF NOT EXISTS outcomes (outcome_id TEXT PRIMARY KEY, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', value_usd DOUBLE PRECISION NOT NULL, conversion_type TEXT NOT NULL, event_timestamp_ms BIGINT NOT NULL, session_id TEXT NOT NULL DEFAULT '', session_duration_seconds DOUBLE PRECISION, attribution_model TEXT NOT NULL, attribution_weight DOUBLE PRECISION NOT NULL);",
      "CREATE TABLE IF NOT EXISTS roas_metrics (id BIGSERIAL PRIMARY KEY, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', date_ms BIGINT NOT NULL, actual_roas DOUBLE PRECISION NOT NULL, smoothed_roas DOUBLE PRECISION NOT NULL, predicted_roas DOUBLE PRECISION NOT NULL, confidence_score DOUBLE PRECISION NOT NULL, confidence_interval_low DOUBLE PRECISION NOT NULL, confidence_interval_high DOUBLE PRECISION NOT NULL, sample_size BIGINT NOT NULL, is_outlier BOOLEAN NOT NULL, outlier_reason TEXT NOT NULL DEFAULT '', performance_tier TEXT NOT NULL DEFAULT '', recommendation TEXT NOT NULL DEFAULT '', recommended_budget_change_pct DOUBLE PRECISION NOT NULL DEFAULT 0, impressions BIGINT NOT NULL DEFAULT 0, clicks BIGINT NOT NULL DEFAULT 0, conversions BIGINT NOT NULL DEFAULT 0, total_cost_usd DOUBLE PRECISION NOT NULL DEFAULT 0, total_revenue_usd DOUBLE PRECISION NOT NULL DEFAULT 0, conversion_probability DOUBLE PRECISION NOT NULL DEFAULT 0, session_quality_score DOUBLE PRECISION NOT NULL DEFAULT 0, user_retention_probability DOUBLE PRECISION NOT NULL DEFAULT 0, lifetime_value_estimate DOUBLE PRECISION NOT NULL DEFAULT 0, blended_ctr DOUBLE PRECISION NOT NULL DEFAULT 0, blended_cpc DOUBLE PRECISION NOT NULL DEFAULT 0, blended_cpm DOUBLE PRECISION NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, UNIQUE(campaign_id, adset_id, ad_id, date_ms));",
      "CREATE TABLE IF NOT EXISTS actions (action_id TEXT PRIMARY KEY, type SMALLINT NOT NULL, status SMALLINT NOT NULL, target_level SMALLINT NOT NULL, target_id TEXT NOT NULL, campaign_id TEXT NOT NULL DEFAULT '', adset_id TEXT NOT NULL DEFAULT '', ad_id TEXT NOT NULL DEFAULT '', amount_pct DOUBLE PRECISION NOT NULL DEFAULT 0, amount_usd DOUBLE PRECISION NOT NULL DEFAULT 0, old_budget_usd DOUBLE PRECISION NOT NULL DEFAULT 0, new_budget_usd DOUBLE PRECISION NOT NULL DEFAULT 0, reason TEXT NOT NULL DEFAULT '', reason_details TEXT NOT NULL DEFAULT '', confidence DOUBLE PRECISION NOT NULL DEFAULT 0, roas_value DOUBLE PRECISION NOT NULL DEFAULT 0, safety_score DOUBLE PRECISION NOT NULL DEFAULT 0, created_by TEXT NOT NULL DEFAULT '', approved_by TEXT NOT NULL DEFAULT '', executed_by TEXT NOT NULL DEFAULT '', execution_result JSONB, execution_error TEXT NOT NULL DEFAULT '', reallocation_plan JSONB, affected_ad_ids JSONB NOT NULL DEFAULT '[]', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL DEFAULT 0, approved_at_ms BIGINT NOT NULL DEFAULT 0, executed_at_ms BIGINT NOT NULL DEFAULT 0, expires_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS ledger_events (id BIGSERIAL PRIMARY KEY, event_type TEXT NOT NULL, action_id TEXT NOT NULL DEFAULT '', entity_id TEXT NOT NULL DEFAULT '', actor TEXT NOT NULL DEFAULT '', payload_json JSONB NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_actions_status ON actions(status);",
      "CREATE INDEX IF NOT EXISTS idx_actions_target_type ON actions(target_id, type, status);",
      "CREATE INDEX IF NOT EXISTS idx_insights_campaign_date ON insights(campaign_id, date_start_ms);",
      "CREATE INDEX IF NOT EXISTS idx_outcomes_campaign_ts ON outcomes(campaign_id, event_timestamp_ms);",
      "CREATE INDEX IF NOT EXISTS idx_roas_metrics_campaign_date ON roas_metrics(campaign_id, date_ms);"};
  return kSchema;
}

} // namespace autopilot::db::sql
