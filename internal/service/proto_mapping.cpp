#include "proto_mapping.hpp"

#include "internal/model/conversions.hpp"
#include "internal/util/time.hpp"

namespace autopilot::service {

namespace {

void SetTime(uint64_t ms, google::protobuf::Timestamp* out) {
  if (ms != 0) {
    *out = util::ToProto(util::FromUnixMillis(ms));
  }
}

} // namespace

db::model::Scope FromProto(const autopilot::v1::Scope& scope) {
  db::model::Scope out;
  out.campaign_id = scope.campaign_id();
  out.adset_id    = scope.adset_id();
  out.ad_id       = scope.ad_id();
  return out;
}

autopilot::v1::Scope ToProto(const db::model::Scope& scope) {
  autopilot::v1::Scope out;
  out.set_campaign_id(scope.campaign_id);
  out.set_adset_id(scope.adset_id);
  out.set_ad_id(scope.ad_id);
  return out;
}

autopilot::v1::OptimizationAction ToProto(const db::model::ActionRecord& action) {
  autopilot::v1::OptimizationAction out;
  out.set_action_id(action.action_id);
  out.set_type(model::ToProto(action.type));
  out.set_status(model::ToProto(action.status));
  out.set_target_level(model::ToProto(action.target_level));
  out.set_target_id(action.target_id);
  out.set_campaign_id(action.campaign_id);
  out.set_adset_id(action.adset_id);
  out.set_ad_id(action.ad_id);

  out.set_amount_pct(action.amount_pct);
  out.set_amount_usd(action.amount_usd);
  out.set_old_budget_usd(action.old_budget_usd);
  out.set_new_budget_usd(action.new_budget_usd);

  out.set_reason(action.reason);
  out.set_reason_details(action.reason_details);
  out.set_confidence(action.confidence);
  out.set_roas_value(action.roas_value);
  out.set_safety_score(action.safety_score);

  out.set_created_by(action.created_by);
  out.set_approved_by(action.approved_by);
  out.set_executed_by(action.executed_by);

  if (action.execution_result) *out.mutable_execution_result() = *action.execution_result;
  out.set_execution_error(action.execution_error);
  if (action.reallocation_plan) *out.mutable_reallocation_plan() = *action.reallocation_plan;
  for (const auto& id : action.affected_ad_ids) out.add_affected_ad_ids(id);

  SetTime(action.created_at_ms, out.mutable_created_at());
  SetTime(action.approved_at_ms, out.mutable_approved_at());
  SetTime(action.executed_at_ms, out.mutable_executed_at());
  SetTime(action.expires_at_ms, out.mutable_expires_at());
  return out;
}

autopilot::v1::RoasMetrics ToProto(const db::model::RoasMetricsRecord& record) {
  autopilot::v1::RoasMetrics out;
  *out.mutable_scope() = ToProto(record.scope);
  SetTime(record.date_ms, out.mutable_date());

  out.set_actual_roas(record.actual_roas);
  out.set_smoothed_roas(record.smoothed_roas);
  out.set_predicted_roas(record.predicted_roas);
  out.set_confidence_score(record.confidence_score);
  out.set_confidence_interval_low(record.confidence_interval_low);
  out.set_confidence_interval_high(record.confidence_interval_high);
  out.set_sample_size(record.sample_size);
  out.set_is_outlier(record.is_outlier);
  out.set_outlier_reason(record.outlier_reason);

  out.set_performance_tier(record.performance_tier);
  out.set_recommendation(record.recommendation);
  out.set_recommended_budget_change_pct(record.recommended_budget_change_pct);

  out.set_conversion_probability(record.conversion_probability);
  out.set_session_quality_score(record.session_quality_score);
  out.set_user_retention_probability(record.user_retention_probability);
  out.set_lifetime_value_estimate(record.lifetime_value_estimate);
  out.set_blended_ctr(record.blended_ctr);
  out.set_blended_cpc(record.blended_cpc);
  out.set_blended_cpm(record.blended_cpm);
  return out;
}

autopilot::v1::RoasResult ToProto(const analytics::RoasResult& result) {
  autopilot::v1::RoasResult out;
  out.set_actual_roas(result.actual_roas);
  out.set_smoothed_roas(result.smoothed_roas);
  out.set_total_revenue_usd(result.total_revenue_usd);
  out.set_total_cost_usd(result.total_cost_usd);
  out.set_total_conversions(result.total_conversions);
  out.set_conversion_rate(result.conversion_rate);
  out.set_confidence_interval_low(result.confidence_interval_low);
  out.set_confidence_interval_high(result.confidence_interval_high);
  out.set_is_outlier(result.is_outlier);
  out.set_outlier_reason(result.outlier_reason);
  out.set_sample_size(result.sample_size);
  *out.mutable_date_start() = util::ToProto(result.date_start);
  *out.mutable_date_end()   = util::ToProto(result.date_end);
  return out;
}

} // namespace autopilot::service
