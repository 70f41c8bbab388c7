#pragma once

namespace autopilot::db::postgres {

// JSONB columns are read back as text.
inline constexpr const char* kActionSelectColumns =
    "action_id,type,status,target_level,target_id,campaign_id,adset_id,ad_id,amount_pct,amount_usd,old_budget_usd,new_budget_usd,reason,"
    "reason_details,confidence,roas_value,safety_score,created_by,approved_by,executed_by,execution_result::text,execution_error,"
    "reallocation_plan::text,affected_ad_ids::text,created_at_ms,updated_at_ms,approved_at_ms,executed_at_ms,expires_at_ms";

} // namespace autopilot::db::postgres
