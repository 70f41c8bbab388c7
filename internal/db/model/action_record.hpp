#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "autopilot/v1/types.pb.h"
#include "internal/model/action_state.hpp"
#include "internal/model/action_type.hpp"

namespace autopilot::db::model {

/*
  Persistent optimization action.

  status is only ever changed through CompareAndSetActionStatus.
  Timestamps are epoch ms; 0 = unset.
  execution_result / reallocation_plan are stored as protobuf JSON.
*/
struct ActionRecord {
  std::string action_id;

  autopilot::model::ActionType   type         = autopilot::model::ActionType::kUnspecified;
  autopilot::model::ActionStatus status       = autopilot::model::ActionStatus::kSuggested;
  autopilot::model::TargetLevel  target_level = autopilot::model::TargetLevel::kUnspecified;

  std::string target_id;
  std::string campaign_id;
  std::string adset_id;
  std::string ad_id;

  double amount_pct     = 0.0;
  double amount_usd     = 0.0;
  double old_budget_usd = 0.0;
  double new_budget_usd = 0.0;

  std::string reason;
  std::string reason_details;

  double confidence   = 0.0;
  double roas_value   = 0.0;
  double safety_score = 0.0;

  std::string created_by;
  std::string approved_by;
  std::string executed_by;

  std::optional<autopilot::v1::ExecutionResult> execution_result;
  std::string                                   execution_error;

  std::optional<autopilot::v1::ReallocationPlan> reallocation_plan;
  std::vector<std::string>                       affected_ad_ids;

  uint64_t created_at_ms  = 0;
  uint64_t updated_at_ms  = 0;
  uint64_t approved_at_ms = 0;
  uint64_t executed_at_ms = 0;
  uint64_t expires_at_ms  = 0;
};

} // namespace autopilot::db::model
