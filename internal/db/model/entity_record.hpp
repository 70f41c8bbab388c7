#pragma once

#include <cstdint>
#include <string>

#include "internal/model/action_type.hpp"

namespace autopilot::db::model {

inline constexpr const char* kEntityActive = "ACTIVE";
inline constexpr const char* kEntityPaused = "PAUSED";

/*
  Ad hierarchy row (campaign / ad set / ad).

  campaign_id and adset_id point at the ancestors; a campaign row has
  campaign_id == id.
*/
struct EntityRecord {
  std::string                   id;
  autopilot::model::TargetLevel level = autopilot::model::TargetLevel::kUnspecified;

  std::string campaign_id;
  std::string adset_id;
  std::string name;

  std::string status = kEntityActive;

  double daily_budget_usd = 0.0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace autopilot::db::model
