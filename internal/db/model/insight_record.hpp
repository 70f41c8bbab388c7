#pragma once

#include <cstdint>

#include "internal/db/model/scope.hpp"

namespace autopilot::db::model {

// Performance window [date_start, date_stop) as delivered by the ad platform.
struct InsightRecord {
  uint64_t id = 0; // assigned on insert
  Scope    scope;

  uint64_t date_start_ms = 0;
  uint64_t date_stop_ms  = 0;

  uint64_t impressions = 0;
  uint64_t clicks      = 0;
  double   spend_usd   = 0.0;
};

} // namespace autopilot::db::model
