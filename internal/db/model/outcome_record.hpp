#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/scope.hpp"

namespace autopilot::db::model {

/*
  One conversion event.

  Only attribution_model / attribution_weight are ever rewritten.
*/
struct OutcomeRecord {
  std::string outcome_id;
  Scope       scope;

  double      value_usd = 0.0;
  std::string conversion_type; // purchase | lead | complete_registration | ...

  uint64_t    event_timestamp_ms = 0;
  std::string session_id;

  std::optional<double> session_duration_seconds;

  std::string attribution_model  = "last_click";
  double      attribution_weight = 1.0;
};

} // namespace autopilot::db::model
