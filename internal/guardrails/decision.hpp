#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace autopilot::guardrails {

// Business-rule verdict. A denial is a normal value, not an error.
struct PolicyDecision {
  bool        allowed = true;
  std::string reason;

  static PolicyDecision Allow() {
    return {};
  }
  static PolicyDecision Deny(std::string reason) {
    return {false, std::move(reason)};
  }
};

// Operational-guardrail verdict.
struct SafetyDecision {
  bool        blocked = false;
  std::string reason;

  static SafetyDecision Pass() {
    return {};
  }
  static SafetyDecision Block(std::string reason) {
    return {true, std::move(reason)};
  }
};

/*
  Snapshot the engines judge an action against. Built once per action;
  the engines never read anything else.
*/
struct ActionContext {
  bool is_auto_mode = false;

  double current_budget_usd = 0.0;
  double new_budget_usd     = 0.0;

  // aggregates over the campaign's recent metric rows
  double   roas        = 0.0;
  double   confidence  = 0.0;
  double   spend_usd   = 0.0;
  uint64_t impressions = 0;

  std::optional<util::TimePoint> created_at;
  std::string                    entity_id;

  double                         spend_today_usd = 0.0;
  std::optional<util::TimePoint> last_action_time;
};

struct CreativeMetadata {
  std::string creative_id;
  bool        is_human_approved = false;
};

} // namespace autopilot::guardrails
