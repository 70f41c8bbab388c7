#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/settings.hpp"
#include "internal/guardrails/decision.hpp"
#include "internal/model/action_type.hpp"
#include "internal/util/time.hpp"

namespace autopilot::guardrails {

/*
  SafetyEngine

  Operational guardrails, independent of PolicyEngine; an action must
  clear both. ValidateAction runs the checks in this fixed order and
  stops at the first block:

    1. embargo            (all types)
    2. minimum data       (all types)
    3. roas / confidence  (scale_up)
    4. rate limit         (all types)
    5. overspend          (scale_up)
*/
class SafetyEngine {
 public:
  SafetyEngine(config::SafetySettings settings, std::shared_ptr<util::Clock> clock);

  SafetyDecision PreventOverspend(double spend_today, double proposed, std::optional<double> cap = std::nullopt) const;
  SafetyDecision EnforceEmbargoPeriod(util::TimePoint created_at, std::optional<uint32_t> embargo_hours = std::nullopt) const;
  SafetyDecision BlockUnapprovedCreatives(const CreativeMetadata& creative) const;
  SafetyDecision CheckMinimumData(uint64_t impressions, double spend) const;
  SafetyDecision CheckActionRateLimit(const std::string& entity_id, model::ActionType type, std::optional<util::TimePoint> last_action_time,
                                      std::optional<uint32_t> cooldown_hours = std::nullopt) const;
  SafetyDecision ValidateRoasConfidence(double roas, double confidence) const;

  SafetyDecision ValidateAction(model::ActionType type, const ActionContext& context) const;

  const config::SafetySettings& Settings() const {
    return settings_;
  }

 private:
  config::SafetySettings       settings_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace autopilot::guardrails
