#include "safety_engine.hpp"

#include <functional>
#include <vector>

#include "internal/util/format.hpp"

namespace autopilot::guardrails {

using util::FormatFixed;
using util::FormatPercent;
using util::FormatUsd;

namespace {

using CheckFn = std::function<SafetyDecision(const SafetyEngine&, model::ActionType, const ActionContext&)>;

struct SafetyCheck {
  std::function<bool(model::ActionType)> applies;
  CheckFn                                run;
};

bool AnyType(model::ActionType) {
  return true;
}

bool ScaleUpOnly(model::ActionType type) {
  return type == model::ActionType::kScaleUp;
}

const std::vector<SafetyCheck>& OrderedChecks() {
  static const std::vector<SafetyCheck> kChecks = {
      {AnyType,
       [](const SafetyEngine& engine, model::ActionType, const ActionContext& ctx) {
         return ctx.created_at ? engine.EnforceEmbargoPeriod(*ctx.created_at) : SafetyDecision::Pass();
       }},
      {AnyType,
       [](const SafetyEngine& engine, model::ActionType, const ActionContext& ctx) {
         return engine.CheckMinimumData(ctx.impressions, ctx.spend_usd);
       }},
      {ScaleUpOnly,
       [](const SafetyEngine& engine, model::ActionType, const ActionContext& ctx) {
         return engine.ValidateRoasConfidence(ctx.roas, ctx.confidence);
       }},
      {AnyType,
       [](const SafetyEngine& engine, model::ActionType type, const ActionContext& ctx) {
         return engine.CheckActionRateLimit(ctx.entity_id, type, ctx.last_action_time);
       }},
      {ScaleUpOnly,
       [](const SafetyEngine& engine, model::ActionType, const ActionContext& ctx) {
         return engine.PreventOverspend(ctx.spend_today_usd, ctx.new_budget_usd);
       }},
  };
  return kChecks;
}

} // namespace

SafetyEngine::SafetyEngine(config::SafetySettings settings, std::shared_ptr<util::Clock> clock)
    : settings_(std::move(settings)), clock_(std::move(clock)) {
}

SafetyDecision SafetyEngine::PreventOverspend(double spend_today, double proposed, std::optional<double> cap) const {
  const double limit = cap.value_or(settings_.max_daily_spend_usd);

  if (spend_today >= limit) {
    return SafetyDecision::Block("Daily spend limit reached: " + FormatUsd(spend_today) + " >= " + FormatUsd(limit));
  }
  if (spend_today + proposed > limit) {
    return SafetyDecision::Block("Proposed budget " + FormatUsd(proposed) + " would exceed daily limit: " + FormatUsd(spend_today + proposed) +
                                 " > " + FormatUsd(limit));
  }
  return SafetyDecision::Pass();
}

SafetyDecision SafetyEngine::EnforceEmbargoPeriod(util::TimePoint created_at, std::optional<uint32_t> embargo_hours) const {
  const uint32_t embargo = embargo_hours.value_or(settings_.min_age_hours);
  const double   age     = util::HoursBetween(created_at, clock_->Now());

  if (age < embargo) {
    return SafetyDecision::Block("Entity in embargo: " + FormatFixed(age, 1) + "h < " + std::to_string(embargo) + "h required (created: " +
                                 util::ToIso8601(created_at) + ")");
  }
  return SafetyDecision::Pass();
}

SafetyDecision SafetyEngine::BlockUnapprovedCreatives(const CreativeMetadata& creative) const {
  if (!settings_.require_human_approval_creatives) return SafetyDecision::Pass();

  if (!creative.is_human_approved) {
    return SafetyDecision::Block("Creative " + (creative.creative_id.empty() ? std::string("unknown") : creative.creative_id) +
                                 " requires human approval");
  }
  return SafetyDecision::Pass();
}

SafetyDecision SafetyEngine::CheckMinimumData(uint64_t impressions, double spend) const {
  if (impressions < settings_.min_impressions) {
    return SafetyDecision::Block("Insufficient impressions: " + std::to_string(impressions) + " < " + std::to_string(settings_.min_impressions) +
                                 " required");
  }
  if (spend < settings_.min_spend_usd) {
    return SafetyDecision::Block("Insufficient spend: " + FormatUsd(spend) + " < " + FormatUsd(settings_.min_spend_usd) + " required");
  }
  return SafetyDecision::Pass();
}

SafetyDecision SafetyEngine::CheckActionRateLimit(const std::string& entity_id, model::ActionType type,
                                                  std::optional<util::TimePoint> last_action_time, std::optional<uint32_t> cooldown_hours) const {
  if (!last_action_time) return SafetyDecision::Pass();

  const uint32_t cooldown = cooldown_hours.value_or(settings_.action_cooldown_hours);
  const double   since    = util::HoursBetween(*last_action_time, clock_->Now());
  if (since < cooldown) {
    return SafetyDecision::Block("Rate limit: " + FormatFixed(since, 1) + "h since last " + std::string(model::ToString(type)) + " < " +
                                 std::to_string(cooldown) + "h cooldown (entity: " + entity_id + ")");
  }
  return SafetyDecision::Pass();
}

SafetyDecision SafetyEngine::ValidateRoasConfidence(double roas, double confidence) const {
  if (roas < 0.5 && confidence > 0.8) {
    return SafetyDecision::Block("Dangerously low ROAS " + FormatFixed(roas, 2) + " with high confidence " + FormatPercent(confidence, 2));
  }
  if (roas < 0.0) {
    return SafetyDecision::Block("Negative ROAS " + FormatFixed(roas, 2) + " is invalid");
  }
  return SafetyDecision::Pass();
}

SafetyDecision SafetyEngine::ValidateAction(model::ActionType type, const ActionContext& context) const {
  if (type == model::ActionType::kUnspecified) {
    return SafetyDecision::Block("Unknown action type: " + std::string(model::ToString(type)));
  }

  for (const auto& check : OrderedChecks()) {
    if (!check.applies(type)) continue;

    auto decision = check.run(*this, type, context);
    if (decision.blocked) return decision;
  }
  return SafetyDecision::Pass();
}

} // namespace autopilot::guardrails
