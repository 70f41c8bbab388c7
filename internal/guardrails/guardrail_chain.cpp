#include "guardrail_chain.hpp"

#include "internal/observability/logging.hpp"

namespace autopilot::guardrails {

GuardrailChain::GuardrailChain(std::shared_ptr<PolicyEngine> policy, std::shared_ptr<SafetyEngine> safety)
    : policy_(std::move(policy)), safety_(std::move(safety)) {
}

Verdict GuardrailChain::Vet(model::ActionType type, const ActionContext& context) const {
  const auto policy = policy_->ValidateAction(type, context);
  if (!policy.allowed) {
    AUTOPILOT_LOG_INFO("Policy blocked action", {observability::StringField("action_type", model::ToString(type)),
                                                 observability::StringField("entity_id", context.entity_id),
                                                 observability::StringField("reason", policy.reason)});
    return {Stage::kPolicyBlocked, policy.reason};
  }

  const auto safety = safety_->ValidateAction(type, context);
  if (safety.blocked) {
    AUTOPILOT_LOG_INFO("Safety blocked action", {observability::StringField("action_type", model::ToString(type)),
                                                 observability::StringField("entity_id", context.entity_id),
                                                 observability::StringField("reason", safety.reason)});
    return {Stage::kSafetyBlocked, safety.reason};
  }
  return {};
}

} // namespace autopilot::guardrails
