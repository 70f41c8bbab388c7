#pragma once

#include <memory>
#include <string>

#include "internal/guardrails/policy_engine.hpp"
#include "internal/guardrails/safety_engine.hpp"

namespace autopilot::guardrails {

enum class Stage {
  kPassed,
  kPolicyBlocked,
  kSafetyBlocked,
};

struct Verdict {
  Stage       stage = Stage::kPassed;
  std::string reason;

  bool Passed() const {
    return stage == Stage::kPassed;
  }
};

// Policy first, then safety; both must pass.
class GuardrailChain {
 public:
  GuardrailChain(std::shared_ptr<PolicyEngine> policy, std::shared_ptr<SafetyEngine> safety);

  Verdict Vet(model::ActionType type, const ActionContext& context) const;

  const PolicyEngine& Policy() const {
    return *policy_;
  }
  const SafetyEngine& Safety() const {
    return *safety_;
  }

 private:
  std::shared_ptr<PolicyEngine> policy_;
  std::shared_ptr<SafetyEngine> safety_;
};

} // namespace autopilot::guardrails
