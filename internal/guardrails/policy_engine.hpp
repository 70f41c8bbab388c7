#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/guardrails/decision.hpp"
#include "internal/model/action_type.hpp"
#include "internal/util/time.hpp"

namespace autopilot::guardrails {

struct HardStop {
  bool        halt = false;
  std::string reason;
};

struct CampaignProposal {
  double                        budget_usd = 0.0;
  std::string                   pixel_id;
  std::vector<std::string>      countries;
  std::map<std::string, double> budget_distribution;
};

/*
  PolicyEngine

  Stateless business rules: budget change caps, hard stop, geo split,
  creative approval. Every check returns a PolicyDecision.
*/
class PolicyEngine {
 public:
  PolicyEngine(config::PolicySettings settings, std::shared_ptr<util::Clock> clock);

  PolicyDecision CanScaleBudget(double current_budget, double new_budget, bool is_auto) const;
  HardStop       MustHalt(double roas, double confidence, double spend) const;
  PolicyDecision ValidateGeoDistribution(const std::map<std::string, double>& distribution, const std::vector<std::string>& countries) const;
  PolicyDecision CanChangeCreative(const CreativeMetadata& creative, std::optional<util::TimePoint> last_change) const;
  PolicyDecision CanCreateCampaign(const CampaignProposal& proposal) const;

  PolicyDecision ValidateAction(model::ActionType type, const ActionContext& context) const;

  const config::PolicySettings& Settings() const {
    return settings_;
  }

 private:
  config::PolicySettings       settings_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace autopilot::guardrails
