#include "policy_engine.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/format.hpp"

namespace autopilot::guardrails {

using util::FormatFixed;
using util::FormatPercent;
using util::FormatUsd;

namespace {

constexpr double kDistributionTolerance = 0.01;

} // namespace

PolicyEngine::PolicyEngine(config::PolicySettings settings, std::shared_ptr<util::Clock> clock)
    : settings_(std::move(settings)), clock_(std::move(clock)) {
}

PolicyDecision PolicyEngine::CanScaleBudget(double current_budget, double new_budget, bool is_auto) const {
  if (current_budget <= 0.0) return PolicyDecision::Deny("Current budget must be positive");

  // Pausing is exempt from the change cap.
  if (new_budget == 0.0) return PolicyDecision::Allow();

  const double pct = std::abs(new_budget - current_budget) / current_budget;
  const double cap = is_auto ? settings_.max_auto_change_pct : settings_.max_daily_change_pct;
  if (pct > cap) {
    return PolicyDecision::Deny("Change " + FormatPercent(pct) + " exceeds limit " + FormatPercent(cap) + " (" + FormatUsd(current_budget) + " → " +
                                FormatUsd(new_budget) + ")");
  }

  if (new_budget > settings_.max_campaign_budget_usd) {
    return PolicyDecision::Deny("New budget " + FormatUsd(new_budget) + " exceeds limit " + FormatUsd(settings_.max_campaign_budget_usd));
  }
  return PolicyDecision::Allow();
}

HardStop PolicyEngine::MustHalt(double roas, double confidence, double spend) const {
  if (spend < settings_.min_spend_usd) return {};

  if (roas < settings_.hard_stop_roas && confidence >= settings_.hard_stop_confidence) {
    return {true, "HARD STOP: ROAS " + FormatFixed(roas, 2) + " < " + FormatFixed(settings_.hard_stop_roas, 2) + " with confidence " +
                      FormatPercent(confidence, 2) + " (spend: " + FormatUsd(spend) + ")"};
  }
  return {};
}

PolicyDecision PolicyEngine::ValidateGeoDistribution(const std::map<std::string, double>& distribution,
                                                     const std::vector<std::string>& countries) const {
  if (distribution.empty()) return PolicyDecision::Deny("Distribution dictionary is empty");

  const auto& home = settings_.home_market;
  if (std::find(countries.begin(), countries.end(), home) != countries.end()) {
    const auto   it    = distribution.find(home);
    const double share = it == distribution.end() ? 0.0 : it->second;
    if (share < settings_.min_home_pct) {
      return PolicyDecision::Deny(home + " must have at least " + FormatPercent(settings_.min_home_pct, 0) + " of budget (current: " +
                                  FormatPercent(share, 0) + ")");
    }
  }

  if (countries.size() > 1) {
    double max_share = 0.0;
    for (const auto& [country, share] : distribution) {
      max_share = std::max(max_share, share);
    }
    if (max_share > settings_.max_single_country_pct) {
      return PolicyDecision::Deny("No country can exceed " + FormatPercent(settings_.max_single_country_pct, 0) + " of budget (found: " +
                                  FormatPercent(max_share, 0) + ")");
    }
  }

  double total = 0.0;
  for (const auto& [country, share] : distribution) {
    total += share;
  }
  if (total < 1.0 - kDistributionTolerance || total > 1.0 + kDistributionTolerance) {
    return PolicyDecision::Deny("Distribution must sum to 100% (current: " + FormatPercent(total) + ")");
  }
  return PolicyDecision::Allow();
}

PolicyDecision PolicyEngine::CanChangeCreative(const CreativeMetadata& creative, std::optional<util::TimePoint> last_change) const {
  if (settings_.require_human_approval_creatives && !creative.is_human_approved) {
    return PolicyDecision::Deny("Creative requires human approval");
  }

  if (last_change) {
    const double hours = util::HoursBetween(*last_change, clock_->Now());
    if (hours < settings_.creative_embargo_hours) {
      return PolicyDecision::Deny("Creative embargo: " + FormatFixed(hours, 1) + "h < " + std::to_string(settings_.creative_embargo_hours) +
                                  "h required");
    }
  }
  return PolicyDecision::Allow();
}

PolicyDecision PolicyEngine::CanCreateCampaign(const CampaignProposal& proposal) const {
  if (proposal.budget_usd <= 0.0) return PolicyDecision::Deny("Budget must be positive");
  if (proposal.budget_usd > settings_.max_campaign_budget_usd) {
    return PolicyDecision::Deny("Budget exceeds limit: " + FormatUsd(proposal.budget_usd) + " > " + FormatUsd(settings_.max_campaign_budget_usd));
  }
  if (proposal.pixel_id.empty()) return PolicyDecision::Deny("Pixel ID is required");
  if (proposal.countries.empty()) return PolicyDecision::Deny("At least one country is required");

  if (proposal.countries.size() > 1) {
    return ValidateGeoDistribution(proposal.budget_distribution, proposal.countries);
  }
  return PolicyDecision::Allow();
}

PolicyDecision PolicyEngine::ValidateAction(model::ActionType type, const ActionContext& context) const {
  switch (type) {
    case model::ActionType::kScaleUp:
    case model::ActionType::kScaleDown:
      return CanScaleBudget(context.current_budget_usd, context.new_budget_usd, context.is_auto_mode);
    case model::ActionType::kPause:
      return PolicyDecision::Allow();
    case model::ActionType::kResume: {
      const auto stop = MustHalt(context.roas, context.confidence, context.spend_usd);
      if (stop.halt) return PolicyDecision::Deny("Cannot resume: " + stop.reason);
      return PolicyDecision::Allow();
    }
    case model::ActionType::kReallocate:
      // Moves budget between ads without changing the total; never auto-executed.
      return PolicyDecision::Allow();
    case model::ActionType::kUnspecified:
      break;
  }
  return PolicyDecision::Deny("Unknown action type: " + std::string(model::ToString(type)));
}

} // namespace autopilot::guardrails
