#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/guardrails/guardrail_chain.hpp"
#include "internal/guardrails/policy_engine.hpp"
#include "internal/guardrails/safety_engine.hpp"
#include "support/fixture.hpp"

namespace {

using autopilot::guardrails::ActionContext;
using autopilot::guardrails::CampaignProposal;
using autopilot::guardrails::CreativeMetadata;
using autopilot::guardrails::GuardrailChain;
using autopilot::guardrails::PolicyEngine;
using autopilot::guardrails::SafetyEngine;
using autopilot::guardrails::Stage;
using autopilot::model::ActionType;

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::shared_ptr<autopilot::util::ManualClock> Clock() {
  return std::make_shared<autopilot::util::ManualClock>(autopilot::util::FromUnixMillis(autopilot::testing::kEpochMs));
}

// Mature, well-measured entity that clears every check.
ActionContext HealthyContext(const autopilot::util::Clock& clock) {
  ActionContext ctx;
  ctx.current_budget_usd = 100.0;
  ctx.new_budget_usd     = 115.0;
  ctx.roas               = 3.0;
  ctx.confidence         = 0.9;
  ctx.spend_usd          = 500.0;
  ctx.impressions        = 5000;
  ctx.created_at         = clock.Now() - std::chrono::hours(72);
  ctx.entity_id          = "ad-1";
  return ctx;
}

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

void TestBudgetChangeCaps() {
  PolicyEngine policy({}, Clock());

  assert(policy.CanScaleBudget(100.0, 115.0, false).allowed);
  assert(policy.CanScaleBudget(100.0, 85.0, false).allowed);

  const auto too_big = policy.CanScaleBudget(100.0, 130.0, false);
  assert(!too_big.allowed);
  assert(too_big.reason.find("exceeds limit") != std::string::npos);

  // auto mode uses the tighter cap
  assert(!policy.CanScaleBudget(100.0, 115.0, true).allowed);
  assert(policy.CanScaleBudget(100.0, 108.0, true).allowed);

  assert(!policy.CanScaleBudget(0.0, 10.0, false).allowed);
  assert(policy.CanScaleBudget(100.0, 0.0, true).allowed);

  const auto over_ceiling = policy.CanScaleBudget(4500.0, 5400.0, false);
  assert(!over_ceiling.allowed);
  assert(StartsWith(over_ceiling.reason, "New budget"));
}

void TestHardStop() {
  PolicyEngine policy({}, Clock());

  const auto stop = policy.MustHalt(0.5, 0.8, 200.0);
  assert(stop.halt);
  assert(StartsWith(stop.reason, "HARD STOP"));

  assert(!policy.MustHalt(0.5, 0.8, 50.0).halt);
  assert(!policy.MustHalt(0.5, 0.5, 200.0).halt);
  assert(!policy.MustHalt(1.5, 0.9, 200.0).halt);
}

void TestGeoDistribution() {
  PolicyEngine policy({}, Clock());

  assert(!policy.ValidateGeoDistribution({}, {"ES"}).allowed);
  assert(!policy.ValidateGeoDistribution({{"ES", 0.3}, {"FR", 0.7}}, {"ES", "FR"}).allowed);
  assert(policy.ValidateGeoDistribution({{"ES", 0.4}, {"FR", 0.6}}, {"ES", "FR"}).allowed);
  assert(!policy.ValidateGeoDistribution({{"FR", 0.8}, {"DE", 0.2}}, {"FR", "DE"}).allowed);

  const auto short_sum = policy.ValidateGeoDistribution({{"ES", 0.5}, {"FR", 0.4}}, {"ES", "FR"});
  assert(!short_sum.allowed);
  assert(StartsWith(short_sum.reason, "Distribution must sum to 100%"));
}

void TestCreativeChanges() {
  auto         clock = Clock();
  PolicyEngine policy({}, clock);

  assert(!policy.CanChangeCreative({"cr-1", false}, std::nullopt).allowed);
  assert(!policy.CanChangeCreative({"cr-1", true}, clock->Now() - std::chrono::hours(10)).allowed);
  assert(policy.CanChangeCreative({"cr-1", true}, clock->Now() - std::chrono::hours(50)).allowed);

  autopilot::config::PolicySettings relaxed;
  relaxed.require_human_approval_creatives = false;
  assert(PolicyEngine(relaxed, clock).CanChangeCreative({"cr-2", false}, std::nullopt).allowed);
}

void TestCampaignCreation() {
  PolicyEngine policy({}, Clock());

  CampaignProposal proposal;
  proposal.budget_usd = 0.0;
  assert(!policy.CanCreateCampaign(proposal).allowed);

  proposal.budget_usd = 6000.0;
  assert(!policy.CanCreateCampaign(proposal).allowed);

  proposal.budget_usd = 1000.0;
  assert(policy.CanCreateCampaign(proposal).reason == "Pixel ID is required");

  proposal.pixel_id = "px-1";
  assert(!policy.CanCreateCampaign(proposal).allowed);

  proposal.countries = {"ES"};
  assert(policy.CanCreateCampaign(proposal).allowed);

  proposal.countries           = {"ES", "FR"};
  proposal.budget_distribution = {{"ES", 0.2}, {"FR", 0.8}};
  assert(!policy.CanCreateCampaign(proposal).allowed);
}

void TestPolicyActionDispatch() {
  auto         clock = Clock();
  PolicyEngine policy({}, clock);
  auto         ctx = HealthyContext(*clock);

  assert(policy.ValidateAction(ActionType::kScaleUp, ctx).allowed);
  assert(policy.ValidateAction(ActionType::kPause, ctx).allowed);
  assert(policy.ValidateAction(ActionType::kReallocate, ctx).allowed);
  assert(!policy.ValidateAction(ActionType::kUnspecified, ctx).allowed);

  ctx.roas       = 0.4;
  ctx.confidence = 0.9;
  const auto resume = policy.ValidateAction(ActionType::kResume, ctx);
  assert(!resume.allowed);
  assert(StartsWith(resume.reason, "Cannot resume: HARD STOP"));
}

// ---------------------------------------------------------------------------
// Safety
// ---------------------------------------------------------------------------

void TestOverspend() {
  SafetyEngine safety({}, Clock());

  assert(StartsWith(safety.PreventOverspend(10'000.0, 10.0).reason, "Daily spend limit reached"));
  assert(StartsWith(safety.PreventOverspend(9'950.0, 100.0).reason, "Proposed budget"));
  assert(!safety.PreventOverspend(100.0, 100.0).blocked);
  assert(safety.PreventOverspend(100.0, 100.0, 150.0).blocked);
}

void TestEmbargoAndMinimumData() {
  auto         clock = Clock();
  SafetyEngine safety({}, clock);

  assert(safety.EnforceEmbargoPeriod(clock->Now() - std::chrono::hours(10)).blocked);
  assert(!safety.EnforceEmbargoPeriod(clock->Now() - std::chrono::hours(50)).blocked);
  assert(!safety.EnforceEmbargoPeriod(clock->Now() - std::chrono::hours(10), 6).blocked);

  assert(StartsWith(safety.CheckMinimumData(500, 200.0).reason, "Insufficient impressions"));
  assert(StartsWith(safety.CheckMinimumData(2000, 50.0).reason, "Insufficient spend"));
  assert(!safety.CheckMinimumData(2000, 200.0).blocked);
}

void TestRateLimitAndRoasConfidence() {
  auto         clock = Clock();
  SafetyEngine safety({}, clock);

  assert(!safety.CheckActionRateLimit("ad-1", ActionType::kScaleUp, std::nullopt).blocked);
  assert(safety.CheckActionRateLimit("ad-1", ActionType::kScaleUp, clock->Now() - std::chrono::hours(5)).blocked);
  assert(!safety.CheckActionRateLimit("ad-1", ActionType::kScaleUp, clock->Now() - std::chrono::hours(30)).blocked);

  assert(safety.ValidateRoasConfidence(0.4, 0.9).blocked);
  assert(safety.ValidateRoasConfidence(-1.0, 0.5).blocked);
  assert(!safety.ValidateRoasConfidence(0.4, 0.5).blocked);
}

void TestCreativeApproval() {
  SafetyEngine safety({}, Clock());
  assert(safety.BlockUnapprovedCreatives({"cr-1", false}).reason == "Creative cr-1 requires human approval");
  assert(safety.BlockUnapprovedCreatives({"", false}).reason == "Creative unknown requires human approval");
  assert(!safety.BlockUnapprovedCreatives({"cr-1", true}).blocked);
}

void TestSafetyCheckOrder() {
  auto         clock = Clock();
  SafetyEngine safety({}, clock);

  auto ctx        = HealthyContext(*clock);
  ctx.created_at  = clock->Now() - std::chrono::hours(10);
  ctx.impressions = 10;
  assert(StartsWith(safety.ValidateAction(ActionType::kScaleUp, ctx).reason, "Entity in embargo"));

  // roas/confidence and overspend only apply to scale-up
  ctx            = HealthyContext(*clock);
  ctx.roas       = 0.3;
  ctx.confidence = 0.95;
  assert(StartsWith(safety.ValidateAction(ActionType::kScaleUp, ctx).reason, "Dangerously low ROAS"));
  assert(!safety.ValidateAction(ActionType::kScaleDown, ctx).blocked);
  assert(!safety.ValidateAction(ActionType::kPause, ctx).blocked);

  ctx                 = HealthyContext(*clock);
  ctx.spend_today_usd = 9'990.0;
  assert(safety.ValidateAction(ActionType::kScaleUp, ctx).blocked);
  assert(!safety.ValidateAction(ActionType::kScaleDown, ctx).blocked);

  ctx                  = HealthyContext(*clock);
  ctx.last_action_time = clock->Now() - std::chrono::hours(1);
  assert(StartsWith(safety.ValidateAction(ActionType::kPause, ctx).reason, "Rate limit"));

  assert(safety.ValidateAction(ActionType::kUnspecified, HealthyContext(*clock)).blocked);
}

// ---------------------------------------------------------------------------
// Chain
// ---------------------------------------------------------------------------

void TestChainReportsFirstBlockingStage() {
  auto           clock = Clock();
  GuardrailChain chain(std::make_shared<PolicyEngine>(autopilot::config::PolicySettings{}, clock),
                       std::make_shared<SafetyEngine>(autopilot::config::SafetySettings{}, clock));

  auto ctx = HealthyContext(*clock);
  assert(chain.Vet(ActionType::kScaleUp, ctx).Passed());

  ctx.is_auto_mode  = true;
  const auto policy = chain.Vet(ActionType::kScaleUp, ctx);
  assert(policy.stage == Stage::kPolicyBlocked);
  assert(!policy.reason.empty());

  ctx                = HealthyContext(*clock);
  ctx.impressions    = 10;
  ctx.is_auto_mode   = true;
  ctx.new_budget_usd = 105.0;
  const auto safety  = chain.Vet(ActionType::kScaleUp, ctx);
  assert(safety.stage == Stage::kSafetyBlocked);
  assert(StartsWith(safety.reason, "Insufficient impressions"));
}

} // namespace

int main() {
  TestBudgetChangeCaps();
  TestHardStop();
  TestGeoDistribution();
  TestCreativeChanges();
  TestCampaignCreation();
  TestPolicyActionDispatch();

  TestOverspend();
  TestEmbargoAndMinimumData();
  TestRateLimitAndRoasConfidence();
  TestCreativeApproval();
  TestSafetyCheckOrder();

  TestChainReportsFirstBlockingStage();

  std::cout << "autopilot_unit_guardrails: pass\n";
  return 0;
}
