#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/autonomous/autonomous_worker.hpp"
#include "internal/ledger/event_ledger.hpp"
#include "support/fixture.hpp"

namespace {

using autopilot::config::WorkerMode;
using autopilot::model::ActionStatus;
using autopilot::model::ActionType;
using autopilot::testing::CountingGateway;
using autopilot::testing::Harness;
using autopilot::testing::MakeAction;
using autopilot::testing::MakeHarness;
using autopilot::testing::MetricsRow;
using autopilot::testing::RecordingLedger;

autopilot::util::TimePoint Ago(const Harness& h, int64_t hours) {
  return h.clock->Now() - std::chrono::hours(hours);
}

// A 72h-old campaign whose single ad earned `roas` yesterday.
void SeedMatureCampaign(Harness& h, const std::string& campaign_id, double roas) {
  autopilot::testing::SeedCampaign(*h.repository, campaign_id, Ago(h, 72));
  autopilot::testing::SeedAd(*h.repository, campaign_id, campaign_id + "-ad", 100.0, Ago(h, 72));
  autopilot::testing::SeedMetrics(*h.repository, campaign_id, campaign_id + "-ad", Ago(h, 24), MetricsRow{.roas = roas});
}

autopilot::config::Settings AutoSettings(double max_auto_change_pct) {
  autopilot::config::Settings settings;
  settings.worker.mode                = WorkerMode::kAuto;
  settings.policy.max_auto_change_pct = max_auto_change_pct;
  return settings;
}

void TestAutoModeExecutesSafeScaleUp() {
  auto h = MakeHarness(AutoSettings(0.25));
  SeedMatureCampaign(h, "c-auto", 3.2);

  // too young to be considered at all
  autopilot::testing::SeedCampaign(*h.repository, "c-young", Ago(h, 10));

  const auto stats = h.worker->RunOnce();
  assert(stats.campaigns_evaluated() == 1);
  assert(stats.actions_generated() == 1);
  assert(stats.actions_executed() == 1);
  assert(stats.actions_queued() == 0);
  assert(stats.actions_policy_blocked() == 0);
  assert(stats.actions_safety_blocked() == 0);
  assert(stats.errors_size() == 0);

  assert(std::abs(autopilot::testing::LoadEntity(*h.repository, "c-auto-ad").daily_budget_usd - 120.0) < 1e-9);

  autopilot::optimization::ActionQuery query;
  query.statuses = {ActionStatus::kExecuted};
  const auto executed = h.optimizer->ListActions(query);
  assert(executed.size() == 1);
  assert(executed[0].created_by == "autonomous_worker");
  assert(executed[0].executed_by == "autonomous_worker");
}

void TestAutoModePausesCriticallyLowAd() {
  auto h = MakeHarness(AutoSettings(0.10));
  SeedMatureCampaign(h, "c-low", 0.5);

  const auto stats = h.worker->RunOnce();
  assert(stats.actions_generated() == 1);
  assert(stats.actions_executed() == 1);
  assert(autopilot::testing::LoadEntity(*h.repository, "c-low-ad").status == autopilot::db::model::kEntityPaused);
}

void TestDefaultAutoCapBlocksLargeScaleUp() {
  auto h = MakeHarness(AutoSettings(0.10));
  SeedMatureCampaign(h, "c-cap", 3.2);

  const auto stats = h.worker->RunOnce();
  assert(stats.actions_generated() == 1);
  assert(stats.actions_policy_blocked() == 1);
  assert(stats.actions_executed() == 0);
  assert(stats.actions_queued() == 0);
  assert(h.optimizer->ListActions({}).empty());
  assert(std::abs(autopilot::testing::LoadEntity(*h.repository, "c-cap-ad").daily_budget_usd - 100.0) < 1e-9);
}

// Auto mode on shipped defaults: a roas 6.0 ad on a 72h campaign gets the
// capped +20% proposal, which the 10% auto limit blocks. Nothing is queued
// and the budget is untouched.
void TestEndToEndAutoScaleUpAtDefaultThresholds() {
  autopilot::config::Settings settings;
  settings.worker.mode = WorkerMode::kAuto;

  auto ledger = std::make_shared<RecordingLedger>();
  auto h      = MakeHarness(settings, nullptr, ledger);
  autopilot::testing::SeedCampaign(*h.repository, "c-e2e", Ago(h, 72));
  autopilot::testing::SeedAd(*h.repository, "c-e2e", "c-e2e-ad", 100.0, Ago(h, 72));
  autopilot::testing::SeedMetrics(*h.repository, "c-e2e", "c-e2e-ad", Ago(h, 24), MetricsRow{.roas = 6.0, .confidence = 0.9});

  const auto candidates = h.optimizer->EvaluateCampaign("c-e2e");
  assert(candidates.size() == 1);
  assert(candidates[0].type == ActionType::kScaleUp);
  assert(std::abs(candidates[0].amount_pct - 0.20) < 1e-9);

  const auto stats = h.worker->RunOnce();
  assert(stats.campaigns_evaluated() == 1);
  assert(stats.actions_generated() == 1);
  assert(stats.actions_policy_blocked() == 1);
  assert(stats.actions_safety_blocked() == 0);
  assert(stats.actions_executed() == 0);
  assert(stats.actions_queued() == 0);
  assert(h.optimizer->ListActions({}).empty());
  assert(std::abs(autopilot::testing::LoadEntity(*h.repository, "c-e2e-ad").daily_budget_usd - 100.0) < 1e-9);
  assert(ledger->Count(autopilot::ledger::kOptimizationExecuted) == 0);
}

void TestSuggestModeQueuesOnly() {
  auto h = MakeHarness();
  SeedMatureCampaign(h, "c-sug", 3.2);
  assert(h.worker->Mode() == WorkerMode::kSuggest);

  const auto stats = h.worker->RunOnce();
  assert(stats.actions_generated() == 1);
  assert(stats.actions_queued() == 1);
  assert(stats.actions_executed() == 0);

  const auto queued = h.optimizer->ListActions({});
  assert(queued.size() == 1);
  assert(queued[0].status == ActionStatus::kSuggested);
  assert(queued[0].type == ActionType::kScaleUp);

  // the open suggestion suppresses a duplicate on the next tick
  const auto again = h.worker->RunOnce();
  assert(again.actions_generated() == 0);
}

void TestModeSwitchTakesEffectNextTick() {
  auto h = MakeHarness(AutoSettings(0.25));
  SeedMatureCampaign(h, "c-mode", 3.2);

  h.worker->SetMode(WorkerMode::kSuggest);
  assert(h.worker->Mode() == WorkerMode::kSuggest);
  assert(h.worker->RunOnce().actions_queued() == 1);
}

void TestGatewayFailureCountsAsFailed() {
  auto gateway = std::make_shared<CountingGateway>(true);
  auto h       = MakeHarness(AutoSettings(0.25), gateway);
  SeedMatureCampaign(h, "c-fail", 3.2);

  const auto stats = h.worker->RunOnce();
  assert(gateway->Calls() == 1);
  assert(stats.actions_failed() == 1);
  assert(stats.actions_executed() == 0);

  autopilot::optimization::ActionQuery query;
  query.statuses = {ActionStatus::kFailed};
  assert(h.optimizer->ListActions(query).size() == 1);
}

void TestTickSweepsExpiredSuggestions() {
  auto h = MakeHarness();
  autopilot::testing::SeedCampaign(*h.repository, "c-exp", Ago(h, 72));
  autopilot::testing::SeedAd(*h.repository, "c-exp", "c-exp-ad", 100.0, Ago(h, 72));
  (void)h.optimizer->EnqueueAction(MakeAction(ActionType::kScaleUp, "c-exp", "c-exp-ad", 0.1, 100.0), "test");

  h.clock->Advance(std::chrono::hours(49));

  const auto stats = h.worker->RunOnce();
  assert(stats.actions_expired() == 1);
  assert(stats.campaigns_evaluated() == 1);
  assert(stats.actions_generated() == 0);
}

void TestTickIsRecordedInLedgerAndStatus() {
  auto ledger = std::make_shared<RecordingLedger>();
  auto h      = MakeHarness({}, nullptr, ledger);
  SeedMatureCampaign(h, "c-led", 3.2);

  assert(!h.worker->Status().last_tick.has_value());

  const auto stats = h.worker->RunOnce();
  assert(ledger->Count(autopilot::ledger::kAutonomousTickComplete) == 1);

  for (const auto& event : ledger->Events()) {
    if (event.event_type != autopilot::ledger::kAutonomousTickComplete) continue;
    assert(event.actor == "autonomous_worker");
    assert(event.payload.fields().at("campaigns_evaluated").number_value() == 1.0);
    assert(event.payload.fields().at("actions_queued").number_value() == 1.0);
  }

  const auto status = h.worker->Status();
  assert(status.enabled);
  assert(!status.is_running);
  assert(status.last_tick.has_value());
  assert(status.last_tick->actions_queued() == stats.actions_queued());
  assert(status.last_tick->has_tick_started_at());
  assert(status.last_tick->has_tick_completed_at());
}

void TestIsSafeForAuto() {
  auto h = MakeHarness();

  assert(h.worker->IsSafeForAuto(MakeAction(ActionType::kPause, "c", "ad", -1.0, 100.0, 0.1)));
  assert(!h.worker->IsSafeForAuto(MakeAction(ActionType::kReallocate, "c", "ad", 0.0, 100.0, 0.99)));

  assert(h.worker->IsSafeForAuto(MakeAction(ActionType::kScaleUp, "c", "ad", 0.10, 100.0, 0.80)));
  assert(!h.worker->IsSafeForAuto(MakeAction(ActionType::kScaleUp, "c", "ad", 0.10, 100.0, 0.70)));
  assert(!h.worker->IsSafeForAuto(MakeAction(ActionType::kScaleUp, "c", "ad", 0.15, 100.0, 0.90)));
  assert(h.worker->IsSafeForAuto(MakeAction(ActionType::kScaleDown, "c", "ad", -0.10, 100.0, 0.90)));
  assert(!h.worker->IsSafeForAuto(MakeAction(ActionType::kScaleDown, "c", "ad", -0.20, 100.0, 0.90)));
}

void TestStartRespectsEnabledFlag() {
  autopilot::config::Settings disabled;
  disabled.worker.enabled = false;

  auto off = MakeHarness(disabled);
  off.worker->Start();
  assert(!off.worker->IsRunning());
  off.worker->Stop();

  auto on = MakeHarness();
  on.worker->Start();
  assert(on.worker->IsRunning());

  // the first tick runs immediately
  for (int i = 0; i < 200 && !on.worker->Status().last_tick.has_value(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(on.worker->Status().last_tick.has_value());

  on.worker->Stop();
  assert(!on.worker->IsRunning());
  on.worker->Stop();
}

} // namespace

int main() {
  TestAutoModeExecutesSafeScaleUp();
  TestAutoModePausesCriticallyLowAd();
  TestDefaultAutoCapBlocksLargeScaleUp();
  TestEndToEndAutoScaleUpAtDefaultThresholds();
  TestSuggestModeQueuesOnly();
  TestModeSwitchTakesEffectNextTick();
  TestGatewayFailureCountsAsFailed();
  TestTickSweepsExpiredSuggestions();
  TestTickIsRecordedInLedgerAndStatus();
  TestIsSafeForAuto();
  TestStartRespectsEnabledFlag();

  std::cout << "autopilot_unit_autonomous_worker: pass\n";
  return 0;
}
