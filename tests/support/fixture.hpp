#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/analytics/budget_allocator.hpp"
#include "internal/analytics/metrics_recorder.hpp"
#include "internal/analytics/prediction_engine.hpp"
#include "internal/analytics/roas_calculator.hpp"
#include "internal/autonomous/autonomous_worker.hpp"
#include "internal/config/settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/gateway/store_gateway.hpp"
#include "internal/guardrails/guardrail_chain.hpp"
#include "internal/ledger/event_ledger.hpp"
#include "internal/optimization/action_executor.hpp"
#include "internal/optimization/optimization_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace autopilot::testing {

// 2025-10-09T08:00:00Z
inline constexpr uint64_t kEpochMs = 1'759'996'800'000ULL;

// ---------------------------------------------------------------------------
// Doubles
// ---------------------------------------------------------------------------

class RecordingLedger final : public ledger::EventLedger {
 public:
  void Append(const ledger::LedgerEvent& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::vector<ledger::LedgerEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  size_t Count(std::string_view event_type) const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& e : events_) {
      if (e.event_type == event_type) ++n;
    }
    return n;
  }

 private:
  mutable std::mutex               mutex_;
  std::vector<ledger::LedgerEvent> events_;
};

class ThrowingLedger final : public ledger::EventLedger {
 public:
  void Append(const ledger::LedgerEvent&) override {
    throw std::runtime_error("ledger unavailable");
  }
};

// Counts calls, optionally holds each one for `delay`, optionally fails.
class CountingGateway final : public gateway::AdPlatformGateway {
 public:
  explicit CountingGateway(bool fail = false, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) : fail_(fail), delay_(delay) {
  }

  gateway::GatewayReceipt UpdateBudget(const std::string&, const std::string& entity_id, double) override {
    return Call(entity_id);
  }
  gateway::GatewayReceipt SetStatus(const std::string&, const std::string& entity_id, const std::string&) override {
    return Call(entity_id);
  }
  gateway::GatewayReceipt ApplyReallocation(const std::string&, const autopilot::v1::ReallocationPlan&) override {
    return Call("plan");
  }
  gateway::GatewayReceipt SwapCreative(const std::string&, const std::string& ad_id, const std::string&) override {
    return Call(ad_id);
  }

  int Calls() const {
    return calls_;
  }

 private:
  gateway::GatewayReceipt Call(const std::string& entity_id) {
    ++calls_;
    if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
    if (fail_) throw gateway::GatewayError("platform rejected change for " + entity_id);
    return {true, "ok", {{"entity_id", entity_id}}};
  }

  bool                      fail_;
  std::chrono::milliseconds delay_;
  std::atomic<int>          calls_{0};
};

// ---------------------------------------------------------------------------
// Seeding
// ---------------------------------------------------------------------------

inline void SeedCampaign(db::Repository& repo, const std::string& id, util::TimePoint created_at) {
  db::model::EntityRecord campaign;
  campaign.id            = id;
  campaign.level         = model::TargetLevel::kCampaign;
  campaign.campaign_id   = id;
  campaign.name          = id;
  campaign.created_at_ms = util::ToUnixMillis(created_at);

  auto tx = repo.Begin();
  if (!repo.UpsertEntity(*tx, campaign)) throw std::runtime_error("seed campaign " + id);
  tx->Commit();
}

inline void SeedAd(db::Repository& repo, const std::string& campaign_id, const std::string& ad_id, double daily_budget,
                   util::TimePoint created_at) {
  db::model::EntityRecord ad;
  ad.id               = ad_id;
  ad.level            = model::TargetLevel::kAd;
  ad.campaign_id      = campaign_id;
  ad.adset_id         = campaign_id + "-set";
  ad.name             = ad_id;
  ad.daily_budget_usd = daily_budget;
  ad.created_at_ms    = util::ToUnixMillis(created_at);

  auto tx = repo.Begin();
  if (!repo.UpsertEntity(*tx, ad)) throw std::runtime_error("seed ad " + ad_id);
  tx->Commit();
}

struct MetricsRow {
  double   roas        = 0.0;
  double   confidence  = 0.9;
  uint64_t sample_size = 40;
  uint64_t impressions = 5000;
  double   spend       = 500.0;
  bool     is_outlier  = false;
};

inline void SeedMetrics(db::Repository& repo, const std::string& campaign_id, const std::string& ad_id, util::TimePoint day,
                        const MetricsRow& row) {
  db::model::RoasMetricsRecord r;
  r.scope.campaign_id = campaign_id;
  r.scope.adset_id    = campaign_id + "-set";
  r.scope.ad_id       = ad_id;
  r.date_ms           = util::ToUnixMillis(util::StartOfDay(day));
  r.actual_roas       = row.roas;
  r.smoothed_roas     = row.roas;
  r.predicted_roas    = row.roas;
  r.confidence_score  = row.confidence;
  r.sample_size       = row.sample_size;
  r.is_outlier        = row.is_outlier;
  r.impressions       = row.impressions;
  r.total_cost_usd    = row.spend;
  r.total_revenue_usd = row.spend * row.roas;
  r.created_at_ms     = util::ToUnixMillis(day);

  auto tx = repo.Begin();
  if (!repo.InsertRoasMetrics(*tx, r)) throw std::runtime_error("seed metrics " + ad_id);
  tx->Commit();
}

inline db::model::EntityRecord LoadEntity(db::Repository& repo, const std::string& id) {
  auto tx     = repo.Begin();
  auto entity = repo.GetEntity(*tx, id);
  tx->Commit();
  if (!entity) throw std::runtime_error("entity " + id + " missing");
  return *entity;
}

// ---------------------------------------------------------------------------
// Wiring
// ---------------------------------------------------------------------------

struct Harness {
  config::Settings                                   settings;
  std::shared_ptr<db::memory::MemoryRepository>      repository;
  std::shared_ptr<util::ManualClock>                 clock;
  std::shared_ptr<gateway::AdPlatformGateway>        gateway;
  std::shared_ptr<ledger::EventLedger>               ledger;
  std::shared_ptr<guardrails::GuardrailChain>        guardrails;
  std::shared_ptr<optimization::OptimizationService> optimizer;
  std::shared_ptr<autonomous::AutonomousWorker>      worker;

  service::ServiceContext Context() const {
    service::ServiceContext ctx;
    ctx.repository = repository;
    ctx.clock      = clock;
    ctx.calculator = std::make_shared<analytics::RoasCalculator>(settings.roas, repository, clock, 7);
    ctx.prediction = std::make_shared<analytics::PredictionEngine>(settings.prediction, settings.roas.default_prior_roas, repository, clock);
    ctx.recorder   = std::make_shared<analytics::MetricsRecorder>(repository, ctx.calculator, ctx.prediction, clock);
    ctx.allocator  = std::make_shared<analytics::BudgetAllocator>(settings.optimizer, settings.roas.min_sample_size);
    ctx.optimizer  = optimizer;
    ctx.worker     = worker;
    return ctx;
  }
};

// A null gateway means StoreGateway over the same repository; a null ledger records.
inline Harness MakeHarness(config::Settings settings = {}, std::shared_ptr<gateway::AdPlatformGateway> gateway = nullptr,
                           std::shared_ptr<ledger::EventLedger> ledger = nullptr) {
  Harness h;
  h.settings   = settings;
  h.repository = std::make_shared<db::memory::MemoryRepository>();
  h.clock      = std::make_shared<util::ManualClock>(util::FromUnixMillis(kEpochMs));
  h.gateway    = gateway ? std::move(gateway) : std::make_shared<gateway::StoreGateway>(h.repository, h.clock);
  h.ledger     = ledger ? std::move(ledger) : std::make_shared<RecordingLedger>();

  auto policy  = std::make_shared<guardrails::PolicyEngine>(settings.policy, h.clock);
  auto safety  = std::make_shared<guardrails::SafetyEngine>(settings.safety, h.clock);
  h.guardrails = std::make_shared<guardrails::GuardrailChain>(policy, safety);

  auto executor = std::make_shared<optimization::ActionExecutor>(h.gateway);
  h.optimizer   = std::make_shared<optimization::OptimizationService>(settings, h.repository, h.clock, executor, h.guardrails, h.ledger);
  h.worker      = std::make_shared<autonomous::AutonomousWorker>(settings, h.repository, h.optimizer, h.ledger, h.clock);
  return h;
}

// Queue-ready action on `ad_id`; the ad must exist for execution.
inline db::model::ActionRecord MakeAction(model::ActionType type, const std::string& campaign_id, const std::string& ad_id, double pct,
                                          double old_budget, double confidence = 0.8) {
  db::model::ActionRecord action;
  action.type           = type;
  action.target_level   = model::TargetLevel::kAd;
  action.target_id      = ad_id;
  action.campaign_id    = campaign_id;
  action.adset_id       = campaign_id + "-set";
  action.ad_id          = ad_id;
  action.amount_pct     = pct;
  action.old_budget_usd = old_budget;
  action.new_budget_usd = type == model::ActionType::kPause ? 0.0 : old_budget * (1.0 + pct);
  action.amount_usd     = action.new_budget_usd - old_budget;
  action.confidence     = confidence;
  action.roas_value     = 2.5;
  action.reason         = "test";
  return action;
}

} // namespace autopilot::testing
