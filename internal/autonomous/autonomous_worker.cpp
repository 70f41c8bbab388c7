#include "autonomous_worker.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace autopilot::autonomous {

using autopilot::model::ActionStatus;
using autopilot::model::ActionType;

namespace {

constexpr const char* kWorkerActor = "autonomous_worker";

} // namespace

AutonomousWorker::AutonomousWorker(config::Settings settings, std::shared_ptr<db::Repository> repository,
                                   std::shared_ptr<optimization::OptimizationService> optimizer, std::shared_ptr<ledger::EventLedger> ledger,
                                   std::shared_ptr<util::Clock> clock)
    : settings_(std::move(settings)),
      repository_(std::move(repository)),
      optimizer_(std::move(optimizer)),
      ledger_(std::move(ledger)),
      clock_(std::move(clock)),
      mode_(settings_.worker.mode) {
}

AutonomousWorker::~AutonomousWorker() {
  Stop();
}

void AutonomousWorker::Start() {
  if (!settings_.worker.enabled) {
    AUTOPILOT_LOG_INFO("Autonomous worker disabled; not starting");
    return;
  }
  if (running_.exchange(true)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }

  AUTOPILOT_LOG_INFO("Autonomous worker started", {observability::StringField("mode", config::ToString(Mode())),
                                                   observability::IntField("interval_seconds", settings_.worker.interval_seconds)});
  thread_ = std::thread(&AutonomousWorker::Run, this);
}

void AutonomousWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false) && !thread_.joinable()) {
      return;
    }
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  AUTOPILOT_LOG_INFO("Autonomous worker stopped");
}

bool AutonomousWorker::IsRunning() const {
  return running_;
}

void AutonomousWorker::SetMode(config::WorkerMode mode) {
  mode_ = mode;
  AUTOPILOT_LOG_INFO("Autonomous mode changed", {observability::StringField("mode", config::ToString(mode))});
}

config::WorkerMode AutonomousWorker::Mode() const {
  return mode_;
}

WorkerSnapshot AutonomousWorker::Status() const {
  WorkerSnapshot snapshot;
  snapshot.enabled    = settings_.worker.enabled;
  snapshot.is_running = running_;
  snapshot.mode       = Mode();

  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.last_tick = last_tick_;
  return snapshot;
}

bool AutonomousWorker::IsSafeForAuto(const db::model::ActionRecord& action) const {
  switch (action.type) {
    case ActionType::kPause:
      return true;
    case ActionType::kReallocate:
    case ActionType::kUnspecified:
      return false;
    case ActionType::kScaleUp:
    case ActionType::kScaleDown:
    case ActionType::kResume:
      break;
  }

  if (action.confidence < settings_.worker.auto_min_confidence) return false;
  if (model::ChangesBudget(action.type) && std::abs(action.amount_pct) > settings_.policy.max_auto_change_pct) return false;
  return true;
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

void AutonomousWorker::Run() {
  while (running_) {
    bool failed = false;
    try {
      RunOnce();
    } catch (const std::exception& e) {
      failed = true;
      AUTOPILOT_LOG_ERROR("Autonomous tick failed", {observability::StringField("error", e.what())});
    }

    const auto wait = std::chrono::seconds(failed ? settings_.worker.error_backoff_seconds : settings_.worker.interval_seconds);

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, wait, [this] { return !running_; });
  }
}

autopilot::v1::TickStats AutonomousWorker::RunOnce() {
  std::lock_guard<std::mutex> tick_lock(tick_mutex_);

  observability::SpanScope span("autonomous.tick");
  const auto               started = std::chrono::steady_clock::now();

  autopilot::v1::TickStats stats;
  *stats.mutable_tick_started_at() = util::ToProto(clock_->Now());

  try {
    stats.set_actions_expired(optimizer_->ExpireStaleActions());
  } catch (const std::exception& e) {
    AUTOPILOT_LOG_ERROR("Expiring stale actions failed", {observability::StringField("error", e.what())});
    stats.add_errors(std::string("Expiry error: ") + e.what());
  }

  std::vector<db::model::EntityRecord> campaigns;
  try {
    const auto min_age_hours = std::max(settings_.safety.min_age_hours, settings_.optimizer.embargo_hours);
    const auto cutoff        = clock_->Now() - std::chrono::hours(min_age_hours);

    auto tx   = repository_->Begin();
    campaigns = repository_->ListActiveCampaigns(*tx, util::ToUnixMillis(cutoff), settings_.worker.max_campaigns_per_tick);
    tx->Commit();
  } catch (const std::exception& e) {
    AUTOPILOT_LOG_ERROR("Listing campaigns failed", {observability::StringField("error", e.what())});
    stats.add_errors(std::string("Tick error: ") + e.what());
  }

  AUTOPILOT_LOG_INFO("Found active campaigns to evaluate", {observability::IntField("count", static_cast<int64_t>(campaigns.size()))});

  for (const auto& campaign : campaigns) {
    if (stats.actions_generated() >= settings_.worker.max_actions_per_tick) break;

    try {
      ProcessCampaign(campaign, stats);
      stats.set_campaigns_evaluated(stats.campaigns_evaluated() + 1);
    } catch (const std::exception& e) {
      AUTOPILOT_LOG_ERROR("Campaign processing failed",
                          {observability::StringField("campaign_id", campaign.id), observability::StringField("error", e.what())});
      stats.add_errors("Campaign " + campaign.id + " error: " + e.what());
    }
  }

  *stats.mutable_tick_completed_at() = util::ToProto(clock_->Now());

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveTickDurationMs(elapsed_ms);
  span.SetAttribute("tick.campaigns_evaluated", static_cast<int64_t>(stats.campaigns_evaluated()));
  span.SetAttribute("tick.actions_generated", static_cast<int64_t>(stats.actions_generated()));

  ledger::LedgerEvent event;
  event.event_type = std::string(ledger::kAutonomousTickComplete);
  event.actor      = kWorkerActor;
  event.at         = clock_->Now();
  auto& fields     = *event.payload.mutable_fields();
  fields["campaigns_evaluated"].set_number_value(static_cast<double>(stats.campaigns_evaluated()));
  fields["actions_generated"].set_number_value(static_cast<double>(stats.actions_generated()));
  fields["actions_policy_blocked"].set_number_value(static_cast<double>(stats.actions_policy_blocked()));
  fields["actions_safety_blocked"].set_number_value(static_cast<double>(stats.actions_safety_blocked()));
  fields["actions_queued"].set_number_value(static_cast<double>(stats.actions_queued()));
  fields["actions_executed"].set_number_value(static_cast<double>(stats.actions_executed()));
  fields["actions_failed"].set_number_value(static_cast<double>(stats.actions_failed()));
  fields["actions_expired"].set_number_value(static_cast<double>(stats.actions_expired()));
  fields["errors"].set_number_value(static_cast<double>(stats.errors_size()));
  ledger::Notify(ledger_, event);

  AUTOPILOT_LOG_INFO("Autonomous tick completed", {observability::IntField("campaigns_evaluated", static_cast<int64_t>(stats.campaigns_evaluated())),
                                                   observability::IntField("actions_generated", static_cast<int64_t>(stats.actions_generated())),
                                                   observability::IntField("actions_executed", static_cast<int64_t>(stats.actions_executed())),
                                                   observability::IntField("actions_queued", static_cast<int64_t>(stats.actions_queued())),
                                                   observability::DoubleField("duration_ms", elapsed_ms)});

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_tick_ = stats;
  }
  return stats;
}

void AutonomousWorker::ProcessCampaign(const db::model::EntityRecord& campaign, autopilot::v1::TickStats& stats) {
  AUTOPILOT_LOG_DEBUG("Processing campaign", {observability::StringField("campaign_id", campaign.id)});

  const auto actions =
      optimizer_->EvaluateCampaign(campaign.id, settings_.worker.metrics_lookback_days, settings_.policy.hard_stop_confidence);

  const bool is_auto = Mode() == config::WorkerMode::kAuto;
  auto&      metrics = observability::Metrics::Instance();

  for (const auto& action : actions) {
    if (stats.actions_generated() >= settings_.worker.max_actions_per_tick) break;

    const auto type = model::ToString(action.type);
    stats.set_actions_generated(stats.actions_generated() + 1);
    metrics.RecordActionOutcome("generated", type);

    try {
      const auto verdict = optimizer_->Vet(action, is_auto);
      if (verdict.stage == guardrails::Stage::kPolicyBlocked) {
        stats.set_actions_policy_blocked(stats.actions_policy_blocked() + 1);
        metrics.RecordActionOutcome("policy_blocked", type);
        continue;
      }
      if (verdict.stage == guardrails::Stage::kSafetyBlocked) {
        stats.set_actions_safety_blocked(stats.actions_safety_blocked() + 1);
        metrics.RecordActionOutcome("safety_blocked", type);
        continue;
      }

      const auto queued = optimizer_->EnqueueAction(action, kWorkerActor);

      if (is_auto && IsSafeForAuto(queued)) {
        const auto outcome = optimizer_->ExecuteAction(queued.action_id, kWorkerActor);
        if (outcome.action.status == ActionStatus::kExecuted) {
          stats.set_actions_executed(stats.actions_executed() + 1);
        } else {
          stats.set_actions_failed(stats.actions_failed() + 1);
        }
        continue;
      }

      stats.set_actions_queued(stats.actions_queued() + 1);
      metrics.RecordActionOutcome("queued", type);
    } catch (const std::exception& e) {
      AUTOPILOT_LOG_ERROR("Action processing error", {observability::StringField("action_id", action.action_id),
                                                      observability::StringField("action_type", type), observability::StringField("error", e.what())});
      stats.set_actions_failed(stats.actions_failed() + 1);
    }
  }
}

} // namespace autopilot::autonomous
