#include "autonomous_service.hpp"

#include "internal/autonomous/autonomous_worker.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace autopilot::service {

using namespace autopilot::v1;

namespace {

autopilot::v1::WorkerMode ToProto(config::WorkerMode mode) {
  switch (mode) {
    case config::WorkerMode::kSuggest:
      return WORKER_MODE_SUGGEST;
    case config::WorkerMode::kAuto:
      return WORKER_MODE_AUTO;
  }
  return WORKER_MODE_UNSPECIFIED;
}

config::WorkerMode FromProto(autopilot::v1::WorkerMode mode) {
  switch (mode) {
    case WORKER_MODE_SUGGEST:
      return config::WorkerMode::kSuggest;
    case WORKER_MODE_AUTO:
      return config::WorkerMode::kAuto;
    default:
      throw util::ValidationError("mode must be suggest or auto");
  }
}

} // namespace

AutonomousService::AutonomousService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TickStats AutonomousService::RunOnce(const RunOnceRequest&) {
  return ObserveRpc("AutonomousService.RunOnce", [&] { return ctx_.worker->RunOnce(); });
}

WorkerStatus AutonomousService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("AutonomousService.GetStatus", [&] { return Status(); });
}

PolicySettings AutonomousService::GetPolicies(const GetPoliciesRequest&) {
  return ObserveRpc("AutonomousService.GetPolicies", [&] {
    const auto& settings = ctx_.worker->Settings();
    const auto& policy   = settings.policy;
    const auto& safety   = settings.safety;

    PolicySettings resp;
    auto&          thresholds = *resp.mutable_thresholds();
    thresholds["max_daily_change_pct"]    = policy.max_daily_change_pct;
    thresholds["max_auto_change_pct"]     = policy.max_auto_change_pct;
    thresholds["max_campaign_budget_usd"] = policy.max_campaign_budget_usd;
    thresholds["hard_stop_roas"]          = policy.hard_stop_roas;
    thresholds["hard_stop_confidence"]    = policy.hard_stop_confidence;
    thresholds["min_spend_usd"]           = policy.min_spend_usd;
    thresholds["min_home_pct"]            = policy.min_home_pct;
    thresholds["max_single_country_pct"]  = policy.max_single_country_pct;
    thresholds["creative_embargo_hours"]  = policy.creative_embargo_hours;
    thresholds["max_daily_spend_usd"]     = safety.max_daily_spend_usd;
    thresholds["min_age_hours"]           = safety.min_age_hours;
    thresholds["min_impressions"]         = static_cast<double>(safety.min_impressions);
    thresholds["action_cooldown_hours"]   = safety.action_cooldown_hours;
    thresholds["auto_min_confidence"]     = settings.worker.auto_min_confidence;

    resp.set_require_human_approval_creatives(policy.require_human_approval_creatives);
    resp.set_home_market(policy.home_market);
    resp.set_mode(ToProto(ctx_.worker->Mode()));
    return resp;
  });
}

WorkerStatus AutonomousService::SetMode(const SetModeRequest& req) {
  return ObserveRpc("AutonomousService.SetMode", [&] {
    ctx_.worker->SetMode(FromProto(req.mode()));
    return Status();
  });
}

WorkerStatus AutonomousService::StartWorker(const WorkerControlRequest&) {
  return ObserveRpc("AutonomousService.StartWorker", [&] {
    ctx_.worker->Start();
    return Status();
  });
}

WorkerStatus AutonomousService::StopWorker(const WorkerControlRequest&) {
  return ObserveRpc("AutonomousService.StopWorker", [&] {
    ctx_.worker->Stop();
    return Status();
  });
}

WorkerStatus AutonomousService::Status() const {
  const auto  snapshot = ctx_.worker->Status();
  const auto& settings = ctx_.worker->Settings();

  WorkerStatus status;
  status.set_enabled(snapshot.enabled);
  status.set_mode(ToProto(snapshot.mode));
  status.set_is_running(snapshot.is_running);
  status.set_interval_seconds(settings.worker.interval_seconds);
  status.set_max_daily_spend_usd(settings.safety.max_daily_spend_usd);
  status.set_max_actions_per_tick(settings.worker.max_actions_per_tick);
  status.set_hard_stop_roas(settings.policy.hard_stop_roas);
  status.set_embargo_hours(settings.optimizer.embargo_hours);
  if (snapshot.last_tick) {
    *status.mutable_last_tick() = *snapshot.last_tick;
  }
  return status;
}

} // namespace autopilot::service
