#include "optimization_service.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

#include "internal/db/api/check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/format.hpp"
#include "internal/util/uuid.hpp"

namespace autopilot::optimization {

using autopilot::model::ActionStatus;
using autopilot::model::ActionType;
using autopilot::model::TargetLevel;
using db::model::ActionRecord;
using db::model::EntityRecord;
using db::model::RoasMetricsRecord;

namespace {

constexpr uint32_t kMaxCandidatesPerDirection = 10;
constexpr uint32_t kMaxTransitionAttempts     = 3;

constexpr std::chrono::hours Days(uint32_t d) {
  return std::chrono::hours(24 * static_cast<int64_t>(d));
}

void Set(google::protobuf::Struct& payload, const std::string& key, const std::string& value) {
  (*payload.mutable_fields())[key].set_string_value(value);
}

void Set(google::protobuf::Struct& payload, const std::string& key, double value) {
  (*payload.mutable_fields())[key].set_number_value(value);
}

// A suggestion past its TTL can no longer be approved or executed.
void RejectExpiredSuggestion(const ActionRecord& action, uint64_t now_ms, const std::string& verb) {
  if (action.status == ActionStatus::kSuggested && action.expires_at_ms != 0 && action.expires_at_ms <= now_ms) {
    throw util::InvalidState("action " + action.action_id + " expired, cannot " + verb);
  }
}

// Increase by ROAS band, before the daily cap.
double ScaleUpPct(double roas) {
  if (roas >= 5.0) return 1.0;
  if (roas >= 4.0) return 0.75;
  if (roas >= 3.5) return 0.50;
  if (roas >= 3.0) return 0.25;
  return 0.10;
}

// Newest row per ad; rows arrive newest first.
std::vector<RoasMetricsRecord> LatestPerAd(const std::vector<RoasMetricsRecord>& rows) {
  std::vector<RoasMetricsRecord>  latest;
  std::unordered_set<std::string> seen;
  for (const auto& row : rows) {
    if (row.scope.ad_id.empty()) continue;
    if (seen.insert(row.scope.ad_id).second) latest.push_back(row);
  }
  return latest;
}

ActionRecord AdAction(ActionType type, const RoasMetricsRecord& row, const EntityRecord& ad, double pct) {
  ActionRecord action;
  action.action_id    = util::NewId();
  action.type         = type;
  action.target_level = TargetLevel::kAd;
  action.target_id    = row.scope.ad_id;
  action.campaign_id  = row.scope.campaign_id;
  action.adset_id     = row.scope.adset_id;
  action.ad_id        = row.scope.ad_id;

  action.amount_pct     = pct;
  action.old_budget_usd = ad.daily_budget_usd;
  action.new_budget_usd = type == ActionType::kPause ? 0.0 : ad.daily_budget_usd * (1.0 + pct);
  action.amount_usd     = action.new_budget_usd - action.old_budget_usd;

  action.confidence = row.confidence_score;
  action.roas_value = row.actual_roas;
  return action;
}

} // namespace

OptimizationService::OptimizationService(config::Settings settings, std::shared_ptr<db::Repository> repository,
                                         std::shared_ptr<util::Clock> clock, std::shared_ptr<ActionExecutor> executor,
                                         std::shared_ptr<guardrails::GuardrailChain> guardrails, std::shared_ptr<ledger::EventLedger> ledger)
    : settings_(std::move(settings)),
      repository_(std::move(repository)),
      clock_(std::move(clock)),
      executor_(std::move(executor)),
      guardrails_(std::move(guardrails)),
      ledger_(std::move(ledger)),
      allocator_(settings_.optimizer, settings_.roas.min_sample_size) {
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

std::vector<ActionRecord> OptimizationService::EvaluateCampaign(const std::string& campaign_id, uint32_t lookback_days,
                                                                std::optional<double> min_confidence) {
  observability::SpanScope span("optimization.evaluate_campaign");
  span.SetAttribute("campaign.id", campaign_id);

  const auto& opt      = settings_.optimizer;
  const auto  lookback = lookback_days == 0 ? opt.lookback_days : lookback_days;
  const auto  min_conf = min_confidence.value_or(opt.min_confidence);
  const auto  now      = clock_->Now();

  auto tx = repository_->Begin();

  const auto campaign = repository_->GetEntity(*tx, campaign_id);
  if (!campaign || campaign->level != TargetLevel::kCampaign) {
    AUTOPILOT_LOG_WARN("Campaign not found", {observability::StringField("campaign_id", campaign_id)});
    return {};
  }

  const auto age_hours = util::HoursBetween(util::FromUnixMillis(campaign->created_at_ms), now);
  if (campaign->status != db::model::kEntityActive || age_hours < opt.embargo_hours) {
    AUTOPILOT_LOG_INFO("Campaign not eligible for optimization",
                       {observability::StringField("campaign_id", campaign_id), observability::StringField("status", campaign->status),
                        observability::DoubleField("age_hours", age_hours)});
    return {};
  }

  db::RoasMetricsQuery query;
  query.scope.campaign_id = campaign_id;
  query.ad_level_only     = true;
  query.since_ms          = util::ToUnixMillis(now - Days(lookback));

  const auto latest = LatestPerAd(repository_->ListRoasMetrics(*tx, query));
  if (latest.empty()) {
    AUTOPILOT_LOG_INFO("No ROAS metrics found", {observability::StringField("campaign_id", campaign_id)});
    return {};
  }

  const auto min_samples = settings_.roas.min_sample_size;

  std::vector<ActionRecord> actions;

  // Scale up: best first
  std::vector<RoasMetricsRecord> up;
  for (const auto& row : latest) {
    if (row.actual_roas >= opt.scale_up_min_roas && row.confidence_score >= min_conf && !row.is_outlier && row.sample_size >= min_samples) {
      up.push_back(row);
    }
  }
  std::stable_sort(up.begin(), up.end(), [](const auto& a, const auto& b) { return a.actual_roas > b.actual_roas; });
  if (up.size() > kMaxCandidatesPerDirection) up.resize(kMaxCandidatesPerDirection);

  for (const auto& row : up) {
    const auto ad = repository_->GetEntity(*tx, row.scope.ad_id);
    if (!ad || ad->status != db::model::kEntityActive) continue;
    if (InCooldown(*tx, row.scope.ad_id, ActionType::kScaleUp, now)) continue;

    auto action           = AdAction(ActionType::kScaleUp, row, *ad, std::min(ScaleUpPct(row.actual_roas), opt.max_daily_change_pct));
    action.reason         = "high_roas_performance";
    action.reason_details = "ROAS " + util::FormatFixed(row.actual_roas, 2) + " exceeds threshold " + util::FormatFixed(opt.scale_up_min_roas, 2);
    action.safety_score   = std::min(row.confidence_score, 0.9);
    if (PassesGuardRails(action, min_conf)) actions.push_back(std::move(action));
  }

  // Scale down / pause: worst first
  std::vector<RoasMetricsRecord> down;
  for (const auto& row : latest) {
    if (row.actual_roas <= opt.scale_down_max_roas && row.sample_size >= min_samples) down.push_back(row);
  }
  std::stable_sort(down.begin(), down.end(), [](const auto& a, const auto& b) { return a.actual_roas < b.actual_roas; });
  if (down.size() > kMaxCandidatesPerDirection) down.resize(kMaxCandidatesPerDirection);

  for (const auto& row : down) {
    const bool pause = row.actual_roas < opt.pause_roas;
    const auto type  = pause ? ActionType::kPause : ActionType::kScaleDown;

    const auto ad = repository_->GetEntity(*tx, row.scope.ad_id);
    if (!ad || ad->status != db::model::kEntityActive) continue;
    if (InCooldown(*tx, row.scope.ad_id, type, now)) continue;

    auto action   = AdAction(type, row, *ad, pause ? -1.0 : std::max(-0.30, -opt.max_daily_change_pct));
    action.reason = pause ? "roas_critically_low" : "roas_below_threshold";
    action.reason_details =
        "ROAS " + util::FormatFixed(row.actual_roas, 2) + " below threshold " + util::FormatFixed(opt.scale_down_max_roas, 2);
    action.safety_score = std::min(row.confidence_score, 0.8);
    if (PassesGuardRails(action, min_conf)) actions.push_back(std::move(action));
  }

  if (latest.size() >= opt.reallocate_min_ads) {
    auto realloc = BuildReallocation(*tx, *campaign, latest, now);
    if (realloc && PassesGuardRails(*realloc, min_conf)) actions.push_back(std::move(*realloc));
  }

  tx->Commit();

  if (actions.size() > opt.max_actions_per_campaign) actions.resize(opt.max_actions_per_campaign);

  AUTOPILOT_LOG_INFO("Evaluated campaign", {observability::StringField("campaign_id", campaign_id),
                                            observability::IntField("action_count", static_cast<int64_t>(actions.size()))});
  return actions;
}

std::optional<ActionRecord> OptimizationService::BuildReallocation(db::Transaction& tx, const EntityRecord& campaign,
                                                                   const std::vector<RoasMetricsRecord>& latest, util::TimePoint now) {
  const auto& opt = settings_.optimizer;

  double max_roas = 0.0;
  double min_roas = 0.0;
  bool   any      = false;
  for (const auto& row : latest) {
    if (row.actual_roas <= 0.0) continue;
    max_roas = any ? std::max(max_roas, row.actual_roas) : row.actual_roas;
    min_roas = any ? std::min(min_roas, row.actual_roas) : row.actual_roas;
    any      = true;
  }
  if (!any || max_roas / min_roas < opt.reallocate_threshold_diff) return std::nullopt;
  if (InCooldown(tx, campaign.id, ActionType::kReallocate, now)) return std::nullopt;

  double                   total_budget = 0.0;
  std::vector<std::string> affected;
  for (const auto& row : latest) {
    if (const auto ad = repository_->GetEntity(tx, row.scope.ad_id)) total_budget += ad->daily_budget_usd;
    affected.push_back(row.scope.ad_id);
  }

  ActionRecord action;
  action.action_id         = util::NewId();
  action.type              = ActionType::kReallocate;
  action.target_level      = TargetLevel::kCampaign;
  action.target_id         = campaign.id;
  action.campaign_id       = campaign.id;
  action.old_budget_usd    = total_budget;
  action.new_budget_usd    = total_budget;
  action.reason            = "optimize_budget_allocation";
  action.reason_details    = "ROAS variance detected (max=" + util::FormatFixed(max_roas, 2) + ", min=" + util::FormatFixed(min_roas, 2) + ")";
  action.confidence        = kReallocateConfidence;
  action.safety_score      = kReallocateSafetyScore;
  action.reallocation_plan = allocator_.ComputeReallocations(latest, total_budget);
  action.affected_ad_ids   = std::move(affected);
  return action;
}

bool OptimizationService::InCooldown(db::Transaction& tx, const std::string& target_id, ActionType type, util::TimePoint now) {
  if (const auto last = repository_->LatestExecutedAction(tx, target_id, type)) {
    if (util::HoursBetween(util::FromUnixMillis(last->executed_at_ms), now) < settings_.optimizer.cooldown_hours) return true;
  }

  // One open action per (target, type).
  db::ActionFilter open;
  open.target_id           = target_id;
  open.type                = type;
  open.statuses            = {ActionStatus::kSuggested, ActionStatus::kPending, ActionStatus::kExecuting};
  open.limit               = 1;
  open.exclude_stale_at_ms = util::ToUnixMillis(now);
  return !repository_->ListActions(tx, open).empty();
}

bool OptimizationService::PassesGuardRails(const ActionRecord& action, double min_confidence) const {
  if (action.confidence < min_confidence) {
    AUTOPILOT_LOG_DEBUG("Candidate rejected: confidence too low", {observability::StringField("action_id", action.action_id)});
    return false;
  }
  if (action.type != ActionType::kPause && std::abs(action.amount_pct) > settings_.optimizer.max_daily_change_pct) {
    AUTOPILOT_LOG_DEBUG("Candidate rejected: budget change too large", {observability::StringField("action_id", action.action_id)});
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Queue lifecycle
// ---------------------------------------------------------------------------

ActionRecord OptimizationService::EnqueueAction(ActionRecord action, const std::string& created_by) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  if (action.action_id.empty()) action.action_id = util::NewId();
  action.status        = ActionStatus::kSuggested;
  action.created_by    = created_by;
  action.created_at_ms = now_ms;
  action.updated_at_ms = now_ms;
  action.expires_at_ms = now_ms + static_cast<uint64_t>(settings_.optimizer.action_ttl_hours) * 3600ULL * 1000ULL;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertAction(*tx, action), "enqueue action " + action.action_id);
  tx->Commit();

  google::protobuf::Struct payload;
  Set(payload, "action_type", std::string(model::ToString(action.type)));
  Set(payload, "target_id", action.target_id);
  Set(payload, "amount_pct", action.amount_pct);
  Set(payload, "confidence", action.confidence);
  Set(payload, "reason", action.reason);
  Record(ledger::kOptimizationSuggested, action, created_by, std::move(payload));

  AUTOPILOT_LOG_INFO("Enqueued action", {observability::StringField("action_id", action.action_id),
                                         observability::StringField("action_type", model::ToString(action.type)),
                                         observability::StringField("target_id", action.target_id)});
  return action;
}

ActionRecord OptimizationService::ApproveAction(const std::string& action_id, const std::string& approved_by) {
  auto action = Transition(
      action_id, {ActionStatus::kSuggested}, ActionStatus::kPending, "approve",
      [&](ActionRecord& a, uint64_t now_ms) {
        a.approved_by    = approved_by;
        a.approved_at_ms = now_ms;
      },
      [](const ActionRecord& a, uint64_t now_ms) { RejectExpiredSuggestion(a, now_ms, "approve"); });

  Record(ledger::kOptimizationApproved, action, approved_by);
  return action;
}

ActionRecord OptimizationService::CancelAction(const std::string& action_id, const std::string& cancelled_by) {
  auto action =
      Transition(action_id, {ActionStatus::kSuggested, ActionStatus::kPending}, ActionStatus::kCancelled, "cancel", [](ActionRecord&, uint64_t) {});

  Record(ledger::kOptimizationCancelled, action, cancelled_by);
  return action;
}

ExecuteOutcome OptimizationService::ExecuteAction(const std::string& action_id, const std::string& run_by, bool dry_run) {
  observability::SpanScope span("optimization.execute_action");
  span.SetAttribute("action.id", action_id);

  if (dry_run) {
    auto action = GetAction(action_id);
    if (action.status != ActionStatus::kSuggested && action.status != ActionStatus::kPending) {
      throw util::InvalidState("action " + action_id + " status is " + std::string(model::ToString(action.status)) + ", cannot execute");
    }
    RejectExpiredSuggestion(action, util::ToUnixMillis(clock_->Now()), "execute");

    autopilot::v1::ExecutionResult result;
    result.set_status("dry_run");
    result.set_message("Dry run - no actual execution");
    return {std::move(action), std::move(result)};
  }

  auto action = Transition(
      action_id, {ActionStatus::kSuggested, ActionStatus::kPending}, ActionStatus::kExecuting, "execute",
      [&](ActionRecord& a, uint64_t) { a.executed_by = run_by; },
      [](const ActionRecord& a, uint64_t now_ms) { RejectExpiredSuggestion(a, now_ms, "execute"); });

  const auto type = std::string(model::ToString(action.type));

  autopilot::v1::ExecutionResult result;
  try {
    result = executor_->Execute(action);
  } catch (const std::exception& e) {
    const std::string error = e.what();
    span.RecordException(error);

    action = Transition(action_id, {ActionStatus::kExecuting}, ActionStatus::kFailed, "fail", [&](ActionRecord& a, uint64_t now_ms) {
      a.execution_error = error;
      a.executed_at_ms  = now_ms;
    });

    AUTOPILOT_LOG_ERROR("Action execution failed", {observability::StringField("action_id", action_id),
                                                    observability::StringField("action_type", type), observability::StringField("error", error)});
    observability::Metrics::Instance().RecordActionOutcome("failed", type);

    google::protobuf::Struct payload;
    Set(payload, "error", error);
    Record(ledger::kOptimizationFailed, action, run_by, std::move(payload));

    autopilot::v1::ExecutionResult failed;
    failed.set_status("failed");
    failed.set_message(error);
    return {std::move(action), std::move(failed)};
  }

  action = Transition(action_id, {ActionStatus::kExecuting}, ActionStatus::kExecuted, "complete", [&](ActionRecord& a, uint64_t now_ms) {
    a.execution_result = result;
    a.executed_at_ms   = now_ms;
  });

  AUTOPILOT_LOG_INFO("Action executed", {observability::StringField("action_id", action_id), observability::StringField("action_type", type),
                                         observability::StringField("message", result.message())});
  observability::Metrics::Instance().RecordActionOutcome("executed", type);

  google::protobuf::Struct payload;
  Set(payload, "message", result.message());
  Record(ledger::kOptimizationExecuted, action, run_by, std::move(payload));

  return {std::move(action), std::move(result)};
}

ActionRecord OptimizationService::Transition(const std::string& action_id, const std::vector<ActionStatus>& expected, ActionStatus next,
                                             const std::string& verb, const Mutation& mutate, const Guard& guard) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      const auto now_ms = util::ToUnixMillis(clock_->Now());

      auto tx = repository_->Begin();

      if (guard) {
        const auto current = repository_->GetAction(*tx, action_id);
        if (!current) {
          throw util::NotFound("action " + action_id + " not found");
        }
        guard(*current, now_ms);
      }

      const auto cas = repository_->CompareAndSetActionStatus(*tx, {action_id, expected, next, now_ms});
      if (cas.code == db::ErrorCode::NotFound) {
        throw util::NotFound("action " + action_id + " not found");
      }
      if (cas.code == db::ErrorCode::StatusMismatch) {
        throw util::InvalidState("action " + action_id + " status is " + cas.message + ", cannot " + verb);
      }
      db::ThrowIfDbError(cas, verb + " action " + action_id);

      auto action = repository_->GetAction(*tx, action_id);
      if (!action) {
        throw util::NotFound("action " + action_id + " not found");
      }

      mutate(*action, now_ms);
      action->updated_at_ms = now_ms;
      db::ThrowIfDbError(repository_->UpdateAction(*tx, *action), verb + " action " + action_id);

      tx->Commit();
      return *action;
    } catch (const util::Conflict& e) {
      if (attempt >= kMaxTransitionAttempts) throw;
      AUTOPILOT_LOG_DEBUG("Retrying action transition", {observability::StringField("action_id", action_id),
                                                         observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
    }
  }
}

ActionRecord OptimizationService::GetAction(const std::string& action_id) {
  auto tx     = repository_->Begin();
  auto action = repository_->GetAction(*tx, action_id);
  tx->Commit();

  if (!action) {
    throw util::NotFound("action " + action_id + " not found");
  }
  return std::move(*action);
}

std::vector<ActionRecord> OptimizationService::ListActions(const ActionQuery& query) {
  db::ActionFilter filter;
  filter.campaign_id         = query.campaign_id;
  filter.target_id           = query.target_id;
  filter.statuses            = query.statuses.empty() ? std::vector<ActionStatus>{ActionStatus::kSuggested, ActionStatus::kPending} : query.statuses;
  filter.type                = query.type;
  filter.limit               = query.limit == 0 ? kDefaultListLimit : std::min(query.limit, kMaxListLimit);
  filter.exclude_stale_at_ms = util::ToUnixMillis(clock_->Now());

  auto tx      = repository_->Begin();
  auto actions = repository_->ListActions(*tx, filter);
  tx->Commit();
  return actions;
}

uint64_t OptimizationService::ExpireStaleActions() {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  db::ActionFilter filter;
  filter.statuses = {ActionStatus::kSuggested};

  std::vector<std::string> stale;
  {
    auto tx = repository_->Begin();
    for (const auto& action : repository_->ListActions(*tx, filter)) {
      if (action.expires_at_ms != 0 && action.expires_at_ms <= now_ms) stale.push_back(action.action_id);
    }
    tx->Commit();
  }

  uint64_t expired = 0;
  for (const auto& id : stale) {
    try {
      auto action = Transition(id, {ActionStatus::kSuggested}, ActionStatus::kCancelled, "expire",
                               [](ActionRecord& a, uint64_t) { a.execution_error = "expired"; });
      Record(ledger::kOptimizationExpired, action, "system");
      observability::Metrics::Instance().RecordActionOutcome("expired", model::ToString(action.type));
      ++expired;
    } catch (const util::InvalidState& e) {
      // approved or executed since the scan
      AUTOPILOT_LOG_DEBUG("Skipping expiry", {observability::StringField("action_id", id), observability::StringField("reason", e.what())});
    }
  }

  if (expired > 0) {
    AUTOPILOT_LOG_INFO("Expired stale actions", {observability::IntField("count", static_cast<int64_t>(expired))});
  }
  return expired;
}

autopilot::v1::QueueStats OptimizationService::QueueStats() {
  const auto since_ms = util::ToUnixMillis(util::StartOfDay(clock_->Now()));

  auto       tx     = repository_->Begin();
  const auto counts = repository_->CountQueue(*tx, since_ms);
  tx->Commit();

  const auto open = counts.suggested + counts.pending;
  const auto avg  = open == 0 ? 0.0 : counts.open_confidence_sum / static_cast<double>(open);

  autopilot::v1::QueueStats stats;
  stats.set_total_suggested(counts.suggested);
  stats.set_total_pending(counts.pending);
  stats.set_total_executing(counts.executing);
  stats.set_total_executed_today(counts.executed_since);
  stats.set_total_failed_today(counts.failed_since);
  stats.set_avg_confidence(std::round(avg * 1000.0) / 1000.0);

  auto& metrics = observability::Metrics::Instance();
  metrics.SetQueueDepth("suggested", counts.suggested);
  metrics.SetQueueDepth("pending", counts.pending);
  metrics.SetQueueDepth("executing", counts.executing);
  return stats;
}

RunSummary OptimizationService::RunOptimization(const std::vector<std::string>& campaign_ids, bool dry_run, const std::string& created_by) {
  auto ids = campaign_ids;
  if (ids.empty()) {
    auto tx = repository_->Begin();
    for (const auto& campaign : repository_->ListActiveCampaigns(*tx, util::ToUnixMillis(clock_->Now()), kMaxCampaignsPerRun)) {
      ids.push_back(campaign.id);
    }
    tx->Commit();
  }

  RunSummary summary;
  for (const auto& id : ids) {
    if (summary.actions.size() >= settings_.optimizer.max_actions_per_run) break;

    std::vector<ActionRecord> candidates;
    try {
      candidates = EvaluateCampaign(id);
    } catch (const std::exception& e) {
      AUTOPILOT_LOG_ERROR("Campaign evaluation failed", {observability::StringField("campaign_id", id), observability::StringField("error", e.what())});
      continue;
    }
    ++summary.campaigns_evaluated;

    for (auto& candidate : candidates) {
      if (summary.actions.size() >= settings_.optimizer.max_actions_per_run) break;
      if (dry_run) {
        summary.actions.push_back(std::move(candidate));
        continue;
      }
      summary.actions.push_back(EnqueueAction(std::move(candidate), created_by));
      ++summary.actions_enqueued;
    }
  }

  AUTOPILOT_LOG_INFO("Optimization run finished", {observability::IntField("campaigns_evaluated", static_cast<int64_t>(summary.campaigns_evaluated)),
                                                   observability::IntField("actions_enqueued", static_cast<int64_t>(summary.actions_enqueued)),
                                                   observability::BoolField("dry_run", dry_run)});
  return summary;
}

// ---------------------------------------------------------------------------
// Guardrail context
// ---------------------------------------------------------------------------

guardrails::ActionContext OptimizationService::BuildContext(db::Transaction& tx, const ActionRecord& action, const EntityRecord* campaign,
                                                            const std::vector<RoasMetricsRecord>& metrics, bool is_auto) {
  const auto now = clock_->Now();

  guardrails::ActionContext ctx;
  ctx.is_auto_mode       = is_auto;
  ctx.current_budget_usd = action.old_budget_usd;
  ctx.new_budget_usd     = action.new_budget_usd;
  ctx.entity_id          = action.target_id;

  if (!metrics.empty()) {
    double roas       = 0.0;
    double confidence = 0.0;
    for (const auto& row : metrics) {
      roas += row.actual_roas;
      confidence += row.confidence_score;
      ctx.spend_usd += row.total_cost_usd;
      ctx.impressions += row.impressions;
    }
    ctx.roas       = roas / static_cast<double>(metrics.size());
    ctx.confidence = confidence / static_cast<double>(metrics.size());
  }

  if (campaign) ctx.created_at = util::FromUnixMillis(campaign->created_at_ms);

  db::model::Scope today;
  today.campaign_id = action.campaign_id;
  for (const auto& insight : repository_->ListInsights(tx, today, util::ToUnixMillis(util::StartOfDay(now)), util::ToUnixMillis(now) + 1)) {
    ctx.spend_today_usd += insight.spend_usd;
  }

  if (const auto last = repository_->LatestExecutedAction(tx, action.target_id, action.type)) {
    ctx.last_action_time = util::FromUnixMillis(last->executed_at_ms);
  }
  return ctx;
}

guardrails::Verdict OptimizationService::Vet(const ActionRecord& action, bool is_auto) {
  guardrails::ActionContext ctx;
  {
    auto tx = repository_->Begin();

    const auto campaign = repository_->GetEntity(*tx, action.campaign_id);

    db::RoasMetricsQuery query;
    query.scope.campaign_id = action.campaign_id;
    query.since_ms          = util::ToUnixMillis(clock_->Now() - Days(settings_.worker.metrics_lookback_days));

    const auto metrics = repository_->ListRoasMetrics(*tx, query);

    ctx = BuildContext(*tx, action, campaign ? &*campaign : nullptr, metrics, is_auto);
    tx->Commit();
  }
  return guardrails_->Vet(action.type, ctx);
}

void OptimizationService::Record(std::string_view event_type, const ActionRecord& action, const std::string& actor,
                                 google::protobuf::Struct payload) {
  ledger::LedgerEvent event;
  event.event_type = std::string(event_type);
  event.action_id  = action.action_id;
  event.entity_id  = action.target_id;
  event.actor      = actor;
  event.payload    = std::move(payload);
  event.at         = clock_->Now();
  ledger::Notify(ledger_, event);
}

} // namespace autopilot::optimization
