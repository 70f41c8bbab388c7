#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace autopilot::db::memory {

using autopilot::model::ActionStatus;

namespace {

bool MatchesScope(const model::Scope& query, bool exact, const model::Scope& row) {
  return exact ? query == row : query.Contains(row);
}

bool InStatuses(const std::vector<ActionStatus>& statuses, ActionStatus status) {
  return statuses.empty() || std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

template <typename T>
void Truncate(std::vector<T>& rows, uint32_t limit) {
  if (limit > 0 && rows.size() > limit) {
    rows.resize(limit);
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Ad hierarchy
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEntity(Transaction& t, const model::EntityRecord& r) {
  TX(t).Mutable().entities[r.id] = r;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(id);
  if (it == s.entities.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t, const std::string& campaign_id) {
  std::vector<model::EntityRecord> out;
  for (const auto& [id, e] : TX(t).View().entities) {
    if (e.campaign_id == campaign_id && id != campaign_id) out.push_back(e);
  }
  return out;
}

std::vector<model::EntityRecord> MemoryRepository::ListActiveCampaigns(Transaction& t, uint64_t created_before_ms, uint32_t limit) {
  std::vector<model::EntityRecord> out;
  for (const auto& [_, e] : TX(t).View().entities) {
    if (e.level == autopilot::model::TargetLevel::kCampaign && e.status == model::kEntityActive && e.created_at_ms <= created_before_ms) {
      out.push_back(e);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  Truncate(out, limit);
  return out;
}

// ------------------------------------------------------------------
// Performance windows
// ------------------------------------------------------------------

Result MemoryRepository::InsertInsight(Transaction& t, model::InsightRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_insight_id++;
  s.insights.push_back(r);
  return Result::Ok();
}

std::vector<model::InsightRecord> MemoryRepository::ListInsights(Transaction& t, const model::Scope& scope, uint64_t start_ms, uint64_t end_ms) {
  std::vector<model::InsightRecord> out;
  for (const auto& r : TX(t).View().insights) {
    if (scope.Contains(r.scope) && r.date_start_ms >= start_ms && r.date_start_ms < end_ms) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.date_start_ms != b.date_start_ms ? a.date_start_ms < b.date_start_ms : a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Conversion outcomes
// ------------------------------------------------------------------

Result MemoryRepository::InsertOutcome(Transaction& t, const model::OutcomeRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.outcomes.contains(r.outcome_id)) return Result::Err(ErrorCode::AlreadyExists, "outcome " + r.outcome_id);
  s.outcomes[r.outcome_id] = r;
  return Result::Ok();
}

std::vector<model::OutcomeRecord> MemoryRepository::ListOutcomes(Transaction& t, const model::Scope& scope, uint64_t start_ms, uint64_t end_ms) {
  std::vector<model::OutcomeRecord> out;
  for (const auto& [_, r] : TX(t).View().outcomes) {
    if (scope.Contains(r.scope) && r.event_timestamp_ms >= start_ms && r.event_timestamp_ms < end_ms) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.event_timestamp_ms != b.event_timestamp_ms ? a.event_timestamp_ms < b.event_timestamp_ms : a.outcome_id < b.outcome_id;
  });
  return out;
}

Result MemoryRepository::UpdateOutcomeAttribution(Transaction& t, const std::string& outcome_id, const std::string& attribution_model, double weight) {
  auto& s  = TX(t).Mutable();
  auto  it = s.outcomes.find(outcome_id);
  if (it == s.outcomes.end()) return Result::Err(ErrorCode::NotFound, "outcome " + outcome_id);
  it->second.attribution_model  = attribution_model;
  it->second.attribution_weight = weight;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Daily ROAS metrics
// ------------------------------------------------------------------

Result MemoryRepository::InsertRoasMetrics(Transaction& t, model::RoasMetricsRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& existing : s.roas_metrics) {
    if (existing.scope == r.scope && existing.date_ms == r.date_ms) {
      return Result::Err(ErrorCode::AlreadyExists, "roas metrics already recorded for this scope and date");
    }
  }
  r.id = s.next_metrics_id++;
  s.roas_metrics.push_back(r);
  return Result::Ok();
}

std::vector<model::RoasMetricsRecord> MemoryRepository::ListRoasMetrics(Transaction& t, const RoasMetricsQuery& q) {
  std::vector<model::RoasMetricsRecord> out;
  for (const auto& r : TX(t).View().roas_metrics) {
    if (!MatchesScope(q.scope, q.exact_scope, r.scope)) continue;
    if (q.ad_level_only && r.scope.ad_id.empty()) continue;
    if (r.date_ms < q.since_ms) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.date_ms != b.date_ms ? a.date_ms > b.date_ms : a.id > b.id; });
  Truncate(out, q.limit);
  return out;
}

// ------------------------------------------------------------------
// Action queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertAction(Transaction& t, const model::ActionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.actions.contains(r.action_id)) return Result::Err(ErrorCode::AlreadyExists, "action " + r.action_id);
  s.actions[r.action_id] = r;
  return Result::Ok();
}

std::optional<model::ActionRecord> MemoryRepository::GetAction(Transaction& t, const std::string& action_id) {
  const auto& s  = TX(t).View();
  auto        it = s.actions.find(action_id);
  if (it == s.actions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ActionRecord> MemoryRepository::ListActions(Transaction& t, const ActionFilter& f) {
  std::vector<model::ActionRecord> out;
  for (const auto& [_, a] : TX(t).View().actions) {
    if (!f.campaign_id.empty() && a.campaign_id != f.campaign_id) continue;
    if (!f.target_id.empty() && a.target_id != f.target_id) continue;
    if (f.type && a.type != *f.type) continue;
    if (!InStatuses(f.statuses, a.status)) continue;
    if (f.exclude_stale_at_ms != 0 && a.status == ActionStatus::kSuggested && a.expires_at_ms <= f.exclude_stale_at_ms) continue;
    out.push_back(a);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.action_id < b.action_id;
  });
  Truncate(out, f.limit);
  return out;
}

Result MemoryRepository::UpdateAction(Transaction& t, const model::ActionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.actions.find(r.action_id);
  if (it == s.actions.end()) return Result::Err(ErrorCode::NotFound, "action " + r.action_id);
  const auto status = it->second.status;
  it->second        = r;
  it->second.status = status;
  return Result::Ok();
}

Result MemoryRepository::CompareAndSetActionStatus(Transaction& t, const StatusTransition& tr) {
  auto& s  = TX(t).Mutable();
  auto  it = s.actions.find(tr.action_id);
  if (it == s.actions.end()) return Result::Err(ErrorCode::NotFound, "action " + tr.action_id);
  if (!InStatuses(tr.expected, it->second.status) || tr.expected.empty()) {
    return Result::StatusMismatch(it->second.status);
  }
  it->second.status        = tr.next;
  it->second.updated_at_ms = tr.now_ms;
  return Result::Ok();
}

std::optional<model::ActionRecord> MemoryRepository::LatestExecutedAction(Transaction& t, const std::string& target_id, autopilot::model::ActionType type) {
  std::optional<model::ActionRecord> latest;
  for (const auto& [_, a] : TX(t).View().actions) {
    if (a.target_id != target_id || a.type != type || a.status != ActionStatus::kExecuted) continue;
    if (!latest || a.executed_at_ms > latest->executed_at_ms) latest = a;
  }
  return latest;
}

QueueCounts MemoryRepository::CountQueue(Transaction& t, uint64_t since_ms) {
  QueueCounts counts;
  for (const auto& [_, a] : TX(t).View().actions) {
    switch (a.status) {
      case ActionStatus::kSuggested:
        counts.suggested++;
        counts.open_confidence_sum += a.confidence;
        break;
      case ActionStatus::kPending:
        counts.pending++;
        counts.open_confidence_sum += a.confidence;
        break;
      case ActionStatus::kExecuting:
        counts.executing++;
        break;
      case ActionStatus::kExecuted:
        if (a.executed_at_ms >= since_ms) counts.executed_since++;
        break;
      case ActionStatus::kFailed:
        if (a.executed_at_ms >= since_ms) counts.failed_since++;
        break;
      case ActionStatus::kCancelled:
      case ActionStatus::kUnspecified:
        break;
    }
  }
  return counts;
}

// ------------------------------------------------------------------
// Audit ledger
// ------------------------------------------------------------------

Result MemoryRepository::AppendLedgerEvent(Transaction& t, model::LedgerEventRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_ledger_id++;
  s.ledger.push_back(r);
  return Result::Ok();
}

std::vector<model::LedgerEventRecord> MemoryRepository::ListLedgerEvents(Transaction& t, const std::string& action_id, uint32_t limit) {
  std::vector<model::LedgerEventRecord> out;
  const auto&                           ledger = TX(t).View().ledger;
  for (auto it = ledger.rbegin(); it != ledger.rend(); ++it) {
    if (!action_id.empty() && it->action_id != action_id) continue;
    out.push_back(*it);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

} // namespace autopilot::db::memory
