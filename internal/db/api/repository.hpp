#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/action_record.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/insight_record.hpp"
#include "internal/db/model/ledger_event_record.hpp"
#include "internal/db/model/outcome_record.hpp"
#include "internal/db/model/roas_metrics_record.hpp"

namespace autopilot::db {

// ROAS metric row selection. Results are newest first.
struct RoasMetricsQuery {
  model::Scope scope;
  bool         exact_scope   = false; // all three ids must match (no descendants)
  bool         ad_level_only = false; // only rows with an ad_id
  uint64_t     since_ms      = 0;
  uint32_t     limit         = 0; // 0 = unbounded
};

// Action selection. Results are ordered by confidence desc, created_at asc.
struct ActionFilter {
  std::string                                 campaign_id;
  std::string                                 target_id;
  std::vector<autopilot::model::ActionStatus> statuses; // empty = any
  std::optional<autopilot::model::ActionType> type;
  uint32_t                                    limit = 0; // 0 = unbounded

  // When non-zero, SUGGESTED rows with expires_at_ms <= this are skipped.
  uint64_t exclude_stale_at_ms = 0;
};

// Atomic status transition: applied only if the current status is one of `expected`.
struct StatusTransition {
  std::string                                 action_id;
  std::vector<autopilot::model::ActionStatus> expected;
  autopilot::model::ActionStatus              next = autopilot::model::ActionStatus::kUnspecified;
  uint64_t                                    now_ms = 0;
};

struct QueueCounts {
  uint64_t suggested          = 0;
  uint64_t pending            = 0;
  uint64_t executing          = 0;
  uint64_t executed_since     = 0;
  uint64_t failed_since       = 0;
  double   open_confidence_sum = 0.0; // SUGGESTED + PENDING
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - CompareAndSetActionStatus is a single conditional update; a status
    mismatch returns Conflict and changes nothing

  The DB is the source of truth for:
    ad hierarchy and performance windows
    conversion outcomes
    daily ROAS metrics
    the action queue and its audit ledger
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Ad hierarchy
  // ---------------------------------------------------------------------

  virtual Result UpsertEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& id) = 0;

  // Children of a campaign (ad sets and ads).
  virtual std::vector<model::EntityRecord> ListEntities(Transaction&, const std::string& campaign_id) = 0;

  // ACTIVE campaigns created at or before `created_before_ms`, oldest first.
  virtual std::vector<model::EntityRecord> ListActiveCampaigns(Transaction&, uint64_t created_before_ms, uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Performance windows
  // ---------------------------------------------------------------------

  virtual Result InsertInsight(Transaction&, model::InsightRecord&) = 0;

  // Rows with date_start in [start_ms, end_ms).
  virtual std::vector<model::InsightRecord> ListInsights(Transaction&, const model::Scope&, uint64_t start_ms, uint64_t end_ms) = 0;

  // ---------------------------------------------------------------------
  // Conversion outcomes
  // ---------------------------------------------------------------------

  virtual Result InsertOutcome(Transaction&, const model::OutcomeRecord&) = 0;

  // Rows with event_timestamp in [start_ms, end_ms), oldest first.
  virtual std::vector<model::OutcomeRecord> ListOutcomes(Transaction&, const model::Scope&, uint64_t start_ms, uint64_t end_ms) = 0;

  virtual Result UpdateOutcomeAttribution(Transaction&, const std::string& outcome_id, const std::string& attribution_model, double weight) = 0;

  // ---------------------------------------------------------------------
  // Daily ROAS metrics
  // ---------------------------------------------------------------------

  // AlreadyExists when (scope, date_ms) is taken.
  virtual Result InsertRoasMetrics(Transaction&, model::RoasMetricsRecord&) = 0;

  virtual std::vector<model::RoasMetricsRecord> ListRoasMetrics(Transaction&, const RoasMetricsQuery&) = 0;

  // ---------------------------------------------------------------------
  // Action queue
  // ---------------------------------------------------------------------

  virtual Result InsertAction(Transaction&, const model::ActionRecord&) = 0;

  virtual std::optional<model::ActionRecord> GetAction(Transaction&, const std::string& action_id) = 0;

  virtual std::vector<model::ActionRecord> ListActions(Transaction&, const ActionFilter&) = 0;

  // Rewrites every column except status.
  virtual Result UpdateAction(Transaction&, const model::ActionRecord&) = 0;

  // NotFound if absent, Conflict if the status is not in `expected`.
  virtual Result CompareAndSetActionStatus(Transaction&, const StatusTransition&) = 0;

  // Most recent EXECUTED action of `type` on `target_id`.
  virtual std::optional<model::ActionRecord> LatestExecutedAction(Transaction&, const std::string& target_id, autopilot::model::ActionType type) = 0;

  // executed_since / failed_since count rows with executed_at >= since_ms.
  virtual QueueCounts CountQueue(Transaction&, uint64_t since_ms) = 0;

  // ---------------------------------------------------------------------
  // Audit ledger
  // ---------------------------------------------------------------------

  virtual Result AppendLedgerEvent(Transaction&, model::LedgerEventRecord&) = 0;

  // Newest first.
  virtual std::vector<model::LedgerEventRecord> ListLedgerEvents(Transaction&, const std::string& action_id, uint32_t limit) = 0;
};

} // namespace autopilot::db
