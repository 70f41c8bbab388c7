#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "autopilot/v1/types.pb.h"
#include "internal/analytics/budget_allocator.hpp"
#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/guardrails/guardrail_chain.hpp"
#include "internal/ledger/event_ledger.hpp"
#include "internal/optimization/action_executor.hpp"
#include "internal/util/time.hpp"

namespace autopilot::optimization {

struct ActionQuery {
  std::string                                 campaign_id;
  std::string                                 target_id;
  std::vector<autopilot::model::ActionStatus> statuses; // empty = SUGGESTED + PENDING
  std::optional<autopilot::model::ActionType> type;
  uint32_t                                    limit = 0; // 0 = default page
};

struct ExecuteOutcome {
  db::model::ActionRecord        action;
  autopilot::v1::ExecutionResult result;
};

struct RunSummary {
  uint64_t                             campaigns_evaluated = 0;
  uint64_t                             actions_enqueued    = 0;
  std::vector<db::model::ActionRecord> actions;
};

/*
  OptimizationService

  Turns daily ROAS metrics into candidate actions and owns the action
  queue lifecycle:

    SUGGESTED -> PENDING -> EXECUTING -> EXECUTED | FAILED
    SUGGESTED | PENDING -> CANCELLED

  Every status change is a compare-and-set in its own transaction, so
  at most one of several concurrent executions of the same action
  reaches the gateway. The gateway call itself runs outside any
  transaction.
*/
class OptimizationService {
 public:
  static constexpr uint32_t kDefaultListLimit      = 100;
  static constexpr uint32_t kMaxListLimit          = 1000;
  static constexpr uint32_t kMaxCampaignsPerRun    = 50;
  static constexpr double   kReallocateConfidence  = 0.7;
  static constexpr double   kReallocateSafetyScore = 0.6;

  OptimizationService(config::Settings settings, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                      std::shared_ptr<ActionExecutor> executor, std::shared_ptr<guardrails::GuardrailChain> guardrails,
                      std::shared_ptr<ledger::EventLedger> ledger);

  // Candidate actions for one campaign, best first. Nothing is persisted.
  std::vector<db::model::ActionRecord> EvaluateCampaign(const std::string& campaign_id, uint32_t lookback_days = 0,
                                                        std::optional<double> min_confidence = std::nullopt);

  db::model::ActionRecord EnqueueAction(db::model::ActionRecord action, const std::string& created_by);

  db::model::ActionRecord ApproveAction(const std::string& action_id, const std::string& approved_by);
  db::model::ActionRecord CancelAction(const std::string& action_id, const std::string& cancelled_by);

  // Executor failures end in FAILED and are reported in the result, not thrown.
  ExecuteOutcome ExecuteAction(const std::string& action_id, const std::string& run_by, bool dry_run = false);

  db::model::ActionRecord              GetAction(const std::string& action_id);
  std::vector<db::model::ActionRecord> ListActions(const ActionQuery& query);

  // Cancels SUGGESTED actions past expires_at. Returns how many were swept.
  uint64_t ExpireStaleActions();

  autopilot::v1::QueueStats QueueStats();

  RunSummary RunOptimization(const std::vector<std::string>& campaign_ids, bool dry_run, const std::string& created_by);

  guardrails::ActionContext BuildContext(db::Transaction& tx, const db::model::ActionRecord& action, const db::model::EntityRecord* campaign,
                                         const std::vector<db::model::RoasMetricsRecord>& metrics, bool is_auto);

  // Policy then safety against fresh context for `action`.
  guardrails::Verdict Vet(const db::model::ActionRecord& action, bool is_auto);

  const config::Settings& Settings() const {
    return settings_;
  }

 private:
  using Mutation = std::function<void(db::model::ActionRecord&, uint64_t now_ms)>;
  using Guard    = std::function<void(const db::model::ActionRecord&, uint64_t now_ms)>;

  // guard sees the row as it was before the status change and may throw to
  // abort the transition.
  db::model::ActionRecord Transition(const std::string& action_id, const std::vector<autopilot::model::ActionStatus>& expected,
                                     autopilot::model::ActionStatus next, const std::string& verb, const Mutation& mutate,
                                     const Guard& guard = {});

  bool InCooldown(db::Transaction& tx, const std::string& target_id, autopilot::model::ActionType type, util::TimePoint now);
  bool PassesGuardRails(const db::model::ActionRecord& action, double min_confidence) const;

  std::optional<db::model::ActionRecord> BuildReallocation(db::Transaction& tx, const db::model::EntityRecord& campaign,
                                                           const std::vector<db::model::RoasMetricsRecord>& latest, util::TimePoint now);

  void Record(std::string_view event_type, const db::model::ActionRecord& action, const std::string& actor,
              google::protobuf::Struct payload = {});

  config::Settings                            settings_;
  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<util::Clock>                clock_;
  std::shared_ptr<ActionExecutor>             executor_;
  std::shared_ptr<guardrails::GuardrailChain> guardrails_;
  std::shared_ptr<ledger::EventLedger>        ledger_;
  analytics::BudgetAllocator                  allocator_;
};

} // namespace autopilot::optimization
