#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace autopilot::db::memory {

class MemoryTransaction;

/*
  In-process backend. Each transaction works on a private copy of the
  committed state; the first writer to commit wins.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                              UpsertEntity(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord>  GetEntity(Transaction&, const std::string&) override;
  std::vector<model::EntityRecord>    ListEntities(Transaction&, const std::string& campaign_id) override;
  std::vector<model::EntityRecord>    ListActiveCampaigns(Transaction&, uint64_t created_before_ms, uint32_t limit) override;

  Result                            InsertInsight(Transaction&, model::InsightRecord&) override;
  std::vector<model::InsightRecord> ListInsights(Transaction&, const model::Scope&, uint64_t start_ms, uint64_t end_ms) override;

  Result                            InsertOutcome(Transaction&, const model::OutcomeRecord&) override;
  std::vector<model::OutcomeRecord> ListOutcomes(Transaction&, const model::Scope&, uint64_t start_ms, uint64_t end_ms) override;
  Result UpdateOutcomeAttribution(Transaction&, const std::string& outcome_id, const std::string& attribution_model, double weight) override;

  Result                                InsertRoasMetrics(Transaction&, model::RoasMetricsRecord&) override;
  std::vector<model::RoasMetricsRecord> ListRoasMetrics(Transaction&, const RoasMetricsQuery&) override;

  Result                             InsertAction(Transaction&, const model::ActionRecord&) override;
  std::optional<model::ActionRecord> GetAction(Transaction&, const std::string&) override;
  std::vector<model::ActionRecord>   ListActions(Transaction&, const ActionFilter&) override;
  Result                             UpdateAction(Transaction&, const model::ActionRecord&) override;
  Result                             CompareAndSetActionStatus(Transaction&, const StatusTransition&) override;
  std::optional<model::ActionRecord> LatestExecutedAction(Transaction&, const std::string& target_id, autopilot::model::ActionType type) override;
  QueueCounts                        CountQueue(Transaction&, uint64_t since_ms) override;

  Result                                AppendLedgerEvent(Transaction&, model::LedgerEventRecord&) override;
  std::vector<model::LedgerEventRecord> ListLedgerEvents(Transaction&, const std::string& action_id, uint32_t limit) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::EntityRecord>           entities;
    std::vector<model::InsightRecord>                    insights;
    std::map<std::string, model::OutcomeRecord>          outcomes;
    std::vector<model::RoasMetricsRecord>                roas_metrics;
    std::unordered_map<std::string, model::ActionRecord> actions;
    std::vector<model::LedgerEventRecord>                ledger;

    uint64_t next_insight_id = 1;
    uint64_t next_metrics_id = 1;
    uint64_t next_ledger_id  = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace autopilot::db::memory
