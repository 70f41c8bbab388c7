#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace autopilot::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertEntity(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string&) override;
  std::vector<model::EntityRecord>   ListEntities(Transaction&, const std::string& campaign_id) override;
  std::vector<model::EntityRecord>   ListActiveCampaigns(Transaction&, uint64_t created_before_ms, uint32_t limit) override;

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
  static PgTransaction& TX(Transaction&);
  static Result        Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace autopilot::db::postgres
