#include "pg_repository.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/sql/action_codec.hpp"
#include "pg_columns.hpp"

namespace autopilot::db::postgres {

using autopilot::model::ActionStatus;
using autopilot::model::ActionType;
using autopilot::model::TargetLevel;

namespace {

// Numbered placeholders for dynamically assembled statements.
class Params {
 public:
  template <typename T>
  std::string Add(const T& value) {
    params_.append(value);
    return "$" + std::to_string(++count_);
  }

  const pqxx::params& Get() const {
    return params_;
  }

 private:
  pqxx::params params_;
  int          count_ = 0;
};

std::optional<std::string> NullIfEmpty(std::string s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

std::string ScopeClause(Params& p, const model::Scope& scope, bool exact) {
  if (exact) {
    return " AND campaign_id=" + p.Add(scope.campaign_id) + " AND adset_id=" + p.Add(scope.adset_id) + " AND ad_id=" + p.Add(scope.ad_id);
  }
  if (!scope.ad_id.empty()) return " AND ad_id=" + p.Add(scope.ad_id);
  if (!scope.adset_id.empty()) return " AND adset_id=" + p.Add(scope.adset_id);
  if (!scope.campaign_id.empty()) return " AND campaign_id=" + p.Add(scope.campaign_id);
  return {};
}

int64_t LimitOrAll(uint32_t limit) {
  return limit == 0 ? INT64_MAX : static_cast<int64_t>(limit);
}

constexpr const char* kEntityColumns = "id,level,campaign_id,adset_id,name,status,daily_budget_usd,created_at_ms,updated_at_ms";

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.id               = row[0].c_str();
  r.level            = static_cast<TargetLevel>(row[1].as<int>());
  r.campaign_id      = Text(row[2]);
  r.adset_id         = Text(row[3]);
  r.name             = Text(row[4]);
  r.status           = row[5].c_str();
  r.daily_budget_usd = row[6].as<double>();
  r.created_at_ms    = row[7].as<uint64_t>();
  r.updated_at_ms    = row[8].as<uint64_t>();
  return r;
}

constexpr const char* kOutcomeColumns =
    "outcome_id,campaign_id,adset_id,ad_id,value_usd,conversion_type,event_timestamp_ms,session_id,session_duration_seconds,attribution_model,"
    "attribution_weight";

model::OutcomeRecord ReadOutcome(const pqxx::row& row) {
  model::OutcomeRecord r;
  r.outcome_id         = row[0].c_str();
  r.scope              = {Text(row[1]), Text(row[2]), Text(row[3])};
  r.value_usd          = row[4].as<double>();
  r.conversion_type    = row[5].c_str();
  r.event_timestamp_ms = row[6].as<uint64_t>();
  r.session_id         = Text(row[7]);
  if (!row[8].is_null()) r.session_duration_seconds = row[8].as<double>();
  r.attribution_model  = row[9].c_str();
  r.attribution_weight = row[10].as<double>();
  return r;
}

constexpr const char* kRoasColumns =
    "id,campaign_id,adset_id,ad_id,date_ms,actual_roas,smoothed_roas,predicted_roas,confidence_score,confidence_interval_low,"
    "confidence_interval_high,sample_size,is_outlier,outlier_reason,performance_tier,recommendation,recommended_budget_change_pct,impressions,"
    "clicks,conversions,total_cost_usd,total_revenue_usd,conversion_probability,session_quality_score,user_retention_probability,"
    "lifetime_value_estimate,blended_ctr,blended_cpc,blended_cpm,created_at_ms";

model::RoasMetricsRecord ReadRoas(const pqxx::row& row) {
  model::RoasMetricsRecord r;
  r.id                            = row[0].as<uint64_t>();
  r.scope                         = {Text(row[1]), Text(row[2]), Text(row[3])};
  r.date_ms                       = row[4].as<uint64_t>();
  r.actual_roas                   = row[5].as<double>();
  r.smoothed_roas                 = row[6].as<double>();
  r.predicted_roas                = row[7].as<double>();
  r.confidence_score              = row[8].as<double>();
  r.confidence_interval_low       = row[9].as<double>();
  r.confidence_interval_high      = row[10].as<double>();
  r.sample_size                   = row[11].as<uint64_t>();
  r.is_outlier                    = row[12].as<bool>();
  r.outlier_reason                = Text(row[13]);
  r.performance_tier              = Text(row[14]);
  r.recommendation                = Text(row[15]);
  r.recommended_budget_change_pct = row[16].as<double>();
  r.impressions                   = row[17].as<uint64_t>();
  r.clicks                        = row[18].as<uint64_t>();
  r.conversions                   = row[19].as<uint64_t>();
  r.total_cost_usd                = row[20].as<double>();
  r.total_revenue_usd             = row[21].as<double>();
  r.conversion_probability        = row[22].as<double>();
  r.session_quality_score         = row[23].as<double>();
  r.user_retention_probability    = row[24].as<double>();
  r.lifetime_value_estimate       = row[25].as<double>();
  r.blended_ctr                   = row[26].as<double>();
  r.blended_cpc                   = row[27].as<double>();
  r.blended_cpm                   = row[28].as<double>();
  r.created_at_ms                 = row[29].as<uint64_t>();
  return r;
}

model::ActionRecord ReadAction(const pqxx::row& row) {
  model::ActionRecord r;
  r.action_id         = row[0].c_str();
  r.type              = static_cast<ActionType>(row[1].as<int>());
  r.status            = static_cast<ActionStatus>(row[2].as<int>());
  r.target_level      = static_cast<TargetLevel>(row[3].as<int>());
  r.target_id         = row[4].c_str();
  r.campaign_id       = Text(row[5]);
  r.adset_id          = Text(row[6]);
  r.ad_id             = Text(row[7]);
  r.amount_pct        = row[8].as<double>();
  r.amount_usd        = row[9].as<double>();
  r.old_budget_usd    = row[10].as<double>();
  r.new_budget_usd    = row[11].as<double>();
  r.reason            = Text(row[12]);
  r.reason_details    = Text(row[13]);
  r.confidence        = row[14].as<double>();
  r.roas_value        = row[15].as<double>();
  r.safety_score      = row[16].as<double>();
  r.created_by        = Text(row[17]);
  r.approved_by       = Text(row[18]);
  r.executed_by       = Text(row[19]);
  r.execution_result  = sql::DecodeExecutionResult(Text(row[20]));
  r.execution_error   = Text(row[21]);
  r.reallocation_plan = sql::DecodeReallocationPlan(Text(row[22]));
  r.affected_ad_ids   = sql::DecodeIdList(Text(row[23]));
  r.created_at_ms     = row[24].as<uint64_t>();
  r.updated_at_ms     = row[25].as<uint64_t>();
  r.approved_at_ms    = row[26].as<uint64_t>();
  r.executed_at_ms    = row[27].as<uint64_t>();
  r.expires_at_ms     = row[28].as<uint64_t>();
  return r;
}

template <typename T, typename Fn>
std::vector<T> ReadAll(const pqxx::result& res, Fn read) {
  std::vector<T> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::Constraint, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::Retryable, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Retryable, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::Unavailable, e.what());
  return Result::Err(ErrorCode::Internal, e.what());
}

// ------------------------------------------------------------------
// Ad hierarchy
// ------------------------------------------------------------------

Result PgRepository::UpsertEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_entity", r.id, static_cast<int>(r.level), r.campaign_id, r.adset_id, r.name, r.status, r.daily_budget_usd,
                               r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_entity", id);
  if (res.empty()) return std::nullopt;
  return ReadEntity(res[0]);
}

std::vector<model::EntityRecord> PgRepository::ListEntities(Transaction& t, const std::string& campaign_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntityColumns + " FROM entities WHERE campaign_id=$1 AND id<>$1 ORDER BY id;",
                                      campaign_id);
  return ReadAll<model::EntityRecord>(res, ReadEntity);
}

std::vector<model::EntityRecord> PgRepository::ListActiveCampaigns(Transaction& t, uint64_t created_before_ms, uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntityColumns +
                                          " FROM entities WHERE level=$1 AND status=$2 AND created_at_ms<=$3 ORDER BY created_at_ms, id LIMIT $4;",
                                      static_cast<int>(TargetLevel::kCampaign), std::string(model::kEntityActive), created_before_ms,
                                      LimitOrAll(limit));
  return ReadAll<model::EntityRecord>(res, ReadEntity);
}

// ------------------------------------------------------------------
// Performance windows
// ------------------------------------------------------------------

Result PgRepository::InsertInsight(Transaction& t, model::InsightRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO insights(campaign_id,adset_id,ad_id,date_start_ms,date_stop_ms,impressions,clicks,spend_usd)"
        " VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id;",
        r.scope.campaign_id, r.scope.adset_id, r.scope.ad_id, r.date_start_ms, r.date_stop_ms, r.impressions, r.clicks, r.spend_usd);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::InsightRecord> PgRepository::ListInsights(Transaction& t, const model::Scope& scope, uint64_t start_ms, uint64_t end_ms) {
  Params      p;
  std::string sql = "SELECT id,campaign_id,adset_id,ad_id,date_start_ms,date_stop_ms,impressions,clicks,spend_usd FROM insights"
                    " WHERE date_start_ms>=" +
                    p.Add(start_ms) + " AND date_start_ms<" + p.Add(end_ms);
  sql += ScopeClause(p, scope, false);
  sql += " ORDER BY date_start_ms, id;";

  auto res = TX(t).Work().exec_params(sql, p.Get());
  return ReadAll<model::InsightRecord>(res, [](const pqxx::row& row) {
    model::InsightRecord r;
    r.id            = row[0].as<uint64_t>();
    r.scope         = {Text(row[1]), Text(row[2]), Text(row[3])};
    r.date_start_ms = row[4].as<uint64_t>();
    r.date_stop_ms  = row[5].as<uint64_t>();
    r.impressions   = row[6].as<uint64_t>();
    r.clicks        = row[7].as<uint64_t>();
    r.spend_usd     = row[8].as<double>();
    return r;
  });
}

// ------------------------------------------------------------------
// Conversion outcomes
// ------------------------------------------------------------------

Result PgRepository::InsertOutcome(Transaction& t, const model::OutcomeRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO outcomes(") + kOutcomeColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);", r.outcome_id,
                             r.scope.campaign_id, r.scope.adset_id, r.scope.ad_id, r.value_usd, r.conversion_type, r.event_timestamp_ms,
                             r.session_id, r.session_duration_seconds, r.attribution_model, r.attribution_weight);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OutcomeRecord> PgRepository::ListOutcomes(Transaction& t, const model::Scope& scope, uint64_t start_ms, uint64_t end_ms) {
  Params      p;
  std::string sql = std::string("SELECT ") + kOutcomeColumns + " FROM outcomes WHERE event_timestamp_ms>=" + p.Add(start_ms) +
                    " AND event_timestamp_ms<" + p.Add(end_ms);
  sql += ScopeClause(p, scope, false);
  sql += " ORDER BY event_timestamp_ms, outcome_id;";

  auto res = TX(t).Work().exec_params(sql, p.Get());
  return ReadAll<model::OutcomeRecord>(res, ReadOutcome);
}

Result PgRepository::UpdateOutcomeAttribution(Transaction& t, const std::string& outcome_id, const std::string& attribution_model, double weight) {
  try {
    auto res = TX(t).Work().exec_prepared("update_outcome_attribution", outcome_id, attribution_model, weight);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "outcome " + outcome_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Daily ROAS metrics
// ------------------------------------------------------------------

Result PgRepository::InsertRoasMetrics(Transaction& t, model::RoasMetricsRecord& r) {
  try {
    Params      p;
    std::string values;
    for (const auto& placeholder :
         {p.Add(r.scope.campaign_id), p.Add(r.scope.adset_id), p.Add(r.scope.ad_id), p.Add(r.date_ms), p.Add(r.actual_roas), p.Add(r.smoothed_roas),
          p.Add(r.predicted_roas), p.Add(r.confidence_score), p.Add(r.confidence_interval_low), p.Add(r.confidence_interval_high),
          p.Add(r.sample_size), p.Add(r.is_outlier), p.Add(r.outlier_reason), p.Add(r.performance_tier), p.Add(r.recommendation),
          p.Add(r.recommended_budget_change_pct), p.Add(r.impressions), p.Add(r.clicks), p.Add(r.conversions), p.Add(r.total_cost_usd),
          p.Add(r.total_revenue_usd), p.Add(r.conversion_probability), p.Add(r.session_quality_score), p.Add(r.user_retention_probability),
          p.Add(r.lifetime_value_estimate), p.Add(r.blended_ctr), p.Add(r.blended_cpc), p.Add(r.blended_cpm), p.Add(r.created_at_ms)}) {
      values += values.empty() ? placeholder : "," + placeholder;
    }

    const std::string columns = std::string(kRoasColumns).substr(3); // drop "id,"
    auto res = TX(t).Work().exec_params("INSERT INTO roas_metrics(" + columns + ") VALUES(" + values + ") RETURNING id;", p.Get());
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, "roas metrics already recorded for this scope and date");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RoasMetricsRecord> PgRepository::ListRoasMetrics(Transaction& t, const RoasMetricsQuery& q) {
  Params      p;
  std::string sql = std::string("SELECT ") + kRoasColumns + " FROM roas_metrics WHERE date_ms>=" + p.Add(q.since_ms);
  sql += ScopeClause(p, q.scope, q.exact_scope);
  if (q.ad_level_only) sql += " AND ad_id<>''";
  sql += " ORDER BY date_ms DESC, id DESC LIMIT " + p.Add(LimitOrAll(q.limit)) + ";";

  auto res = TX(t).Work().exec_params(sql, p.Get());
  return ReadAll<model::RoasMetricsRecord>(res, ReadRoas);
}

// ------------------------------------------------------------------
// Action queue
// ------------------------------------------------------------------

Result PgRepository::InsertAction(Transaction& t, const model::ActionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_action", r.action_id, static_cast<int>(r.type), static_cast<int>(r.status), static_cast<int>(r.target_level),
                               r.target_id, r.campaign_id, r.adset_id, r.ad_id, r.amount_pct, r.amount_usd, r.old_budget_usd, r.new_budget_usd,
                               r.reason, r.reason_details, r.confidence, r.roas_value, r.safety_score, r.created_by, r.approved_by, r.executed_by,
                               NullIfEmpty(sql::EncodeExecutionResult(r.execution_result)), r.execution_error,
                               NullIfEmpty(sql::EncodeReallocationPlan(r.reallocation_plan)), sql::EncodeIdList(r.affected_ad_ids), r.created_at_ms,
                               r.updated_at_ms, r.approved_at_ms, r.executed_at_ms, r.expires_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ActionRecord> PgRepository::GetAction(Transaction& t, const std::string& action_id) {
  auto res = TX(t).Work().exec_prepared("get_action", action_id);
  if (res.empty()) return std::nullopt;
  return ReadAction(res[0]);
}

std::vector<model::ActionRecord> PgRepository::ListActions(Transaction& t, const ActionFilter& f) {
  Params      p;
  std::string sql = std::string("SELECT ") + kActionSelectColumns + " FROM actions WHERE TRUE";
  if (!f.campaign_id.empty()) sql += " AND campaign_id=" + p.Add(f.campaign_id);
  if (!f.target_id.empty()) sql += " AND target_id=" + p.Add(f.target_id);
  if (f.type) sql += " AND type=" + p.Add(static_cast<int>(*f.type));
  if (!f.statuses.empty()) {
    std::string in;
    for (auto status : f.statuses) {
      in += (in.empty() ? "" : ",") + p.Add(static_cast<int>(status));
    }
    sql += " AND status IN (" + in + ")";
  }
  if (f.exclude_stale_at_ms != 0) {
    sql += " AND NOT (status=" + p.Add(static_cast<int>(ActionStatus::kSuggested)) + " AND expires_at_ms<=" + p.Add(f.exclude_stale_at_ms) + ")";
  }
  sql += " ORDER BY confidence DESC, created_at_ms ASC, action_id ASC LIMIT " + p.Add(LimitOrAll(f.limit)) + ";";

  auto res = TX(t).Work().exec_params(sql, p.Get());
  return ReadAll<model::ActionRecord>(res, ReadAction);
}

Result PgRepository::UpdateAction(Transaction& t, const model::ActionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "update_action", r.action_id, static_cast<int>(r.type), static_cast<int>(r.target_level), r.target_id, r.campaign_id, r.adset_id, r.ad_id,
        r.amount_pct, r.amount_usd, r.old_budget_usd, r.new_budget_usd, r.reason, r.reason_details, r.confidence, r.roas_value, r.safety_score,
        r.created_by, r.approved_by, r.executed_by, NullIfEmpty(sql::EncodeExecutionResult(r.execution_result)), r.execution_error,
        NullIfEmpty(sql::EncodeReallocationPlan(r.reallocation_plan)), sql::EncodeIdList(r.affected_ad_ids), r.created_at_ms, r.updated_at_ms,
        r.approved_at_ms, r.executed_at_ms, r.expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "action " + r.action_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CompareAndSetActionStatus(Transaction& t, const StatusTransition& tr) {
  if (tr.expected.empty()) return Result::Err(ErrorCode::StatusMismatch, "no expected status");

  try {
    Params      p;
    std::string sql = "UPDATE actions SET status=" + p.Add(static_cast<int>(tr.next)) + ",updated_at_ms=" + p.Add(tr.now_ms) +
                      " WHERE action_id=" + p.Add(tr.action_id) + " AND status IN (";
    for (size_t i = 0; i < tr.expected.size(); ++i) {
      sql += (i == 0 ? "" : ",") + p.Add(static_cast<int>(tr.expected[i]));
    }
    sql += ");";

    auto res = TX(t).Work().exec_params(sql, p.Get());
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  auto current = GetAction(t, tr.action_id);
  if (!current) return Result::Err(ErrorCode::NotFound, "action " + tr.action_id);
  return Result::StatusMismatch(current->status);
}

std::optional<model::ActionRecord> PgRepository::LatestExecutedAction(Transaction& t, const std::string& target_id, ActionType type) {
  auto res = TX(t).Work().exec_prepared("latest_executed_action", target_id, static_cast<int>(type), static_cast<int>(ActionStatus::kExecuted));
  if (res.empty()) return std::nullopt;
  return ReadAction(res[0]);
}

QueueCounts PgRepository::CountQueue(Transaction& t, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT status, COUNT(*), COALESCE(SUM(confidence),0) FROM actions"
      " WHERE status IN ($1,$2,$3) OR (status IN ($4,$5) AND executed_at_ms>=$6) GROUP BY status;",
      static_cast<int>(ActionStatus::kSuggested), static_cast<int>(ActionStatus::kPending), static_cast<int>(ActionStatus::kExecuting),
      static_cast<int>(ActionStatus::kExecuted), static_cast<int>(ActionStatus::kFailed), since_ms);

  QueueCounts counts;
  for (const auto& row : res) {
    const auto status = static_cast<ActionStatus>(row[0].as<int>());
    const auto n      = row[1].as<uint64_t>();
    switch (status) {
      case ActionStatus::kSuggested:
        counts.suggested = n;
        counts.open_confidence_sum += row[2].as<double>();
        break;
      case ActionStatus::kPending:
        counts.pending = n;
        counts.open_confidence_sum += row[2].as<double>();
        break;
      case ActionStatus::kExecuting:
        counts.executing = n;
        break;
      case ActionStatus::kExecuted:
        counts.executed_since = n;
        break;
      case ActionStatus::kFailed:
        counts.failed_since = n;
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

Result PgRepository::AppendLedgerEvent(Transaction& t, model::LedgerEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO ledger_events(event_type,action_id,entity_id,actor,payload_json,created_at_ms) VALUES($1,$2,$3,$4,$5::jsonb,$6) RETURNING id;",
        r.event_type, r.action_id, r.entity_id, r.actor, r.payload_json.empty() ? std::string("{}") : r.payload_json, r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LedgerEventRecord> PgRepository::ListLedgerEvents(Transaction& t, const std::string& action_id, uint32_t limit) {
  Params      p;
  std::string sql = "SELECT id,event_type,action_id,entity_id,actor,payload_json::text,created_at_ms FROM ledger_events";
  if (!action_id.empty()) sql += " WHERE action_id=" + p.Add(action_id);
  sql += " ORDER BY id DESC LIMIT " + p.Add(LimitOrAll(limit)) + ";";

  auto res = TX(t).Work().exec_params(sql, p.Get());
  return ReadAll<model::LedgerEventRecord>(res, [](const pqxx::row& row) {
    model::LedgerEventRecord r;
    r.id            = row[0].as<uint64_t>();
    r.event_type    = row[1].c_str();
    r.action_id     = Text(row[2]);
    r.entity_id     = Text(row[3]);
    r.actor         = Text(row[4]);
    r.payload_json  = Text(row[5]);
    r.created_at_ms = row[6].as<uint64_t>();
    return r;
  });
}

} // namespace autopilot::db::postgres
