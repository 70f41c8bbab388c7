#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>

#include "internal/db/sql/action_codec.hpp"

namespace autopilot::db::sqlite {

using autopilot::db::ErrorCode;
using autopilot::db::Result;
using autopilot::model::ActionStatus;
using autopilot::model::ActionType;
using autopilot::model::TargetLevel;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

// Positional binder; each call consumes the next '?'.
class Binder {
 public:
  explicit Binder(sqlite3_stmt* st) : st_(st) {
  }

  Binder& Text(const std::string& s) {
    sqlite3_bind_text(st_, idx_++, s.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Binder& NullableText(const std::string& s) {
    if (s.empty()) {
      sqlite3_bind_null(st_, idx_++);
      return *this;
    }
    return Text(s);
  }
  Binder& U64(uint64_t v) {
    sqlite3_bind_int64(st_, idx_++, static_cast<sqlite3_int64>(v));
    return *this;
  }
  Binder& I32(int v) {
    sqlite3_bind_int(st_, idx_++, v);
    return *this;
  }
  Binder& Real(double v) {
    sqlite3_bind_double(st_, idx_++, v);
    return *this;
  }
  Binder& OptReal(const std::optional<double>& v) {
    if (!v) {
      sqlite3_bind_null(st_, idx_++);
      return *this;
    }
    return Real(*v);
  }

 private:
  sqlite3_stmt* st_;
  int           idx_ = 1;
};

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColReal(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::optional<double> ColOptReal(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

// Collects every row via `read`; throws unless the scan ends in SQLITE_DONE.
template <typename T, typename Fn>
std::vector<T> ReadAll(sqlite3* db, sqlite3_stmt* st, Fn read) {
  std::vector<T> out;
  int            rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

void AppendScope(std::string& sql, const model::Scope& scope, bool exact) {
  if (exact) {
    sql += " AND campaign_id=? AND adset_id=? AND ad_id=?";
  } else if (!scope.ad_id.empty()) {
    sql += " AND ad_id=?";
  } else if (!scope.adset_id.empty()) {
    sql += " AND adset_id=?";
  } else if (!scope.campaign_id.empty()) {
    sql += " AND campaign_id=?";
  }
}

void BindScope(Binder& b, const model::Scope& scope, bool exact) {
  if (exact) {
    b.Text(scope.campaign_id).Text(scope.adset_id).Text(scope.ad_id);
  } else if (!scope.ad_id.empty()) {
    b.Text(scope.ad_id);
  } else if (!scope.adset_id.empty()) {
    b.Text(scope.adset_id);
  } else if (!scope.campaign_id.empty()) {
    b.Text(scope.campaign_id);
  }
}

std::string Placeholders(size_t n) {
  std::string out;
  for (size_t i = 0; i < n; ++i) {
    out += i == 0 ? "?" : ",?";
  }
  return out;
}

// ------------------------------------------------------------------
// Row mapping
// ------------------------------------------------------------------

constexpr const char* kEntityColumns = "id,level,campaign_id,adset_id,name,status,daily_budget_usd,created_at_ms,updated_at_ms";

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
  model::EntityRecord r;
  r.id               = ColText(st, 0);
  r.level            = static_cast<TargetLevel>(ColI32(st, 1));
  r.campaign_id      = ColText(st, 2);
  r.adset_id         = ColText(st, 3);
  r.name             = ColText(st, 4);
  r.status           = ColText(st, 5);
  r.daily_budget_usd = ColReal(st, 6);
  r.created_at_ms    = ColU64(st, 7);
  r.updated_at_ms    = ColU64(st, 8);
  return r;
}

constexpr const char* kOutcomeColumns =
    "outcome_id,campaign_id,adset_id,ad_id,value_usd,conversion_type,event_timestamp_ms,session_id,session_duration_seconds,attribution_model,"
    "attribution_weight";

model::OutcomeRecord ReadOutcome(sqlite3_stmt* st) {
  model::OutcomeRecord r;
  r.outcome_id               = ColText(st, 0);
  r.scope                    = {ColText(st, 1), ColText(st, 2), ColText(st, 3)};
  r.value_usd                = ColReal(st, 4);
  r.conversion_type          = ColText(st, 5);
  r.event_timestamp_ms       = ColU64(st, 6);
  r.session_id               = ColText(st, 7);
  r.session_duration_seconds = ColOptReal(st, 8);
  r.attribution_model        = ColText(st, 9);
  r.attribution_weight       = ColReal(st, 10);
  return r;
}

constexpr const char* kRoasColumns =
    "id,campaign_id,adset_id,ad_id,date_ms,actual_roas,smoothed_roas,predicted_roas,confidence_score,confidence_interval_low,"
    "confidence_interval_high,sample_size,is_outlier,outlier_reason,performance_tier,recommendation,recommended_budget_change_pct,impressions,"
    "clicks,conversions,total_cost_usd,total_revenue_usd,conversion_probability,session_quality_score,user_retention_probability,"
    "lifetime_value_estimate,blended_ctr,blended_cpc,blended_cpm,created_at_ms";

model::RoasMetricsRecord ReadRoas(sqlite3_stmt* st) {
  model::RoasMetricsRecord r;
  r.id                            = ColU64(st, 0);
  r.scope                         = {ColText(st, 1), ColText(st, 2), ColText(st, 3)};
  r.date_ms                       = ColU64(st, 4);
  r.actual_roas                   = ColReal(st, 5);
  r.smoothed_roas                 = ColReal(st, 6);
  r.predicted_roas                = ColReal(st, 7);
  r.confidence_score              = ColReal(st, 8);
  r.confidence_interval_low       = ColReal(st, 9);
  r.confidence_interval_high      = ColReal(st, 10);
  r.sample_size                   = ColU64(st, 11);
  r.is_outlier                    = ColI32(st, 12) != 0;
  r.outlier_reason                = ColText(st, 13);
  r.performance_tier              = ColText(st, 14);
  r.recommendation                = ColText(st, 15);
  r.recommended_budget_change_pct = ColReal(st, 16);
  r.impressions                   = ColU64(st, 17);
  r.clicks                        = ColU64(st, 18);
  r.conversions                   = ColU64(st, 19);
  r.total_cost_usd                = ColReal(st, 20);
  r.total_revenue_usd             = ColReal(st, 21);
  r.conversion_probability        = ColReal(st, 22);
  r.session_quality_score         = ColReal(st, 23);
  r.user_retention_probability    = ColReal(st, 24);
  r.lifetime_value_estimate       = ColReal(st, 25);
  r.blended_ctr                   = ColReal(st, 26);
  r.blended_cpc                   = ColReal(st, 27);
  r.blended_cpm                   = ColReal(st, 28);
  r.created_at_ms                 = ColU64(st, 29);
  return r;
}

constexpr const char* kActionColumns =
    "action_id,type,status,target_level,target_id,campaign_id,adset_id,ad_id,amount_pct,amount_usd,old_budget_usd,new_budget_usd,reason,"
    "reason_details,confidence,roas_value,safety_score,created_by,approved_by,executed_by,execution_result,execution_error,reallocation_plan,"
    "affected_ad_ids,created_at_ms,updated_at_ms,approved_at_ms,executed_at_ms,expires_at_ms";

model::ActionRecord ReadAction(sqlite3_stmt* st) {
  model::ActionRecord r;
  r.action_id         = ColText(st, 0);
  r.type              = static_cast<ActionType>(ColI32(st, 1));
  r.status            = static_cast<ActionStatus>(ColI32(st, 2));
  r.target_level      = static_cast<TargetLevel>(ColI32(st, 3));
  r.target_id         = ColText(st, 4);
  r.campaign_id       = ColText(st, 5);
  r.adset_id          = ColText(st, 6);
  r.ad_id             = ColText(st, 7);
  r.amount_pct        = ColReal(st, 8);
  r.amount_usd        = ColReal(st, 9);
  r.old_budget_usd    = ColReal(st, 10);
  r.new_budget_usd    = ColReal(st, 11);
  r.reason            = ColText(st, 12);
  r.reason_details    = ColText(st, 13);
  r.confidence        = ColReal(st, 14);
  r.roas_value        = ColReal(st, 15);
  r.safety_score      = ColReal(st, 16);
  r.created_by        = ColText(st, 17);
  r.approved_by       = ColText(st, 18);
  r.executed_by       = ColText(st, 19);
  r.execution_result  = sql::DecodeExecutionResult(ColText(st, 20));
  r.execution_error   = ColText(st, 21);
  r.reallocation_plan = sql::DecodeReallocationPlan(ColText(st, 22));
  r.affected_ad_ids   = sql::DecodeIdList(ColText(st, 23));
  r.created_at_ms     = ColU64(st, 24);
  r.updated_at_ms     = ColU64(st, 25);
  r.approved_at_ms    = ColU64(st, 26);
  r.executed_at_ms    = ColU64(st, 27);
  r.expires_at_ms     = ColU64(st, 28);
  return r;
}

// Binds every column after action_id / status, in kActionColumns order.
void BindActionBody(Binder& b, const model::ActionRecord& r) {
  b.I32(static_cast<int>(r.target_level))
      .Text(r.target_id)
      .Text(r.campaign_id)
      .Text(r.adset_id)
      .Text(r.ad_id)
      .Real(r.amount_pct)
      .Real(r.amount_usd)
      .Real(r.old_budget_usd)
      .Real(r.new_budget_usd)
      .Text(r.reason)
      .Text(r.reason_details)
      .Real(r.confidence)
      .Real(r.roas_value)
      .Real(r.safety_score)
      .Text(r.created_by)
      .Text(r.approved_by)
      .Text(r.executed_by)
      .NullableText(sql::EncodeExecutionResult(r.execution_result))
      .Text(r.execution_error)
      .NullableText(sql::EncodeReallocationPlan(r.reallocation_plan))
      .Text(sql::EncodeIdList(r.affected_ad_ids))
      .U64(r.created_at_ms)
      .U64(r.updated_at_ms)
      .U64(r.approved_at_ms)
      .U64(r.executed_at_ms)
      .U64(r.expires_at_ms);
}

constexpr const char* kLedgerColumns = "id,event_type,action_id,entity_id,actor,payload_json,created_at_ms";

model::LedgerEventRecord ReadLedger(sqlite3_stmt* st) {
  model::LedgerEventRecord r;
  r.id            = ColU64(st, 0);
  r.event_type    = ColText(st, 1);
  r.action_id     = ColText(st, 2);
  r.entity_id     = ColText(st, 3);
  r.actor         = ColText(st, 4);
  r.payload_json  = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Retryable, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::Constraint, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::Internal, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Ad hierarchy
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO entities(id,level,campaign_id,adset_id,name,status,daily_budget_usd,created_at_ms,updated_at_ms)"
                      " VALUES(?,?,?,?,?,?,?,?,?)"
                      " ON CONFLICT(id) DO UPDATE SET level=excluded.level,campaign_id=excluded.campaign_id,adset_id=excluded.adset_id,"
                      "name=excluded.name,status=excluded.status,daily_budget_usd=excluded.daily_budget_usd,"
                      "created_at_ms=excluded.created_at_ms,updated_at_ms=excluded.updated_at_ms;");

  Binder(st.get())
      .Text(r.id)
      .I32(static_cast<int>(r.level))
      .Text(r.campaign_id)
      .Text(r.adset_id)
      .Text(r.name)
      .Text(r.status)
      .Real(r.daily_budget_usd)
      .U64(r.created_at_ms)
      .U64(r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kEntityColumns + " FROM entities WHERE id=?;");
  Binder(st.get()).Text(id);

  auto rows = ReadAll<model::EntityRecord>(db, st.get(), ReadEntity);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t, const std::string& campaign_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kEntityColumns + " FROM entities WHERE campaign_id=? AND id<>? ORDER BY id;");
  Binder(st.get()).Text(campaign_id).Text(campaign_id);
  return ReadAll<model::EntityRecord>(db, st.get(), ReadEntity);
}

std::vector<model::EntityRecord> SqliteRepository::ListActiveCampaigns(Transaction& t, uint64_t created_before_ms, uint32_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kEntityColumns +
                             " FROM entities WHERE level=? AND status=? AND created_at_ms<=? ORDER BY created_at_ms, id LIMIT ?;");
  Binder(st.get())
      .I32(static_cast<int>(TargetLevel::kCampaign))
      .Text(model::kEntityActive)
      .U64(created_before_ms)
      .U64(limit == 0 ? static_cast<uint64_t>(INT64_MAX) : limit);
  return ReadAll<model::EntityRecord>(db, st.get(), ReadEntity);
}

// ------------------------------------------------------------------
// Performance windows
// ------------------------------------------------------------------

Result SqliteRepository::InsertInsight(Transaction& t, model::InsightRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO insights(campaign_id,adset_id,ad_id,date_start_ms,date_stop_ms,impressions,clicks,spend_usd)"
                      " VALUES(?,?,?,?,?,?,?,?);");
  Binder(st.get())
      .Text(r.scope.campaign_id)
      .Text(r.scope.adset_id)
      .Text(r.scope.ad_id)
      .U64(r.date_start_ms)
      .U64(r.date_stop_ms)
      .U64(r.impressions)
      .U64(r.clicks)
      .Real(r.spend_usd);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::vector<model::InsightRecord> SqliteRepository::ListInsights(Transaction& t, const model::Scope& scope, uint64_t start_ms, uint64_t end_ms) {
  auto*       db  = TX(t).Handle();
  std::string sql = "SELECT id,campaign_id,adset_id,ad_id,date_start_ms,date_stop_ms,impressions,clicks,spend_usd FROM insights"
                    " WHERE date_start_ms>=? AND date_start_ms<?";
  AppendScope(sql, scope, false);
  sql += " ORDER BY date_start_ms, id;";

  auto   st = Prepare(db, sql);
  Binder b(st.get());
  b.U64(start_ms).U64(end_ms);
  BindScope(b, scope, false);

  return ReadAll<model::InsightRecord>(db, st.get(), [](sqlite3_stmt* s) {
    model::InsightRecord r;
    r.id            = ColU64(s, 0);
    r.scope         = {ColText(s, 1), ColText(s, 2), ColText(s, 3)};
    r.date_start_ms = ColU64(s, 4);
    r.date_stop_ms  = ColU64(s, 5);
    r.impressions   = ColU64(s, 6);
    r.clicks        = ColU64(s, 7);
    r.spend_usd     = ColReal(s, 8);
    return r;
  });
}

// ------------------------------------------------------------------
// Conversion outcomes
// ------------------------------------------------------------------

Result SqliteRepository::InsertOutcome(Transaction& t, const model::OutcomeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO outcomes(") + kOutcomeColumns + ") VALUES(" + Placeholders(11) + ");");
  Binder(st.get())
      .Text(r.outcome_id)
      .Text(r.scope.campaign_id)
      .Text(r.scope.adset_id)
      .Text(r.scope.ad_id)
      .Real(r.value_usd)
      .Text(r.conversion_type)
      .U64(r.event_timestamp_ms)
      .Text(r.session_id)
      .OptReal(r.session_duration_seconds)
      .Text(r.attribution_model)
      .Real(r.attribution_weight);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "outcome " + r.outcome_id);
  return Translate(db, rc);
}

std::vector<model::OutcomeRecord> SqliteRepository::ListOutcomes(Transaction& t, const model::Scope& scope, uint64_t start_ms, uint64_t end_ms) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kOutcomeColumns + " FROM outcomes WHERE event_timestamp_ms>=? AND event_timestamp_ms<?";
  AppendScope(sql, scope, false);
  sql += " ORDER BY event_timestamp_ms, outcome_id;";

  auto   st = Prepare(db, sql);
  Binder b(st.get());
  b.U64(start_ms).U64(end_ms);
  BindScope(b, scope, false);
  return ReadAll<model::OutcomeRecord>(db, st.get(), ReadOutcome);
}

Result SqliteRepository::UpdateOutcomeAttribution(Transaction& t, const std::string& outcome_id, const std::string& attribution_model, double weight) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE outcomes SET attribution_model=?,attribution_weight=? WHERE outcome_id=?;");
  Binder(st.get()).Text(attribution_model).Real(weight).Text(outcome_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "outcome " + outcome_id);
  return res;
}

// ------------------------------------------------------------------
// Daily ROAS metrics
// ------------------------------------------------------------------

Result SqliteRepository::InsertRoasMetrics(Transaction& t, model::RoasMetricsRecord& r) {
  auto*       db      = TX(t).Handle();
  std::string columns = std::string(kRoasColumns).substr(3); // drop "id,"
  auto        st      = Prepare(db, "INSERT INTO roas_metrics(" + columns + ") VALUES(" + Placeholders(29) + ");");
  Binder(st.get())
      .Text(r.scope.campaign_id)
      .Text(r.scope.adset_id)
      .Text(r.scope.ad_id)
      .U64(r.date_ms)
      .Real(r.actual_roas)
      .Real(r.smoothed_roas)
      .Real(r.predicted_roas)
      .Real(r.confidence_score)
      .Real(r.confidence_interval_low)
      .Real(r.confidence_interval_high)
      .U64(r.sample_size)
      .I32(r.is_outlier ? 1 : 0)
      .Text(r.outlier_reason)
      .Text(r.performance_tier)
      .Text(r.recommendation)
      .Real(r.recommended_budget_change_pct)
      .U64(r.impressions)
      .U64(r.clicks)
      .U64(r.conversions)
      .Real(r.total_cost_usd)
      .Real(r.total_revenue_usd)
      .Real(r.conversion_probability)
      .Real(r.session_quality_score)
      .Real(r.user_retention_probability)
      .Real(r.lifetime_value_estimate)
      .Real(r.blended_ctr)
      .Real(r.blended_cpc)
      .Real(r.blended_cpm)
      .U64(r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "roas metrics already recorded for this scope and date");
  }
  auto res = Translate(db, rc);
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::vector<model::RoasMetricsRecord> SqliteRepository::ListRoasMetrics(Transaction& t, const RoasMetricsQuery& q) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kRoasColumns + " FROM roas_metrics WHERE date_ms>=?";
  AppendScope(sql, q.scope, q.exact_scope);
  if (q.ad_level_only) sql += " AND ad_id<>''";
  sql += " ORDER BY date_ms DESC, id DESC LIMIT ?;";

  auto   st = Prepare(db, sql);
  Binder b(st.get());
  b.U64(q.since_ms);
  BindScope(b, q.scope, q.exact_scope);
  b.U64(q.limit == 0 ? static_cast<uint64_t>(INT64_MAX) : q.limit);
  return ReadAll<model::RoasMetricsRecord>(db, st.get(), ReadRoas);
}

// ------------------------------------------------------------------
// Action queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertAction(Transaction& t, const model::ActionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO actions(") + kActionColumns + ") VALUES(" + Placeholders(29) + ");");

  Binder b(st.get());
  b.Text(r.action_id).I32(static_cast<int>(r.type)).I32(static_cast<int>(r.status));
  BindActionBody(b, r);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "action " + r.action_id);
  return Translate(db, rc);
}

std::optional<model::ActionRecord> SqliteRepository::GetAction(Transaction& t, const std::string& action_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kActionColumns + " FROM actions WHERE action_id=?;");
  Binder(st.get()).Text(action_id);

  auto rows = ReadAll<model::ActionRecord>(db, st.get(), ReadAction);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::ActionRecord> SqliteRepository::ListActions(Transaction& t, const ActionFilter& f) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kActionColumns + " FROM actions WHERE 1=1";
  if (!f.campaign_id.empty()) sql += " AND campaign_id=?";
  if (!f.target_id.empty()) sql += " AND target_id=?";
  if (f.type) sql += " AND type=?";
  if (!f.statuses.empty()) sql += " AND status IN (" + Placeholders(f.statuses.size()) + ")";
  if (f.exclude_stale_at_ms != 0) sql += " AND NOT (status=? AND expires_at_ms<=?)";
  sql += " ORDER BY confidence DESC, created_at_ms ASC, action_id ASC LIMIT ?;";

  auto   st = Prepare(db, sql);
  Binder b(st.get());
  if (!f.campaign_id.empty()) b.Text(f.campaign_id);
  if (!f.target_id.empty()) b.Text(f.target_id);
  if (f.type) b.I32(static_cast<int>(*f.type));
  for (auto status : f.statuses) {
    b.I32(static_cast<int>(status));
  }
  if (f.exclude_stale_at_ms != 0) b.I32(static_cast<int>(ActionStatus::kSuggested)).U64(f.exclude_stale_at_ms);
  b.U64(f.limit == 0 ? static_cast<uint64_t>(INT64_MAX) : f.limit);

  return ReadAll<model::ActionRecord>(db, st.get(), ReadAction);
}

Result SqliteRepository::UpdateAction(Transaction& t, const model::ActionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE actions SET target_level=?,target_id=?,campaign_id=?,adset_id=?,ad_id=?,amount_pct=?,amount_usd=?,"
                      "old_budget_usd=?,new_budget_usd=?,reason=?,reason_details=?,confidence=?,roas_value=?,safety_score=?,created_by=?,"
                      "approved_by=?,executed_by=?,execution_result=?,execution_error=?,reallocation_plan=?,affected_ad_ids=?,"
                      "created_at_ms=?,updated_at_ms=?,approved_at_ms=?,executed_at_ms=?,expires_at_ms=?,type=? WHERE action_id=?;");

  Binder b(st.get());
  BindActionBody(b, r);
  b.I32(static_cast<int>(r.type)).Text(r.action_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "action " + r.action_id);
  return res;
}

Result SqliteRepository::CompareAndSetActionStatus(Transaction& t, const StatusTransition& tr) {
  if (tr.expected.empty()) return Result::Err(ErrorCode::StatusMismatch, "no expected status");

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE actions SET status=?,updated_at_ms=? WHERE action_id=? AND status IN (" + Placeholders(tr.expected.size()) + ");");

  Binder b(st.get());
  b.I32(static_cast<int>(tr.next)).U64(tr.now_ms).Text(tr.action_id);
  for (auto status : tr.expected) {
    b.I32(static_cast<int>(status));
  }

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 1) return Result::Ok();

  auto current = GetAction(t, tr.action_id);
  if (!current) return Result::Err(ErrorCode::NotFound, "action " + tr.action_id);
  return Result::StatusMismatch(current->status);
}

std::optional<model::ActionRecord> SqliteRepository::LatestExecutedAction(Transaction& t, const std::string& target_id, ActionType type) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kActionColumns +
                             " FROM actions WHERE target_id=? AND type=? AND status=? ORDER BY executed_at_ms DESC LIMIT 1;");
  Binder(st.get()).Text(target_id).I32(static_cast<int>(type)).I32(static_cast<int>(ActionStatus::kExecuted));

  auto rows = ReadAll<model::ActionRecord>(db, st.get(), ReadAction);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

QueueCounts SqliteRepository::CountQueue(Transaction& t, uint64_t since_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT status, COUNT(*), COALESCE(SUM(confidence),0) FROM actions"
                      " WHERE status IN (?,?,?) OR ((status=? OR status=?) AND executed_at_ms>=?) GROUP BY status;");
  Binder(st.get())
      .I32(static_cast<int>(ActionStatus::kSuggested))
      .I32(static_cast<int>(ActionStatus::kPending))
      .I32(static_cast<int>(ActionStatus::kExecuting))
      .I32(static_cast<int>(ActionStatus::kExecuted))
      .I32(static_cast<int>(ActionStatus::kFailed))
      .U64(since_ms);

  QueueCounts counts;
  int         rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    const auto status = static_cast<ActionStatus>(ColI32(st.get(), 0));
    const auto n      = ColU64(st.get(), 1);
    switch (status) {
      case ActionStatus::kSuggested:
        counts.suggested = n;
        counts.open_confidence_sum += ColReal(st.get(), 2);
        break;
      case ActionStatus::kPending:
        counts.pending = n;
        counts.open_confidence_sum += ColReal(st.get(), 2);
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
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return counts;
}

// ------------------------------------------------------------------
// Audit ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendLedgerEvent(Transaction& t, model::LedgerEventRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO ledger_events(event_type,action_id,entity_id,actor,payload_json,created_at_ms) VALUES(?,?,?,?,?,?);");
  Binder(st.get()).Text(r.event_type).Text(r.action_id).Text(r.entity_id).Text(r.actor).Text(r.payload_json).U64(r.created_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::vector<model::LedgerEventRecord> SqliteRepository::ListLedgerEvents(Transaction& t, const std::string& action_id, uint32_t limit) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kLedgerColumns + " FROM ledger_events";
  if (!action_id.empty()) sql += " WHERE action_id=?";
  sql += " ORDER BY id DESC LIMIT ?;";

  auto   st = Prepare(db, sql);
  Binder b(st.get());
  if (!action_id.empty()) b.Text(action_id);
  b.U64(limit == 0 ? static_cast<uint64_t>(INT64_MAX) : limit);
  return ReadAll<model::LedgerEventRecord>(db, st.get(), ReadLedger);
}

} // namespace autopilot::db::sqlite
