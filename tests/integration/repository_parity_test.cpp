#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/factory.hpp"

namespace {

using autopilot::db::ErrorCode;
using autopilot::db::Repository;
using autopilot::db::model::ActionRecord;
using autopilot::db::model::EntityRecord;
using autopilot::db::model::InsightRecord;
using autopilot::db::model::LedgerEventRecord;
using autopilot::db::model::OutcomeRecord;
using autopilot::db::model::RoasMetricsRecord;
using autopilot::db::model::Scope;
using autopilot::model::ActionStatus;
using autopilot::model::ActionType;
using autopilot::model::TargetLevel;
using autopilot::runtime::config::RuntimeConfig;

constexpr uint64_t kDayMs  = 24ULL * 3600 * 1000;
constexpr uint64_t kBaseMs = 1'759'968'000'000ULL; // 2025-10-09T00:00:00Z

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

template <typename T, typename Pred>
std::vector<T> Only(std::vector<T> rows, Pred pred) {
  rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const T& r) { return !pred(r); }), rows.end());
  return rows;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

EntityRecord Entity(const std::string& id, TargetLevel level, const std::string& campaign_id, uint64_t created_at_ms, double budget = 0.0) {
  EntityRecord e;
  e.id               = id;
  e.level            = level;
  e.campaign_id      = campaign_id;
  e.adset_id         = level == TargetLevel::kAd ? campaign_id + "-set" : "";
  e.name             = id;
  e.daily_budget_usd = budget;
  e.created_at_ms    = created_at_ms;
  e.updated_at_ms    = created_at_ms;
  return e;
}

ActionRecord Action(const std::string& id, const std::string& campaign_id, const std::string& target_id, ActionType type, double confidence,
                    uint64_t created_at_ms) {
  ActionRecord a;
  a.action_id      = id;
  a.type           = type;
  a.target_level   = TargetLevel::kAd;
  a.target_id      = target_id;
  a.campaign_id    = campaign_id;
  a.ad_id          = target_id;
  a.amount_pct     = 0.1;
  a.old_budget_usd = 100.0;
  a.new_budget_usd = 110.0;
  a.amount_usd     = 10.0;
  a.confidence     = confidence;
  a.reason         = "high_roas_performance";
  a.created_by     = "parity";
  a.created_at_ms  = created_at_ms;
  a.updated_at_ms  = created_at_ms;
  a.expires_at_ms  = created_at_ms + 2 * kDayMs;
  return a;
}

// ---------------------------------------------------------------------------
// Suites
// ---------------------------------------------------------------------------

void VerifyEntities(Repository& repo, const std::string& run) {
  const auto campaign = run + "-camp";
  auto       tx       = repo.Begin();

  assert(repo.UpsertEntity(*tx, Entity(campaign, TargetLevel::kCampaign, campaign, kBaseMs - 5 * kDayMs)));
  assert(repo.UpsertEntity(*tx, Entity(campaign + "-set", TargetLevel::kAdSet, campaign, kBaseMs - 5 * kDayMs)));
  assert(repo.UpsertEntity(*tx, Entity(campaign + "-ad-1", TargetLevel::kAd, campaign, kBaseMs - 5 * kDayMs, 100.0)));
  assert(repo.UpsertEntity(*tx, Entity(campaign + "-ad-2", TargetLevel::kAd, campaign, kBaseMs - 5 * kDayMs, 50.0)));

  // young and paused campaigns are not listed as active candidates
  assert(repo.UpsertEntity(*tx, Entity(run + "-young", TargetLevel::kCampaign, run + "-young", kBaseMs)));
  auto paused   = Entity(run + "-paused", TargetLevel::kCampaign, run + "-paused", kBaseMs - 5 * kDayMs);
  paused.status = autopilot::db::model::kEntityPaused;
  assert(repo.UpsertEntity(*tx, paused));

  auto ad = repo.GetEntity(*tx, campaign + "-ad-1");
  assert(ad.has_value());
  assert(ad->level == TargetLevel::kAd);
  assert(ad->adset_id == campaign + "-set");
  assert(ad->status == autopilot::db::model::kEntityActive);
  assert(ad->daily_budget_usd == 100.0);

  // upsert overwrites
  ad->daily_budget_usd = 120.0;
  assert(repo.UpsertEntity(*tx, *ad));
  assert(repo.GetEntity(*tx, campaign + "-ad-1")->daily_budget_usd == 120.0);

  assert(!repo.GetEntity(*tx, run + "-missing").has_value());

  const auto children = repo.ListEntities(*tx, campaign);
  assert(Only(children, [](const EntityRecord& e) { return e.level == TargetLevel::kAd; }).size() == 2);

  const auto active = Only(repo.ListActiveCampaigns(*tx, kBaseMs - kDayMs, 1000), [&](const EntityRecord& e) { return StartsWith(e.id, run); });
  assert(active.size() == 1);
  assert(active[0].id == campaign);

  tx->Commit();
}

void VerifyInsightsAndOutcomes(Repository& repo, const std::string& run) {
  const auto campaign = run + "-perf";
  auto       tx       = repo.Begin();

  for (uint64_t day = 0; day < 3; ++day) {
    InsightRecord insight;
    insight.scope         = Scope{campaign, campaign + "-set", campaign + "-ad"};
    insight.date_start_ms = kBaseMs + day * kDayMs;
    insight.date_stop_ms  = kBaseMs + (day + 1) * kDayMs;
    insight.impressions   = 1000;
    insight.clicks        = 50;
    insight.spend_usd     = 25.0;
    assert(repo.InsertInsight(*tx, insight));
    assert(insight.id != 0);
  }

  const auto window = repo.ListInsights(*tx, Scope{campaign, "", ""}, kBaseMs + kDayMs, kBaseMs + 3 * kDayMs);
  assert(window.size() == 2);
  assert(repo.ListInsights(*tx, Scope{"", "", campaign + "-other"}, kBaseMs, kBaseMs + 3 * kDayMs).empty());

  OutcomeRecord first;
  first.outcome_id               = run + "-o1";
  first.scope                    = Scope{campaign, campaign + "-set", campaign + "-ad"};
  first.value_usd                = 40.0;
  first.conversion_type          = "purchase";
  first.event_timestamp_ms       = kBaseMs + 3600 * 1000;
  first.session_id               = "s-1";
  first.session_duration_seconds = 95.5;
  assert(repo.InsertOutcome(*tx, first));

  OutcomeRecord second      = first;
  second.outcome_id         = run + "-o2";
  second.event_timestamp_ms = kBaseMs + 2 * 3600 * 1000;
  second.session_duration_seconds.reset();
  assert(repo.InsertOutcome(*tx, second));
  tx->Commit();

  // a failed insert may poison its transaction, so duplicates get their own
  {
    auto       dup_tx = repo.Begin();
    const auto dup    = repo.InsertOutcome(*dup_tx, first);
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
  }

  tx            = repo.Begin();
  auto outcomes = repo.ListOutcomes(*tx, Scope{campaign, "", ""}, kBaseMs, kBaseMs + kDayMs);
  assert(outcomes.size() == 2);
  assert(outcomes[0].outcome_id == first.outcome_id); // oldest first
  assert(outcomes[0].session_duration_seconds.has_value());
  assert(*outcomes[0].session_duration_seconds == 95.5);
  assert(!outcomes[1].session_duration_seconds.has_value());
  assert(outcomes[0].attribution_model == "last_click");
  assert(outcomes[0].attribution_weight == 1.0);

  assert(repo.UpdateOutcomeAttribution(*tx, first.outcome_id, "linear", 0.5));
  assert(repo.UpdateOutcomeAttribution(*tx, run + "-missing", "linear", 0.5).code == ErrorCode::NotFound);

  outcomes = repo.ListOutcomes(*tx, Scope{campaign, "", ""}, kBaseMs, kBaseMs + kDayMs);
  assert(outcomes[0].attribution_model == "linear");
  assert(outcomes[0].attribution_weight == 0.5);
  assert(outcomes[1].attribution_model == "last_click");

  tx->Commit();
}

void VerifyRoasMetrics(Repository& repo, const std::string& run) {
  const auto campaign = run + "-roas";
  auto       tx       = repo.Begin();

  auto row = [&](const std::string& ad_id, uint64_t date_ms, double roas) {
    RoasMetricsRecord r;
    r.scope            = Scope{campaign, ad_id.empty() ? "" : campaign + "-set", ad_id};
    r.date_ms          = date_ms;
    r.actual_roas      = roas;
    r.smoothed_roas    = roas;
    r.confidence_score = 0.8;
    r.sample_size      = 40;
    r.performance_tier = "good";
    r.recommendation   = "maintain";
    r.created_at_ms    = date_ms;
    return r;
  };

  auto older = row(campaign + "-ad", kBaseMs - kDayMs, 1.5);
  auto newer = row(campaign + "-ad", kBaseMs, 2.5);
  auto total = row("", kBaseMs, 2.0);
  assert(repo.InsertRoasMetrics(*tx, older));
  assert(repo.InsertRoasMetrics(*tx, newer));
  assert(repo.InsertRoasMetrics(*tx, total));
  tx->Commit();

  {
    auto dup_tx = repo.Begin();
    auto dup    = row(campaign + "-ad", kBaseMs, 9.9);
    assert(repo.InsertRoasMetrics(*dup_tx, dup).code == ErrorCode::AlreadyExists);
  }

  tx = repo.Begin();

  autopilot::db::RoasMetricsQuery query;
  query.scope.campaign_id = campaign;
  auto rows               = repo.ListRoasMetrics(*tx, query);
  assert(rows.size() == 3);
  assert(rows[0].date_ms >= rows[1].date_ms); // newest first

  query.ad_level_only = true;
  rows                = repo.ListRoasMetrics(*tx, query);
  assert(rows.size() == 2);
  assert(rows[0].actual_roas == 2.5);
  assert(rows[0].performance_tier == "good");

  query.since_ms = kBaseMs;
  assert(repo.ListRoasMetrics(*tx, query).size() == 1);

  autopilot::db::RoasMetricsQuery exact;
  exact.scope       = Scope{campaign, "", ""};
  exact.exact_scope = true;
  rows              = repo.ListRoasMetrics(*tx, exact);
  assert(rows.size() == 1);
  assert(rows[0].scope.ad_id.empty());

  autopilot::db::RoasMetricsQuery limited;
  limited.scope.campaign_id = campaign;
  limited.limit             = 1;
  assert(repo.ListRoasMetrics(*tx, limited).size() == 1);

  tx->Commit();
}

void VerifyActionQueue(Repository& repo, const std::string& run) {
  const auto campaign = run + "-queue";
  const auto since    = NowMs() - 1000;

  autopilot::db::QueueCounts before;
  {
    auto tx = repo.Begin();
    before  = repo.CountQueue(*tx, since);
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto low  = Action(run + "-a1", campaign, campaign + "-ad-1", ActionType::kScaleUp, 0.70, kBaseMs);
  auto high = Action(run + "-a2", campaign, campaign + "-ad-2", ActionType::kPause, 0.90, kBaseMs + 1);
  auto mid  = Action(run + "-a3", campaign, campaign + "-ad-1", ActionType::kScaleDown, 0.80, kBaseMs + 2);

  autopilot::v1::ReallocationPlan plan;
  auto*                           alloc = plan.add_allocations();
  alloc->set_ad_id(campaign + "-ad-1");
  alloc->set_allocated_budget(75.0);
  plan.set_total_budget(100.0);
  plan.set_total_allocated(75.0);
  mid.reallocation_plan = plan;
  mid.affected_ad_ids   = {campaign + "-ad-1", campaign + "-ad-2"};

  assert(repo.InsertAction(*tx, low));
  assert(repo.InsertAction(*tx, high));
  assert(repo.InsertAction(*tx, mid));
  tx->Commit();

  {
    auto dup_tx = repo.Begin();
    assert(repo.InsertAction(*dup_tx, low).code == ErrorCode::AlreadyExists);
  }

  tx = repo.Begin();

  auto loaded = repo.GetAction(*tx, mid.action_id);
  assert(loaded.has_value());
  assert(loaded->type == ActionType::kScaleDown);
  assert(loaded->status == ActionStatus::kSuggested);
  assert(loaded->reallocation_plan.has_value());
  assert(loaded->reallocation_plan->allocations_size() == 1);
  assert(loaded->reallocation_plan->allocations(0).allocated_budget() == 75.0);
  assert(loaded->affected_ad_ids.size() == 2);
  assert(!loaded->execution_result.has_value());
  assert(!repo.GetAction(*tx, run + "-missing").has_value());

  autopilot::db::ActionFilter filter;
  filter.campaign_id = campaign;
  auto listed        = repo.ListActions(*tx, filter);
  assert(listed.size() == 3);
  assert(listed[0].action_id == high.action_id);
  assert(listed[1].action_id == mid.action_id);
  assert(listed[2].action_id == low.action_id);

  filter.target_id = campaign + "-ad-1";
  assert(repo.ListActions(*tx, filter).size() == 2);
  filter.type = ActionType::kScaleUp;
  assert(repo.ListActions(*tx, filter).size() == 1);

  autopilot::db::ActionFilter stale;
  stale.campaign_id         = campaign;
  stale.exclude_stale_at_ms = kBaseMs + 3 * kDayMs;
  assert(repo.ListActions(*tx, stale).empty());

  autopilot::db::ActionFilter limited;
  limited.campaign_id = campaign;
  limited.limit       = 2;
  assert(repo.ListActions(*tx, limited).size() == 2);

  // compare-and-set
  const auto now = NowMs();
  assert(repo.CompareAndSetActionStatus(*tx, {low.action_id, {ActionStatus::kSuggested}, ActionStatus::kPending, now}));
  const auto stale_cas = repo.CompareAndSetActionStatus(*tx, {low.action_id, {ActionStatus::kSuggested}, ActionStatus::kPending, now});
  assert(stale_cas.code == ErrorCode::StatusMismatch);
  assert(stale_cas.message == autopilot::model::ToString(ActionStatus::kPending));
  assert(repo.CompareAndSetActionStatus(*tx, {run + "-missing", {ActionStatus::kSuggested}, ActionStatus::kPending, now}).code ==
         ErrorCode::NotFound);

  // UpdateAction never touches status
  assert(repo.CompareAndSetActionStatus(*tx, {low.action_id, {ActionStatus::kPending}, ActionStatus::kExecuting, now}));
  assert(repo.CompareAndSetActionStatus(*tx, {low.action_id, {ActionStatus::kExecuting}, ActionStatus::kExecuted, now}));
  auto executed           = *repo.GetAction(*tx, low.action_id);
  executed.status         = ActionStatus::kSuggested;
  executed.executed_by    = "parity";
  executed.executed_at_ms = now;
  autopilot::v1::ExecutionResult result;
  result.set_status("executed");
  result.set_message("Scaled up");
  executed.execution_result = result;
  assert(repo.UpdateAction(*tx, executed));

  executed = *repo.GetAction(*tx, low.action_id);
  assert(executed.status == ActionStatus::kExecuted);
  assert(executed.executed_by == "parity");
  assert(executed.execution_result.has_value());
  assert(executed.execution_result->message() == "Scaled up");

  const auto latest = repo.LatestExecutedAction(*tx, campaign + "-ad-1", ActionType::kScaleUp);
  assert(latest.has_value());
  assert(latest->action_id == low.action_id);
  assert(!repo.LatestExecutedAction(*tx, campaign + "-ad-1", ActionType::kPause).has_value());

  assert(repo.CompareAndSetActionStatus(*tx, {high.action_id, {ActionStatus::kSuggested}, ActionStatus::kExecuting, now}));
  assert(repo.CompareAndSetActionStatus(*tx, {high.action_id, {ActionStatus::kExecuting}, ActionStatus::kFailed, now}));
  auto failed            = *repo.GetAction(*tx, high.action_id);
  failed.execution_error = "rejected";
  failed.executed_at_ms  = now;
  assert(repo.UpdateAction(*tx, failed));

  const auto counts = repo.CountQueue(*tx, since);
  assert(counts.suggested == before.suggested + 1);
  assert(counts.executed_since == before.executed_since + 1);
  assert(counts.failed_since == before.failed_since + 1);
  assert(counts.open_confidence_sum - before.open_confidence_sum > 0.79);
  assert(counts.open_confidence_sum - before.open_confidence_sum < 0.81);

  tx->Commit();
}

void VerifyLedger(Repository& repo, const std::string& run) {
  const auto action_id = run + "-ledger-action";
  auto       tx        = repo.Begin();

  for (int i = 0; i < 3; ++i) {
    LedgerEventRecord event;
    event.event_type    = i == 0 ? "optimization_suggested" : "optimization_approved";
    event.action_id     = action_id;
    event.entity_id     = "ad-1";
    event.actor         = "parity";
    event.payload_json  = "{\"step\":" + std::to_string(i) + "}";
    event.created_at_ms = kBaseMs + static_cast<uint64_t>(i);
    assert(repo.AppendLedgerEvent(*tx, event));
    assert(event.id != 0);
  }

  auto events = repo.ListLedgerEvents(*tx, action_id, 0);
  assert(events.size() == 3);
  assert(events[0].payload_json == "{\"step\":2}"); // newest first
  assert(events[2].event_type == "optimization_suggested");

  assert(repo.ListLedgerEvents(*tx, action_id, 2).size() == 2);
  assert(repo.ListLedgerEvents(*tx, run + "-nothing", 0).empty());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& run) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertEntity(*tx, Entity(run + "-rollback", TargetLevel::kCampaign, run + "-rollback", kBaseMs)));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertAction(*tx, Action(run + "-dropped", run, run + "-ad", ActionType::kPause, 0.5, kBaseMs)));
  }

  auto tx = repo.Begin();
  assert(!repo.GetEntity(*tx, run + "-rollback").has_value());
  assert(!repo.GetAction(*tx, run + "-dropped").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& run) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertEntity(*tx, Entity(run + "-durable", TargetLevel::kCampaign, run + "-durable", kBaseMs, 500.0)));
    assert(repo->InsertAction(*tx, Action(run + "-durable-action", run + "-durable", run + "-durable-ad", ActionType::kScaleUp, 0.9, kBaseMs)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto entity = repo->GetEntity(*tx, run + "-durable");
  assert(entity.has_value());
  assert(entity->daily_budget_usd == 500.0);

  auto action = repo->GetAction(*tx, run + "-durable-action");
  assert(action.has_value());
  assert(action->confidence == 0.9);
  assert(action->status == ActionStatus::kSuggested);
  tx->Commit();
}

// ---------------------------------------------------------------------------
// Backends
// ---------------------------------------------------------------------------

BackendFactory MakeMemoryFactory() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  return BackendFactory{
      .name             = "memory",
      .make_repository  = [config]() { return autopilot::factory::BuildRepository(config); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("autopilot_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);

  auto make_repo = [config]() { return autopilot::factory::BuildRepository(config); };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

#if AUTOPILOT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("AUTOPILOT_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("AUTOPILOT_TEST_POSTGRES_URI is not set");
  }

  RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  config.mutable_database()->mutable_postgres()->set_max_connections(4);

  auto make_repo = [config]() { return autopilot::factory::BuildRepository(config); };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // ids are unique per run so a shared postgres database can be reused
  const auto run  = backend.name + "-" + std::to_string(NowMs());
  auto       repo = backend.make_repository();

  VerifyEntities(*repo, run);
  VerifyInsightsAndOutcomes(*repo, run);
  VerifyRoasMetrics(*repo, run);
  VerifyActionQueue(*repo, run);
  VerifyLedger(*repo, run);
  VerifyRollbackBehavior(*repo, run);

  repo.reset();
  VerifyRestartDurability(backend, run);

  backend.cleanup();
}

void VerifySqliteSchemaVersioning() {
  using autopilot::db::sqlite::SqliteDB;
  auto db_path = (std::filesystem::temp_directory_path() / ("autopilot_schema_" + std::to_string(NowMs()) + ".db")).string();

  {
    SqliteDB db(db_path);
    assert(db.SchemaVersion() == 0);
    db.EnsureSchema();
    assert(db.SchemaVersion() == SqliteDB::kSchemaVersion);
    // a second run against a current file is a no-op
    db.EnsureSchema();
    assert(db.SchemaVersion() == SqliteDB::kSchemaVersion);
    db.Exec("PRAGMA user_version = " + std::to_string(SqliteDB::kSchemaVersion + 1));
  }

  {
    SqliteDB db(db_path);
    bool refused = false;
    try {
      db.EnsureSchema();
    } catch (const std::runtime_error&) {
      refused = true;
    }
    assert(refused);
  }

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}

} // namespace

int main() {
  VerifySqliteSchemaVersioning();

  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if AUTOPILOT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "autopilot_integration_repository_parity: pass\n";
  return 0;
}
