#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/analytics/budget_allocator.hpp"
#include "internal/analytics/metrics_recorder.hpp"
#include "internal/analytics/prediction_engine.hpp"
#include "internal/analytics/roas_calculator.hpp"
#include "internal/config/settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/gateway/store_gateway.hpp"
#include "internal/grpc/analytics_server.hpp"
#include "internal/grpc/autonomous_server.hpp"
#include "internal/grpc/optimization_server.hpp"
#include "internal/guardrails/guardrail_chain.hpp"
#include "internal/ledger/log_ledger.hpp"
#include "internal/ledger/repository_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/optimization/action_executor.hpp"
#include "internal/optimization/optimization_service.hpp"
#include "internal/service/action_service.hpp"
#include "internal/service/analytics_service.hpp"
#include "internal/service/autonomous_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if AUTOPILOT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace autopilot::factory {

namespace {

constexpr std::size_t kDefaultPgConnections = 16;

#if AUTOPILOT_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,level,status,daily_budget_usd,created_at_ms FROM entities LIMIT 1;");
  tx.exec("SELECT action_id,type,status,target_id,expires_at_ms FROM actions LIMIT 1;");
  tx.exec("SELECT id,date_ms,actual_roas,confidence_score FROM roas_metrics LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const autopilot::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->EnsureSchema();
    AUTOPILOT_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path()),
                                                   observability::IntField("schema_version", sqlite_db->SchemaVersion())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if AUTOPILOT_DB_POSTGRES
    const auto max_connections =
        database.postgres().max_connections() == 0 ? kDefaultPgConnections : static_cast<std::size_t>(database.postgres().max_connections());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    AUTOPILOT_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  AUTOPILOT_LOG_WARN("Using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const autopilot::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto settings = config::BuildSettings(config);

  // ------------------------------------------------------------------
  // Storage and collaborators
  // ------------------------------------------------------------------
  auto clock      = std::make_shared<util::WallClock>();
  auto repository = BuildRepository(config);

  std::shared_ptr<ledger::EventLedger> ledger;
  if (config.database().has_sqlite() || config.database().has_postgres()) {
    ledger = std::make_shared<ledger::RepositoryLedger>(repository);
  } else {
    ledger = std::make_shared<ledger::LogLedger>();
  }

  auto gateway = std::make_shared<gateway::StoreGateway>(repository, clock);

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  auto calculator = std::make_shared<analytics::RoasCalculator>(settings.roas, repository, clock);
  auto prediction = std::make_shared<analytics::PredictionEngine>(settings.prediction, settings.roas.default_prior_roas, repository, clock);
  auto recorder   = std::make_shared<analytics::MetricsRecorder>(repository, calculator, prediction, clock);
  auto allocator  = std::make_shared<analytics::BudgetAllocator>(settings.optimizer, settings.roas.min_sample_size);

  auto policy     = std::make_shared<guardrails::PolicyEngine>(settings.policy, clock);
  auto safety     = std::make_shared<guardrails::SafetyEngine>(settings.safety, clock);
  auto guardrails = std::make_shared<guardrails::GuardrailChain>(policy, safety);

  auto executor  = std::make_shared<optimization::ActionExecutor>(gateway);
  auto optimizer = std::make_shared<optimization::OptimizationService>(settings, repository, clock, executor, guardrails, ledger);
  auto worker    = std::make_shared<autonomous::AutonomousWorker>(settings, repository, optimizer, ledger, clock);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.clock      = clock;
  ctx.calculator = calculator;
  ctx.prediction = prediction;
  ctx.recorder   = recorder;
  ctx.allocator  = allocator;
  ctx.optimizer  = optimizer;
  ctx.worker     = worker;

  auto action_service     = std::make_shared<service::ActionService>(ctx);
  auto autonomous_service = std::make_shared<service::AutonomousService>(ctx);
  auto analytics_service  = std::make_shared<service::AnalyticsService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::OptimizationServer>(action_service));
  app.grpc_services.push_back(std::make_unique<grpc::AutonomousServer>(autonomous_service));
  app.grpc_services.push_back(std::make_unique<grpc::AnalyticsServer>(analytics_service));

  app.repository = repository;
  app.worker     = worker;
  return app;
}

} // namespace autopilot::factory
