#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/roster_server.hpp"
#include "internal/ledger/claim_book.hpp"
#include "internal/ledger/claim_processor.hpp"
#include "internal/ledger/move_executor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/roster_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROSTER_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace roster::factory {

namespace {

#if ROSTER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteBootstrapSql()) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if ROSTER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresBootstrapSql()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

ledger::PriorityPolicy ToPolicy(roster::runtime::config::PriorityPolicy policy) {
  switch (policy) {
    case roster::runtime::config::PRIORITY_POLICY_REVERSE_STANDINGS:
      return ledger::ReverseStandingsPolicy{};
    case roster::runtime::config::PRIORITY_POLICY_BUDGET_BID:
      return ledger::BudgetBidPolicy{};
    default:
      return ledger::RotatingPolicy{};
  }
}

} // namespace

ledger::LeagueDefaults ToLeagueDefaults(const roster::runtime::config::LeagueDefaults& config) {
  ledger::LeagueDefaults defaults;
  if (config.max_roster_size() > 0) defaults.max_roster_size = config.max_roster_size();
  if (config.cooldown_hours() > 0) defaults.cooldown_hours = config.cooldown_hours();
  defaults.policy = ToPolicy(config.priority_policy());
  if (!config.processing_time_utc().empty()) {
    defaults.processing_minute_utc = util::ParseTimeOfDay(config.processing_time_utc());
  }
  return defaults;
}

std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROSTER_DB_SQLITE
    db::sqlite::SqliteOptions options;
    if (database.sqlite().busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    BootstrapSqliteSchema(sqlite_db);

    const uint64_t stale_ms = static_cast<uint64_t>(database.sqlite().league_lock_stale_sec()) * 1000ULL;
    ROSTER_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return stale_ms > 0 ? std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), stale_ms)
                        : std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROSTER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16U;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    ROSTER_LOG_INFO("Using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROSTER_LOG_WARN("Using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const roster::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto  defaults   = ToLeagueDefaults(config.league_defaults());
  const auto& processing = config.claim_processing();

  // ------------------------------------------------------------------
  // Ledger core
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  ledger::ClaimProcessorOptions processor_options;
  if (processing.batch_size() > 0) processor_options.batch_size = processing.batch_size();
  if (processing.processing_window_sec() > 0) processor_options.processing_window_ms = processing.processing_window_sec() * 1000ULL;

  auto executor  = std::make_shared<ledger::MoveExecutor>(app.repository, defaults);
  auto claims    = std::make_shared<ledger::ClaimBook>(app.repository, executor, defaults);
  auto processor = std::make_shared<ledger::ClaimProcessor>(app.repository, executor, defaults, processor_options);

  // ------------------------------------------------------------------
  // Background claim runs
  // ------------------------------------------------------------------
  scheduler::ClaimSchedulerOptions scheduler_options;
  if (processing.poll_interval_sec() > 0) scheduler_options.poll_interval = std::chrono::seconds(processing.poll_interval_sec());
  scheduler_options.batch_size = processor_options.batch_size;
  app.scheduler                = std::make_shared<scheduler::ClaimScheduler>(processor, scheduler_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository      = app.repository;
  ctx.executor        = executor;
  ctx.claims          = claims;
  ctx.processor       = processor;
  ctx.league_defaults = defaults;

  auto roster_service = std::make_shared<service::RosterService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RosterServer>(roster_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace roster::factory
