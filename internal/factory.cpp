#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROSTER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace roster::factory {

using roster::runtime::config::REASSIGN_POLICY_REPLACE;

namespace {

std::chrono::milliseconds OrDefault(uint32_t value_ms, std::chrono::milliseconds fallback) {
  return value_ms == 0 ? fallback : std::chrono::milliseconds(value_ms);
}

#if ROSTER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if ROSTER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

core::EngineOptions ToEngineOptions(const roster::runtime::config::EngineConfig& config) {
  core::EngineOptions options;
  options.policy              = config.reassign_policy() == REASSIGN_POLICY_REPLACE ? core::ReassignPolicy::kReplace : core::ReassignPolicy::kAccumulate;
  options.lock_timeout        = OrDefault(config.lock_timeout_ms(), options.lock_timeout);
  options.max_commit_attempts = config.max_commit_attempts() == 0 ? options.max_commit_attempts : config.max_commit_attempts();
  return options;
}

directory::DirectoryOptions ToDirectoryOptions(const roster::runtime::config::ScheduleConfig& config) {
  directory::DirectoryOptions options;
  if (!config.event_weekday().empty()) {
    auto weekday = util::ParseWeekday(config.event_weekday());
    if (!weekday) {
      throw util::InvalidArgument("schedule.event_weekday is not a weekday: '" + config.event_weekday() + "'");
    }
    options.event_weekday = *weekday;
  }
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROSTER_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::InvalidArgument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), OrDefault(sqlite.busy_timeout_ms(), std::chrono::milliseconds(5000)));
    BootstrapSqliteSchema(sqlite_db);
    ROSTER_LOG_INFO("using sqlite store", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROSTER_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 16 : pg.max_connections(),
                                                              OrDefault(pg.acquire_timeout_ms(), std::chrono::milliseconds(5000)));
    BootstrapPostgresSchema(pool);
    ROSTER_LOG_INFO("using postgres store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), std::chrono::milliseconds(pg.statement_timeout_ms()));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROSTER_LOG_WARN("no database configured, using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const roster::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store and reference data
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  catalog::SeedCatalog(*app.repository, config.catalog());
  directory::SeedLocations(*app.repository, config.locations());

  app.catalog = catalog::RoleCatalog::Load(*app.repository);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.engine    = std::make_shared<core::AssignmentEngine>(app.repository, app.catalog, ToEngineOptions(config.engine()));
  app.projector = std::make_shared<projection::RosterProjector>(app.repository, app.catalog);
  app.directory = std::make_shared<directory::Directory>(app.repository, ToDirectoryOptions(config.schedule()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine    = app.engine;
  ctx.projector = app.projector;
  ctx.directory = app.directory;
  ctx.catalog   = app.catalog;

  app.service = std::make_shared<service::RosterService>(ctx);

  return app;
}

} // namespace roster::factory
