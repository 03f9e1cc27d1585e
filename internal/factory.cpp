#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/detectors/how_detector.hpp"
#include "internal/detectors/what_detector.hpp"
#include "internal/detectors/when_detector.hpp"
#include "internal/detectors/who_detector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scoring/component_scorer.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if CONVINTEL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CONVINTEL_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace convintel::factory {

using namespace convintel;

namespace {

#if CONVINTEL_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if CONVINTEL_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec(sql);
    tx.commit();
  }

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const convintel::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CONVINTEL_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    auto                    sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    CONVINTEL_LOG_INFO("SQLite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CONVINTEL_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 8u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    PostgresMigrationExecutor executor(pool);
    db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    CONVINTEL_LOG_INFO("PostgreSQL repository ready", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CONVINTEL_LOG_WARN("Using in-memory repository; patterns are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::vector<std::shared_ptr<const detectors::Detector>> BuildDetectors(const config::DetectorSettings& settings) {
  return {
      std::make_shared<detectors::WhoDetector>(settings),
      std::make_shared<detectors::WhatDetector>(settings),
      std::make_shared<detectors::WhenDetector>(),
      std::make_shared<detectors::HowDetector>(),
  };
}

Application Build(const convintel::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config));
}

/*
    Build full application dependency graph
*/
Application Build(const convintel::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  Application app;
  app.settings   = config::Resolve(config);
  app.repository = std::move(repository);

  // ------------------------------------------------------------------
  // Pattern storage
  // ------------------------------------------------------------------
  app.store        = std::make_shared<store::PatternStore>(app.repository, app.settings.store);
  app.weight_cache = std::make_shared<store::WeightCache>(app.repository, app.settings.health.weight_sum_tolerance);

  // ------------------------------------------------------------------
  // Learning
  // ------------------------------------------------------------------
  app.pool = std::make_shared<orchestration::WorkerPool>(app.settings.learning.worker_threads);
  app.pool->Start();

  app.orchestrator = std::make_shared<orchestration::LearningOrchestrator>(
      app.repository, app.store, BuildDetectors(app.settings.detectors), app.settings.learning, app.pool);

  app.backfill = std::make_shared<orchestration::BackfillFlow>(app.repository, app.orchestrator,
                                                               scoring::ComponentScorer(app.settings.detectors.target_industries));

  app.health = std::make_shared<health::HealthMonitor>(app.store, app.settings.health);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = app.repository;
  ctx.store        = app.store;
  ctx.weight_cache = app.weight_cache;
  ctx.health       = app.health;
  ctx.orchestrator = app.orchestrator;
  ctx.backfill     = app.backfill;

  app.admin_service = std::make_shared<service::AdminService>(ctx);

  return app;
}

void RegisterJobs(orchestration::JobRunner& runner, const Application& app) {
  auto orchestrator = app.orchestrator;
  auto health       = app.health;

  runner.RegisterRecurring(kLearningJob, app.settings.scheduler.learning_interval, [orchestrator] {
    const auto summary = orchestrator->RunAll(util::Now());
    if (summary.failures() > 0) {
      CONVINTEL_LOG_WARN("Learning run finished with failures", {observability::IntField("failures", summary.failures())});
    }
  });

  runner.RegisterRecurring(kHealthJob, app.settings.scheduler.health_interval, [health] { health->Check(util::Now()); });
}

} // namespace convintel::factory
