#include "factory.hpp"

#include <stdexcept>

#include "internal/artifact/artifact_resolver.hpp"
#include "internal/collab/log_notifier.hpp"
#include "internal/core/rollback_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/health/checks.hpp"
#include "internal/health/health_gate.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/uuid.hpp"
#if ROLLOUT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROLLOUT_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace rollout::factory {

using namespace rollout;
using observability::IntField;
using observability::StringField;

namespace {

#if ROLLOUT_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,service_name,idempotency_key,state,terminal,version,body FROM rollouts LIMIT 1;");
  sqlite_db->Exec("SELECT rollout_id,seq,from_state,to_state,reason,diagnostic,at_ms FROM rollout_history LIMIT 1;");
  sqlite_db->Exec("SELECT service_name,lease_id,holder_id,expires_at_ms,fencing_token FROM service_leases LIMIT 1;");
}
#endif

#if ROLLOUT_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,service_name,idempotency_key,state,terminal,version,body FROM rollouts LIMIT 1;");
  tx.exec("SELECT rollout_id,seq,from_state,to_state,reason,diagnostic,at_ms FROM rollout_history LIMIT 1;");
  tx.exec("SELECT service_name,lease_id,holder_id,expires_at_ms,fencing_token FROM service_leases LIMIT 1;");
  tx.commit();
}
#endif

util::RetryPolicy RetryFromConfig(const rollout::runtime::config::RetryConfig& retry) {
  util::RetryPolicy policy;
  policy.max_attempts    = retry.max_attempts();
  policy.initial_backoff = util::FromProto(retry.initial_backoff());
  policy.max_backoff     = util::FromProto(retry.max_backoff());
  policy.multiplier      = retry.multiplier();
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const rollout::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROLLOUT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROLLOUT_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Engine Build(const rollout::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
             const collab::sim::SimEnvironment* sim) {
  Engine engine;

  const auto& controller_config = config.controller();
  const auto  retry             = RetryFromConfig(controller_config.retry());

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  engine.repository = repository ? std::move(repository) : BuildRepository(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  if (sim != nullptr) {
    engine.sim = *sim;
  } else if (config.collaborators().has_simulation()) {
    engine.sim = collab::sim::BuildSimEnvironment(config.collaborators().simulation());
  } else {
    throw std::runtime_error("collaborators: no backend configured");
  }
  if (!engine.sim.events) {
    engine.sim.events = std::make_shared<collab::sim::RecordingNotifier>(std::make_shared<collab::LogNotifier>());
  }
  engine.notifier = std::make_shared<collab::AsyncNotifier>(engine.sim.events);

  // ------------------------------------------------------------------
  // Work queues
  // ------------------------------------------------------------------
  engine.gate_queue       = std::make_shared<runtime::TaskQueue>();
  engine.gate_pool        = std::make_shared<runtime::WorkerPool>(engine.gate_queue, config.health_gate().worker_threads(), "health-gate");
  engine.background_queue = std::make_shared<runtime::TaskQueue>();
  engine.background_pool  = std::make_shared<runtime::WorkerPool>(engine.background_queue, 2, "teardown");

  // ------------------------------------------------------------------
  // Fleet + traffic
  // ------------------------------------------------------------------
  engine.splitter = std::make_shared<traffic::TrafficSplitter>(engine.repository);
  engine.splitter->Hydrate();

  engine.fleet = std::make_shared<fleet::FleetStateTracker>(engine.repository, engine.sim.scheduler, engine.splitter);
  engine.fleet->Hydrate();

  engine.teardown = std::make_shared<fleet::TeardownScheduler>(engine.background_queue, engine.sim.scheduler, engine.fleet, engine.splitter,
                                                               util::FromProto(controller_config.teardown_grace()), retry);

  // ------------------------------------------------------------------
  // Health gate
  // ------------------------------------------------------------------
  health::CheckDependencies check_deps;
  check_deps.prober    = engine.sim.prober;
  check_deps.scheduler = engine.sim.scheduler;
  check_deps.metrics   = engine.sim.metrics;

  auto gate = std::make_shared<health::HealthGate>(engine.gate_queue, util::FromProto(config.health_gate().grace()));

  // ------------------------------------------------------------------
  // Controller
  // ------------------------------------------------------------------
  auto options = core::ControllerOptions::FromConfig(config);
  if (options.controller_id.empty()) {
    options.controller_id = util::NewId("ctl-");
  }

  engine.leases = std::make_shared<lease::LeaseManager>(engine.repository, options.controller_id, util::FromProto(config.leases().ttl()));

  core::RollbackOptions rollback_options;
  rollback_options.restore_timeout = options.provision_timeout;
  rollback_options.poll_interval   = options.provision_poll_interval;
  rollback_options.retry           = retry;

  core::ControllerDependencies deps;
  deps.repository = engine.repository;
  deps.leases     = engine.leases;
  deps.resolver   = std::make_shared<artifact::ArtifactResolver>(engine.sim.registry, retry);
  deps.fleet      = engine.fleet;
  deps.splitter   = engine.splitter;
  deps.gate       = gate;
  deps.checks     = health::BuildCheckSuite(config.health_gate().checks(), check_deps);
  deps.rollback   = std::make_shared<core::RollbackManager>(engine.repository, engine.fleet, engine.sim.scheduler, gate,
                                                          health::BuildCheckSuite(config.health_gate().rollback_checks(), check_deps),
                                                          engine.teardown, rollback_options);
  deps.teardown   = engine.teardown;
  deps.scheduler  = engine.sim.scheduler;
  deps.metrics    = engine.sim.metrics;
  deps.notifier   = engine.notifier;
  deps.queue      = std::make_shared<runtime::TaskQueue>();

  engine.controller = std::make_shared<core::RolloutController>(std::move(deps), options);
  engine.watchdog   = std::make_shared<core::ControllerWatchdog>(engine.controller, util::FromProto(controller_config.watchdog_interval()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.controller = engine.controller;
  ctx.fleet      = engine.fleet;
  ctx.splitter   = engine.splitter;
  ctx.repository = engine.repository;

  engine.rollout_service = std::make_shared<service::RolloutService>(ctx);
  engine.admin_service   = std::make_shared<service::AdminService>(ctx);

  ROLLOUT_LOG_INFO("engine built", {StringField("controller_id", options.controller_id),
                                    IntField("gate_checks", static_cast<int64_t>(config.health_gate().checks_size()))});
  return engine;
}

void Engine::Start() {
  gate_pool->Start();
  background_pool->Start();
  controller->Start();
  watchdog->Start();
}

void Engine::Stop() {
  if (watchdog) watchdog->Stop();
  if (controller) controller->Stop();
  if (background_pool) background_pool->Stop();
  if (gate_pool) gate_pool->Stop();
  if (notifier) notifier->Stop();
}

} // namespace rollout::factory
