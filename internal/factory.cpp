#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"
#include "internal/core/network_scanner.hpp"
#include "internal/core/port_scan_pass.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/enrich/enricher.hpp"
#include "internal/enrich/port_scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/device_query.hpp"
#include "internal/reconcile/state_reconciler.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/scan/probe_executor.hpp"
#include "internal/service/service_context.hpp"
#if NETSWEEP_DB_SQLITE
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if NETSWEEP_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/schema.hpp"
#endif

namespace netsweep::factory {

using netsweep::observability::StringField;

namespace {

#if NETSWEEP_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::BootstrapStatements(db::sql::Dialect::kSqlite)) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if NETSWEEP_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::BootstrapStatements(db::sql::Dialect::kPostgres)) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const netsweep::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NETSWEEP_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    NETSWEEP_LOG_INFO("database opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if NETSWEEP_DB_POSTGRES
    const auto& pg          = database.postgres();
    const auto  connections = pg.max_connections() > 0 ? pg.max_connections() : 16u;
    auto        pool        = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), connections);
    BootstrapPostgresSchema(pool);
    NETSWEEP_LOG_INFO("database opened", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  NETSWEEP_LOG_INFO("database opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const netsweep::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock,
                     std::shared_ptr<util::CommandRunner> runner) {
  config::ValidateRuntimeConfig(config);
  if (!runner) {
    runner = std::make_shared<util::ProcessCommandRunner>();
  }

  Runtime rt;
  rt.clock      = std::move(clock);
  rt.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Scan pipeline
  // ------------------------------------------------------------------
  auto prober     = std::make_shared<scan::ProbeExecutor>(runner, config::ResolveProbeOptions(config));
  auto enricher   = std::make_shared<enrich::ChainEnricher>(runner, rt.repository, config::ResolveEnrichmentOptions(config));
  auto reconciler = std::make_shared<reconcile::StateReconciler>(rt.repository, rt.clock);
  auto scanner    = std::make_shared<core::NetworkScanner>(prober, enricher, reconciler, rt.repository, config::ResolveBatchOptions(config), rt.clock);
  auto ports      = std::make_shared<enrich::PortScanner>(runner, config::ResolvePortScanOptions(config));
  auto port_scan  = std::make_shared<core::PortScanPass>(ports, reconciler, rt.repository, rt.clock);

  // ------------------------------------------------------------------
  // Read side & maintenance
  // ------------------------------------------------------------------
  auto query   = std::make_shared<query::DeviceQueryEngine>(rt.repository);
  rt.retention = std::make_shared<retention::RetentionManager>(rt.repository, rt.clock, config::ResolveRetentionPolicy(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.scanner    = scanner;
  ctx.port_scan  = port_scan;
  ctx.query      = query;
  ctx.retention  = rt.retention;
  ctx.repository = rt.repository;
  ctx.clock      = rt.clock;

  rt.scan_service        = std::make_shared<service::ScanService>(ctx);
  rt.inventory_service   = std::make_shared<service::InventoryService>(ctx);
  rt.maintenance_service = std::make_shared<service::MaintenanceService>(ctx);
  rt.monitoring_service  = std::make_shared<service::MonitoringService>(ctx);

  rt.scheduler_options = config::ResolveSchedulerOptions(config);
  return rt;
}

} // namespace netsweep::factory
