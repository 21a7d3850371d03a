#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/collector/collector_worker.hpp"
#include "internal/collector/cycle_queue.hpp"
#include "internal/core/annotation_store.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/diagnostics/diagnostic_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scan/proc_net_scanner.hpp"
#include "internal/service/port_service.hpp"
#include "internal/service/service_context.hpp"
#if PORTWATCH_WITH_GRPC
#include "internal/grpc/port_server.hpp"
#endif
#if PORTWATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PORTWATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace portwatch::factory {

namespace {

#if PORTWATCH_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,host_id,protocol,port,current_state FROM port_runtime LIMIT 1;");
  sqlite_db->Exec("SELECT id,port_runtime_id,event_type,timestamp_ms FROM port_event LIMIT 1;");
  sqlite_db->Exec("SELECT id,host_id,protocol,port,risk_level,is_pinned FROM port_note LIMIT 1;");
}
#endif

#if PORTWATCH_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto        conn = pool->Acquire();
  pqxx::work  tx(*conn);

  for (const char* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,host_id,protocol,port,current_state FROM port_runtime LIMIT 1;");
  tx.exec("SELECT id,port_runtime_id,event_type,timestamp_ms FROM port_event LIMIT 1;");
  tx.exec("SELECT id,host_id,protocol,port,risk_level,is_pinned FROM port_note LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const portwatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PORTWATCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    PORTWATCH_LOG_INFO("store opened", {observability::StringField("backend", "sqlite"),
                                        observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PORTWATCH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections();
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                             max_connections == 0 ? 4 : max_connections);
    BootstrapPostgresSchema(pool);
    PORTWATCH_LOG_INFO("store opened", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PORTWATCH_LOG_WARN("no database configured; using the in-memory store, facts are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const portwatch::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& collector_config   = config.collector();
  const auto& diagnostics_config = config.diagnostics();

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------------
  auto scanner = std::make_shared<scan::ProcNetScanner>(collector_config.host_id(), collector_config.proc_root());

  core::ReconcilerOptions reconciler_options;
  reconciler_options.emit_alive_events = collector_config.emit_alive_events();
  app.reconciler = std::make_shared<core::Reconciler>(app.repository, scanner, reconciler_options);

  collector::CollectorOptions collector_options;
  collector_options.interval     = std::chrono::seconds(collector_config.interval_seconds());
  collector_options.run_on_start = collector_config.run_on_start();
  app.collector = std::make_shared<collector::CollectorWorker>(std::make_shared<collector::CycleQueue>(),
                                                               app.reconciler, collector_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  diagnostics::DiagnosticOptions diagnostic_options;
  diagnostic_options.command          = diagnostics_config.command();
  diagnostic_options.timeout          = std::chrono::milliseconds(diagnostics_config.timeout_ms());
  diagnostic_options.max_output_bytes = diagnostics_config.max_output_bytes();

  service::ServiceContext ctx;
  ctx.repository  = app.repository;
  ctx.annotations = std::make_shared<core::AnnotationStore>(app.repository);
  ctx.collector   = app.collector;
  ctx.diagnostics = std::make_shared<diagnostics::DiagnosticRunner>(diagnostic_options);
  ctx.host_id     = collector_config.host_id();

  app.port_service = std::make_shared<service::PortService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
#if PORTWATCH_WITH_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::PortServer>(app.port_service));
#endif

  return app;
}

} // namespace portwatch::factory
