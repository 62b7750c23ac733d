#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/auth/key_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/grpc/command_server.hpp"
#include "internal/grpc/download_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/key_server.hpp"
#include "internal/ingest/message_ingestor.hpp"
#include "internal/links/download_link_issuer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/service/command_service.hpp"
#include "internal/service/download_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/key_service.hpp"
#if FLEET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLEET_DB_POSTGRES
#include <pqxx/pqxx>
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace fleet::factory {

using namespace fleet;

namespace {

#if FLEET_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS credentials (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', prefix TEXT NOT NULL UNIQUE, key_hash TEXT NOT NULL, default_principal TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, last_used_at_ms INTEGER NOT NULL DEFAULT 0, revoked_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS messages (id INTEGER PRIMARY KEY AUTOINCREMENT, doc_key TEXT UNIQUE, payload BLOB NOT NULL, received_at_ms INTEGER NOT NULL, credential_id INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS messages_received_at ON messages(received_at_ms);",
      "CREATE TABLE IF NOT EXISTS jobs (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, action_type TEXT NOT NULL, status INTEGER NOT NULL, recurrence INTEGER NOT NULL, run_at_ms INTEGER NOT NULL, target_hosts TEXT NOT NULL, payload TEXT NOT NULL DEFAULT '', creator TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, last_run_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS jobs_due ON jobs(status, run_at_ms);",
      "CREATE TABLE IF NOT EXISTS commands (id INTEGER PRIMARY KEY AUTOINCREMENT, target_host TEXT NOT NULL, action_type TEXT NOT NULL, payload TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, source_job_id INTEGER, detail TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, sent_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS commands_host ON commands(target_host);",
      "CREATE INDEX IF NOT EXISTS commands_job ON commands(source_job_id);",
      "CREATE TABLE IF NOT EXISTS download_links (id INTEGER PRIMARY KEY AUTOINCREMENT, token TEXT NOT NULL UNIQUE, creator TEXT NOT NULL, visibility INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER, revoked_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,description,prefix,key_hash,default_principal,created_at_ms,last_used_at_ms,revoked_at_ms FROM credentials LIMIT 1;");
  sqlite_db->Exec("SELECT id,doc_key,payload,received_at_ms,credential_id FROM messages LIMIT 1;");
  sqlite_db->Exec("SELECT id,name,action_type,status,recurrence,run_at_ms,target_hosts,payload,creator,created_at_ms,updated_at_ms,last_run_at_ms FROM jobs LIMIT 1;");
  sqlite_db->Exec("SELECT id,target_host,action_type,payload,status,source_job_id,detail,created_at_ms,sent_at_ms,completed_at_ms,updated_at_ms FROM commands LIMIT 1;");
  sqlite_db->Exec("SELECT id,token,creator,visibility,created_at_ms,expires_at_ms,revoked_at_ms FROM download_links LIMIT 1;");
}
#endif

#if FLEET_DB_POSTGRES
// Runs on a dedicated connection: pool connections prepare statements
// against these tables as soon as they are opened.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS credentials (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', prefix TEXT NOT NULL UNIQUE, key_hash TEXT NOT NULL, default_principal TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, last_used_at_ms BIGINT NOT NULL DEFAULT 0, revoked_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE TABLE IF NOT EXISTS messages (id BIGSERIAL PRIMARY KEY, doc_key TEXT UNIQUE, payload BYTEA NOT NULL, received_at_ms BIGINT NOT NULL, credential_id BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS messages_received_at ON messages(received_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS jobs (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, action_type TEXT NOT NULL, status SMALLINT NOT NULL, recurrence SMALLINT NOT NULL, run_at_ms BIGINT NOT NULL, target_hosts TEXT NOT NULL, payload TEXT NOT NULL DEFAULT '', creator TEXT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, last_run_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS jobs_due ON jobs(status, run_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS commands (id BIGSERIAL PRIMARY KEY, target_host TEXT NOT NULL, action_type TEXT NOT NULL, payload TEXT NOT NULL DEFAULT '', status SMALLINT NOT NULL, source_job_id BIGINT, detail TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, sent_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS commands_host ON commands(target_host);");
  tx.exec("CREATE INDEX IF NOT EXISTS commands_job ON commands(source_job_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS download_links (id BIGSERIAL PRIMARY KEY, token TEXT NOT NULL UNIQUE, creator TEXT NOT NULL, visibility SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT, revoked_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;");
  tx.commit();
}
#endif

std::shared_ptr<background::BackgroundPool> BuildPool(const fleet::runtime::config::RuntimeConfig& config) {
  return background::InitializeBackgroundPool(config.background_pool().threads());
}

ingest::IngestOptions IngestOptionsFrom(const fleet::runtime::config::RuntimeConfig& config) {
  ingest::IngestOptions options;
  options.retention_days     = config.ingest().retention_days();
  options.purge_interval_sec = config.ingest().purge_interval_sec();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLEET_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    FLEET_LOG_INFO("Using sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLEET_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    FLEET_LOG_INFO("Using postgres store", {observability::UintField("pool_size", database.postgres().pool_size())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLEET_LOG_WARN("No database configured, using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config) {
  Application app;
  app.config     = std::make_shared<const fleet::runtime::config::RuntimeConfig>(config);
  app.repository = BuildRepository(config);
  app.pool       = BuildPool(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto keys          = std::make_shared<auth::KeyRegistry>(app.repository);
  auto dispatcher    = std::make_shared<dispatch::CommandDispatcher>(app.repository);
  auto job_scheduler = std::make_shared<scheduler::JobScheduler>(app.repository, dispatcher, app.pool, app.config);
  auto link_issuer   = std::make_shared<links::DownloadLinkIssuer>(app.repository);

  app.context.keys       = keys;
  app.context.dispatcher = dispatcher;
  app.context.scheduler  = job_scheduler;
  app.context.links      = link_issuer;

  const bool embedded = config.ingest().mode() == fleet::runtime::config::INGEST_MODE_EMBEDDED;
  if (embedded) {
    app.context.ingestor =
        std::make_shared<ingest::MessageIngestor>(app.repository, keys, app.pool, IngestOptionsFrom(config), app.config);
  }

  app.scheduler_loop = std::make_shared<scheduler::SchedulerLoop>(
      job_scheduler, dispatcher, std::chrono::seconds(config.scheduler().sweep_interval_sec()),
      std::chrono::seconds(config.scheduler().command_ttl_sec()));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::KeyServer>(std::make_shared<service::KeyService>(app.context)));
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(std::make_shared<service::JobService>(app.context)));
  app.grpc_services.push_back(std::make_unique<grpc::CommandServer>(std::make_shared<service::CommandService>(app.context)));
  app.grpc_services.push_back(std::make_unique<grpc::DownloadServer>(
      std::make_shared<service::DownloadService>(app.context, config.download_links().default_ttl_sec())));
  app.grpc_services.push_back(std::make_unique<grpc::AgentServer>(std::make_shared<service::AgentService>(app.context)));
  if (embedded) {
    app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(std::make_shared<service::IngestService>(app.context)));
  }

  return app;
}

Application BuildIngest(const fleet::runtime::config::RuntimeConfig& config) {
  Application app;
  app.config     = std::make_shared<const fleet::runtime::config::RuntimeConfig>(config);
  app.repository = BuildRepository(config);
  app.pool       = BuildPool(config);

  auto keys            = std::make_shared<auth::KeyRegistry>(app.repository);
  app.context.keys     = keys;
  app.context.ingestor = std::make_shared<ingest::MessageIngestor>(app.repository, keys, app.pool, IngestOptionsFrom(config), app.config);

  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(std::make_shared<service::IngestService>(app.context)));
  return app;
}

} // namespace fleet::factory
