#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/catalog/catalog_registrar.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/chunk_receiver.hpp"
#include "internal/core/duplicate_resolver.hpp"
#include "internal/core/multipart_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/metadata/filename_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/raster/gdal_cog_converter.hpp"
#include "internal/reaper/stale_session_reaper.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/storage/storage_factory.hpp"
#if INGEST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if INGEST_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ingest::factory {

namespace {

#if INGEST_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
  sqlite_db->Exec("SELECT id,state,version,last_activity_at_ms FROM upload_session LIMIT 1;");
  sqlite_db->Exec("SELECT session_id,part_number,byte_offset,length FROM upload_part LIMIT 1;");
  sqlite_db->Exec("SELECT id,layer_name,storage_key FROM layer LIMIT 1;");
}
#endif

#if INGEST_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.exec("SELECT id,state,version,last_activity_at_ms FROM upload_session LIMIT 1;");
  tx.exec("SELECT session_id,part_number,byte_offset,length FROM upload_part LIMIT 1;");
  tx.exec("SELECT id,layer_name,storage_key FROM layer LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ingest::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if INGEST_DB_SQLITE
    db::sqlite::SqliteOptions options;
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    }
    options.full_sync = database.sqlite().full_sync();
    auto sqlite_db    = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    BootstrapSqliteSchema(sqlite_db);
    INGEST_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if INGEST_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    INGEST_LOG_INFO("Using postgres repository", {observability::IntField("max_connections", max_connections),
                                                  observability::IntField("open_connections", static_cast<int64_t>(pool->LiveConnections()))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  INGEST_LOG_WARN("Using in-memory repository; upload sessions and catalog are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const ingest::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and persistence
  // ------------------------------------------------------------------
  auto store       = storage::StorageFactory::Build(config.storage());
  auto coordinator = std::make_shared<core::MultipartCoordinator>(store, core::CoordinatorPolicies::FromConfig(config.retry()));
  app.repository   = BuildRepository(config.database());

  // ------------------------------------------------------------------
  // Pipeline components
  // ------------------------------------------------------------------
  auto parser    = std::make_shared<metadata::FilenameParser>(metadata::Vocabulary::FromConfig(config.vocabulary()));
  auto resolver  = std::make_shared<core::DuplicateResolver>(app.repository, coordinator, config.upload().overwrite_duplicates());
  auto converter = std::make_shared<raster::GdalCogConverter>();
  auto registrar = std::make_shared<catalog::CatalogRegistrar>(app.repository, config::ToRetryPolicy(config.retry().catalog()));

  core::ReceiverOptions options;
  options.input_prefix      = config.storage().input_prefix();
  options.layer_prefix      = config.storage().layer_prefix();
  options.retain_raw_inputs = config.storage().retain_raw_inputs();

  app.receiver = std::make_shared<core::ChunkReceiver>(app.repository, coordinator, parser, resolver, converter, registrar, options);

  // ------------------------------------------------------------------
  // Stale session reaper
  // ------------------------------------------------------------------
  app.reaper = std::make_shared<reaper::StaleSessionReaper>(app.repository, app.receiver,
                                                            std::chrono::milliseconds(config.upload().session_ttl_ms()),
                                                            std::chrono::milliseconds(config.upload().reaper_interval_ms()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.receiver   = app.receiver;
  ctx.repository = app.repository;

  auto upload_service = std::make_shared<service::UploadService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::UploadServer>(upload_service));

  return app;
}

} // namespace ingest::factory
