#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/catalog/entry_cache.hpp"
#include "internal/core/inflight_hashes.hpp"
#include "internal/core/retrieval_resolver.hpp"
#include "internal/core/upload_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/gc/garbage_collector.hpp"
#include "internal/gc/pending_reconciler.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#if REGISTRY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if REGISTRY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace registry::factory {

namespace {

#if REGISTRY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,version,content_hash,size_bytes,state FROM catalog_entry LIMIT 1;");
  sqlite_db->Exec("SELECT version FROM catalog_schema_migrations LIMIT 1;");
}
#endif

#if REGISTRY_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto        conn = pool->Acquire();
  pqxx::work  tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,name,version,content_hash,size_bytes,state FROM catalog_entry LIMIT 1;");
  tx.exec("SELECT version FROM catalog_schema_migrations LIMIT 1;");
  tx.commit();
}
#endif

util::RetryPolicy RetryPolicyFrom(const registry::runtime::config::PublishConfig& publish) {
  util::RetryPolicy policy;
  if (publish.max_attempts() > 0) {
    policy.max_attempts = publish.max_attempts();
  }
  const auto initial = util::FromProto(publish.initial_backoff());
  if (initial.count() > 0) {
    policy.initial_backoff = initial;
  }
  const auto max = util::FromProto(publish.max_backoff());
  if (max.count() > 0) {
    policy.max_backoff = max;
  }
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const registry::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if REGISTRY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    REGISTRY_LOG_INFO("catalog database ready", {observability::StringField("backend", "sqlite"),
                                                 observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if REGISTRY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    REGISTRY_LOG_INFO("catalog database ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  REGISTRY_LOG_WARN("catalog database is in memory; entries are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const registry::runtime::config::RuntimeConfig& config) {
  auto clock = std::make_shared<util::WallClock>();
  auto blobs = storage::StorageFactory::Build(config.storage(), clock);
  return Build(config, BuildRepository(config.database()), std::move(blobs), clock);
}

Application Build(const registry::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                  storage::BlobStorePtr blobs, std::shared_ptr<util::Clock> clock) {
  Application app;
  app.repository = std::move(repository);
  app.blobs      = std::move(blobs);

  // ------------------------------------------------------------------
  // Catalog
  // ------------------------------------------------------------------
  catalog::CatalogOptions catalog_options;
  catalog_options.block_reuse_of_deleted = config.catalog().block_reuse_of_deleted();

  auto cache  = std::make_shared<catalog::EntryCache>();
  app.catalog = std::make_shared<catalog::MetadataCatalog>(app.repository, clock, cache, catalog_options);

  // ------------------------------------------------------------------
  // Publish / fetch
  // ------------------------------------------------------------------
  auto inflight    = std::make_shared<core::InflightHashes>();
  auto coordinator = std::make_shared<core::UploadCoordinator>(app.catalog, app.blobs, inflight, RetryPolicyFrom(config.publish()));
  auto resolver    = std::make_shared<core::RetrievalResolver>(app.catalog, app.blobs);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  const auto pending_timeout = util::FromProto(config.publish().pending_timeout());

  gc::GcOptions gc_options;
  gc_options.blob_grace_period = util::FromProto(config.gc().blob_grace_period());
  // A staging file belongs to an upload that may legitimately run until its
  // pending row times out.
  gc_options.staging_grace_period = std::max(gc_options.blob_grace_period, pending_timeout);

  gc::MaintenanceOptions maintenance_options;
  maintenance_options.interval          = util::FromProto(config.gc().interval());
  maintenance_options.deleted_retention = util::FromProto(config.gc().deleted_retention());

  auto collector  = std::make_shared<gc::GarbageCollector>(app.catalog, app.blobs, inflight, clock, gc_options);
  auto reconciler = std::make_shared<gc::PendingReconciler>(app.catalog, clock, pending_timeout);
  app.maintenance = std::make_shared<gc::MaintenanceWorker>(reconciler, app.catalog, collector, clock, maintenance_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.catalog     = app.catalog;
  ctx.coordinator = coordinator;
  ctx.resolver    = resolver;
  ctx.maintenance = app.maintenance;

  app.registry_service = std::make_shared<service::RegistryService>(ctx);
  app.admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(app.registry_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.admin_service));

  return app;
}

} // namespace registry::factory
