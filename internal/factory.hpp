#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/catalog/metadata_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/gc/maintenance_worker.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/storage/blob_store.hpp"

namespace registry::factory {

/*
  Application

  Owns every long-lived object of the server process. The gRPC services
  are moved into the runtime::Server; everything else lives here until
  shutdown.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<catalog::MetadataCatalog> catalog;
  storage::BlobStorePtr                     blobs;
  std::shared_ptr<gc::MaintenanceWorker>    maintenance;

  std::shared_ptr<service::RegistryService> registry_service;
  std::shared_ptr<service::AdminService>    admin_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows the concrete database and
  storage types. Does not start background work; the caller hydrates the
  cache, reconciles and starts the maintenance worker.
*/
Application Build(const registry::runtime::config::RuntimeConfig& config);

/*
  Same graph over caller supplied backends. Used by tests to drive the
  whole stack with a ManualClock and in-memory stores.
*/
Application Build(const registry::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                  storage::BlobStorePtr blobs, std::shared_ptr<util::Clock> clock);

std::shared_ptr<db::Repository> BuildRepository(const registry::runtime::config::DatabaseConfig& database);

} // namespace registry::factory
