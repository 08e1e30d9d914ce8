#pragma once

#include <memory>

#include "internal/core/retrieval_resolver.hpp"
#include "internal/storage/byte_source.hpp"
#include "registry/v1/registry_service.pb.h"
#include "service_context.hpp"

namespace registry::service {

/*
  Client-facing registry operations, expressed in API messages.
  Transport adapters stay thin and only move bytes.
*/
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  registry::v1::PublishResponse Publish(const registry::v1::PublishHeader& header, storage::ByteSource& source);

  // The descriptor is available immediately; chunks are pulled by the caller.
  std::unique_ptr<core::ArtifactStream> Fetch(const registry::v1::FetchRequest& req);

  void Delete(const registry::v1::DeleteRequest& req);

  registry::v1::DeletePackageResponse DeletePackage(const registry::v1::DeletePackageRequest& req);

  registry::v1::ListVersionsResponse ListVersions(const registry::v1::ListVersionsRequest& req);

  registry::v1::ListPackagesResponse ListPackages();

  static registry::v1::ArtifactDescriptor Describe(const catalog::CatalogEntryRecord& entry);

private:
  ServiceContext ctx_;
};

} // namespace registry::service
