#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/storage/byte_source.hpp"
#include "internal/storage/memory/memory_blob_store.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace {

using registry::grpc::ToStatus;

registry::factory::Application BuildApplication() {
  registry::runtime::config::RuntimeConfig config;
  registry::config::ConfigLoader::ApplyDefaults(&config);
  auto clock = std::make_shared<registry::util::ManualClock>();
  return registry::factory::Build(config, std::make_shared<registry::db::memory::MemoryRepository>(),
                                  std::make_shared<registry::storage::MemoryBlobStore>(clock), clock);
}

void Publish(registry::factory::Application& app, const std::string& name, const std::string& version, const std::string& bytes) {
  registry::v1::PublishHeader header;
  header.set_name(name);
  header.set_version(version);
  header.set_declared_hash(registry::util::Sha256::Of(bytes));
  header.set_declared_size(bytes.size());
  registry::storage::BufferSource source(bytes);
  app.registry_service->Publish(header, source);
}

void TestExceptionMapping() {
  assert(ToStatus(registry::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(registry::util::Conflict("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(registry::util::IntegrityError("x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(registry::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(registry::util::TransientStorageError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(registry::util::Cancelled("x")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(registry::util::NotFound("left-pad@9.9.9 not found"));
  assert(status.error_message() == "left-pad@9.9.9 not found");
}

void TestListVersionsOfUnknownPackageIsNotFound() {
  auto                           app = BuildApplication();
  registry::grpc::RegistryServer server(app.registry_service);

  registry::v1::ListVersionsRequest  req;
  registry::v1::ListVersionsResponse resp;
  req.set_name("does-not-exist");
  ::grpc::ServerContext ctx;

  assert(server.ListVersions(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMalformedNameIsInvalidArgument() {
  auto                           app = BuildApplication();
  registry::grpc::RegistryServer server(app.registry_service);

  registry::v1::ListVersionsRequest  req;
  registry::v1::ListVersionsResponse resp;
  req.set_name("");
  ::grpc::ServerContext ctx;

  assert(server.ListVersions(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestDeleteAndListThroughAdapter() {
  auto app = BuildApplication();
  Publish(app, "left-pad", "1.0.0", "a");
  Publish(app, "left-pad", "1.1.0", "b");
  registry::grpc::RegistryServer server(app.registry_service);

  {
    registry::v1::ListVersionsRequest  req;
    registry::v1::ListVersionsResponse resp;
    req.set_name("left-pad");
    ::grpc::ServerContext ctx;
    assert(server.ListVersions(&ctx, &req, &resp).ok());
    assert(resp.versions_size() == 2);
  }
  {
    registry::v1::DeleteRequest req;
    req.set_name("left-pad");
    req.set_version("1.1.0");
    google::protobuf::Empty empty;
    ::grpc::ServerContext   ctx;
    assert(server.Delete(&ctx, &req, &empty).ok());

    ::grpc::ServerContext again;
    assert(server.Delete(&again, &req, &empty).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    google::protobuf::Empty            req;
    registry::v1::ListPackagesResponse resp;
    ::grpc::ServerContext              ctx;
    assert(server.ListPackages(&ctx, &req, &resp).ok());
    assert(resp.names_size() == 1);
  }
  {
    registry::v1::DeletePackageRequest  req;
    registry::v1::DeletePackageResponse resp;
    req.set_name("left-pad");
    ::grpc::ServerContext ctx;
    assert(server.DeletePackage(&ctx, &req, &resp).ok());
    assert(resp.deleted_versions() == 1);

    ::grpc::ServerContext again;
    assert(server.DeletePackage(&again, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
}

void TestAdminAdapter() {
  auto app = BuildApplication();
  Publish(app, "pkg", "1.0", "bytes");
  registry::grpc::AdminServer server(app.admin_service);

  {
    registry::v1::PurgeRequest  req;
    registry::v1::PurgeResponse resp;
    req.set_name("pkg");
    req.set_version("1.0");
    ::grpc::ServerContext ctx;
    assert(server.Purge(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    google::protobuf::Empty         req;
    registry::v1::ReconcileResponse resp;
    ::grpc::ServerContext           ctx;
    assert(server.ReconcilePending(&ctx, &req, &resp).ok());
    assert(resp.aborted() == 0);
  }
  {
    google::protobuf::Empty req;
    registry::v1::GcReport  resp;
    ::grpc::ServerContext   ctx;
    assert(server.RunGarbageCollection(&ctx, &req, &resp).ok());
    assert(resp.scanned() == 1);
    assert(resp.deleted() == 0);
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestListVersionsOfUnknownPackageIsNotFound();
  TestMalformedNameIsInvalidArgument();
  TestDeleteAndListThroughAdapter();
  TestAdminAdapter();

  std::cout << "potato_registry_unit_grpc_status: pass\n";
  return 0;
}
