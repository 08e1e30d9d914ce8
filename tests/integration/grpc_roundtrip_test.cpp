#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/util/digest.hpp"
#include "registry/v1/registry_service.grpc.pb.h"

namespace {

using namespace registry::v1;
using registry::util::Sha256;

struct Running {
  std::shared_ptr<registry::storage::DiskBlobStore> blobs;
  registry::factory::Application                    app;
  std::unique_ptr<registry::runtime::Server>        server;
  std::unique_ptr<RegistryService::Stub>            registry;
  std::unique_ptr<RegistryAdminService::Stub>       admin;

  Running() {
    const auto root = std::filesystem::temp_directory_path() / "potato_registry_grpc_roundtrip";
    std::filesystem::remove_all(root);
    blobs = std::make_shared<registry::storage::DiskBlobStore>(root, false, 8);

    registry::runtime::config::RuntimeConfig config;
    registry::config::ConfigLoader::ApplyDefaults(&config);
    app = registry::factory::Build(config, std::make_shared<registry::db::memory::MemoryRepository>(), blobs,
                                   std::make_shared<registry::util::WallClock>());

    registry::runtime::ServerOptions options;
    options.bind_address = "127.0.0.1:0";
    server               = std::make_unique<registry::runtime::Server>(options, std::move(app.grpc_services));
    server->Start();
    assert(server->SelectedPort() > 0);

    auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->SelectedPort()), ::grpc::InsecureChannelCredentials());
    registry     = RegistryService::NewStub(channel);
    admin        = RegistryAdminService::NewStub(channel);
  }

  ~Running() {
    server->Stop();
  }

  ::grpc::Status Publish(const std::string& name, const std::string& version, const std::string& bytes, const std::string& declared,
                         PublishResponse* resp) {
    ::grpc::ClientContext ctx;
    auto                  writer = registry->Publish(&ctx, resp);

    PublishRequest head;
    head.mutable_header()->set_name(name);
    head.mutable_header()->set_version(version);
    head.mutable_header()->set_declared_hash(Sha256::Of(declared));
    head.mutable_header()->set_declared_size(declared.size());
    writer->Write(head);

    for (std::size_t off = 0; off < bytes.size(); off += 5) {
      PublishRequest chunk;
      chunk.set_chunk(bytes.substr(off, 5));
      if (!writer->Write(chunk)) break;
    }
    writer->WritesDone();
    return writer->Finish();
  }

  ::grpc::Status Fetch(const std::string& name, const std::string& range, ArtifactDescriptor* descriptor, std::string* bytes) {
    ::grpc::ClientContext ctx;
    FetchRequest          req;
    req.set_name(name);
    req.set_version_or_range(range);
    auto reader = registry->Fetch(&ctx, req);

    FetchResponse msg;
    while (reader->Read(&msg)) {
      if (msg.has_descriptor()) *descriptor = msg.descriptor();
      else bytes->append(msg.chunk());
    }
    return reader->Finish();
  }
};

void TestPublishFetchOverTheWire() {
  Running r;

  const std::string bytes = "module.exports = function leftPad() {}";
  PublishResponse   resp;
  assert(r.Publish("left-pad", "1.0.0", bytes, bytes, &resp).ok());
  assert(resp.created());

  PublishResponse again;
  assert(r.Publish("left-pad", "1.0.0", bytes, bytes, &again).ok());
  assert(!again.created());
  assert(again.entry_id() == resp.entry_id());

  ArtifactDescriptor descriptor;
  std::string        fetched;
  assert(r.Fetch("left-pad", "^1", &descriptor, &fetched).ok());
  assert(fetched == bytes);
  assert(descriptor.content_hash() == Sha256::Of(bytes));
  assert(descriptor.version() == "1.0.0");
}

void TestErrorsCrossTheWire() {
  Running r;

  PublishResponse resp;
  assert(r.Publish("pkg", "1.0", "b1", "b1", &resp).ok());
  assert(r.Publish("pkg", "1.0", "b2", "b2", &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(r.Publish("pkg", "2.0", "actual", "claimed", &resp).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(r.Publish("Not A Name!", "1.0", "x", "x", &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  ArtifactDescriptor descriptor;
  std::string        fetched;
  assert(r.Fetch("pkg", "9.9.9", &descriptor, &fetched).error_code() == ::grpc::StatusCode::NOT_FOUND);

  // Corrupt the stored blob: chunks flow, the stream ends in DATA_LOSS.
  {
    std::ofstream out(r.blobs->PathOf(Sha256::Of("b1")), std::ios::binary | std::ios::trunc);
    out << "XX";
  }
  fetched.clear();
  assert(r.Fetch("pkg", "1.0", &descriptor, &fetched).error_code() == ::grpc::StatusCode::DATA_LOSS);

  ::grpc::ClientContext   ctx;
  google::protobuf::Empty empty;
  GcReport                report;
  assert(r.admin->RunGarbageCollection(&ctx, empty, &report).ok());
  assert(report.deleted() == 0);
}

void TestHeaderIsRequired() {
  Running r;

  PublishResponse       resp;
  ::grpc::ClientContext ctx;
  auto                  writer = r.registry->Publish(&ctx, &resp);
  PublishRequest        chunk;
  chunk.set_chunk("orphan chunk");
  writer->Write(chunk);
  writer->WritesDone();
  assert(writer->Finish().error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestPublishFetchOverTheWire();
  TestErrorsCrossTheWire();
  TestHeaderIsRequired();

  std::cout << "potato_registry_integration_grpc_roundtrip: pass\n";
  return 0;
}
