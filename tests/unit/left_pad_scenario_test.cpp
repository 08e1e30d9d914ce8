#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/retrieval_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/storage/byte_source.hpp"
#include "internal/storage/memory/memory_blob_store.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace registry::v1;
using registry::storage::BufferSource;
using registry::util::Sha256;

const std::string kB1 = "module.exports = function leftPad(str, len, ch) { /* v1 */ }";
const std::string kB2 = "module.exports = function leftPad(str, len, ch) { /* v2 */ }";

struct Harness {
  std::shared_ptr<registry::util::ManualClock>        clock = std::make_shared<registry::util::ManualClock>();
  std::shared_ptr<registry::storage::MemoryBlobStore> blobs = std::make_shared<registry::storage::MemoryBlobStore>(clock, 16);
  registry::factory::Application                      app;

  Harness() {
    registry::runtime::config::RuntimeConfig config;
    registry::config::ConfigLoader::ApplyDefaults(&config);
    app = registry::factory::Build(config, std::make_shared<registry::db::memory::MemoryRepository>(), blobs, clock);
  }

  PublishResponse Publish(const std::string& version, const std::string& bytes) {
    PublishHeader header;
    header.set_name("left-pad");
    header.set_version(version);
    header.set_declared_hash(Sha256::Of(bytes));
    header.set_declared_size(bytes.size());
    header.set_uploader("azer");
    BufferSource source(bytes, 16);
    return app.registry_service->Publish(header, source);
  }

  std::pair<ArtifactDescriptor, std::string> Fetch(const std::string& range) {
    FetchRequest req;
    req.set_name("left-pad");
    req.set_version_or_range(range);
    auto stream     = app.registry_service->Fetch(req);
    auto descriptor = registry::service::RegistryService::Describe(stream->Entry());

    std::string                    bytes;
    std::shared_ptr<arrow::Buffer> chunk;
    while (stream->Next(&chunk)) bytes.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
    return {descriptor, bytes};
  }
};

void TestLeftPadScenario() {
  Harness h;

  auto first = h.Publish("1.0.0", kB1);
  assert(first.created);
  assert(!first.entry_id().empty());

  auto [descriptor, bytes] = h.Fetch("1.0.0");
  assert(bytes == kB1);
  assert(descriptor.content_hash() == Sha256::Of(kB1));
  assert(descriptor.size_bytes() == kB1.size());
  assert(descriptor.state() == ENTRY_STATE_PUBLISHED);
  assert(descriptor.uploader() == "azer");

  bool conflict = false;
  try {
    h.Publish("1.0.0", kB2);
  } catch (const registry::util::Conflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(h.Fetch("1.0.0").second == kB1);

  DeleteRequest del;
  del.set_name("left-pad");
  del.set_version("1.0.0");
  del.set_reason("unpublished by author");
  h.app.registry_service->Delete(del);

  bool gone = false;
  try {
    h.Fetch("1.0.0");
  } catch (const registry::util::NotFound&) {
    gone = true;
  }
  assert(gone);

  auto second = h.Publish("1.0.0", kB2);
  assert(second.created);
  assert(second.entry_id() != first.entry_id());

  auto [descriptor2, bytes2] = h.Fetch("^1.0.0");
  assert(bytes2 == kB2);
  assert(descriptor2.content_hash() == Sha256::Of(kB2));
  assert(descriptor2.download_count() == 0);
  assert(h.Fetch("1.0.0").first.download_count() == 1);
}

void TestListingsAndAdministration() {
  Harness h;
  h.Publish("1.0.0", kB1);
  h.Publish("1.1.0", kB2);

  ListVersionsRequest list;
  list.set_name("left-pad");
  auto versions = h.app.registry_service->ListVersions(list);
  assert(versions.versions_size() == 2);
  assert(versions.versions(0) == "1.1.0");
  assert(versions.versions(1) == "1.0.0");

  auto packages = h.app.registry_service->ListPackages();
  assert(packages.names_size() == 1);
  assert(packages.names(0) == "left-pad");

  DeletePackageRequest drop;
  drop.set_name("left-pad");
  assert(h.app.registry_service->DeletePackage(drop).deleted_versions() == 2);
  assert(h.app.registry_service->ListPackages().names_size() == 0);

  // Tombstones keep their blobs alive.
  h.clock->Advance(std::chrono::hours(2));
  auto report = h.app.admin_service->RunGarbageCollection();
  assert(report.scanned() == 2);
  assert(report.deleted() == 0);

  PurgeRequest purge;
  purge.set_name("left-pad");
  purge.set_version("1.0.0");
  assert(h.app.admin_service->Purge(purge).purged() == 1);

  report = h.app.admin_service->RunGarbageCollection();
  assert(report.deleted() == 1);
  assert(!h.blobs->Exists(Sha256::Of(kB1)));
  assert(h.blobs->Exists(Sha256::Of(kB2)));

  assert(h.app.admin_service->ReconcilePending().aborted() == 0);
}

void TestAbandonedPublishIsReconciled() {
  Harness h;
  h.app.catalog->BeginPublish("left-pad", "2.0.0", 3, Sha256::Of("abc"));

  assert(h.app.admin_service->ReconcilePending().aborted() == 0);
  h.clock->Advance(std::chrono::minutes(11));
  assert(h.app.admin_service->ReconcilePending().aborted() == 1);

  assert(h.Publish("2.0.0", kB2).created);
}

} // namespace

int main() {
  TestLeftPadScenario();
  TestListingsAndAdministration();
  TestAbandonedPublishIsReconciled();

  std::cout << "potato_registry_unit_left_pad_scenario: pass\n";
  return 0;
}
