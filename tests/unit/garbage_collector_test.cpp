#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/inflight_hashes.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/gc/garbage_collector.hpp"
#include "internal/storage/memory/memory_blob_store.hpp"
#include "internal/util/digest.hpp"

namespace {

using registry::gc::GarbageCollector;
using registry::gc::GcOptions;
using registry::storage::BufferSource;
using registry::util::Sha256;

struct Fixture {
  std::shared_ptr<registry::util::ManualClock>        clock = std::make_shared<registry::util::ManualClock>();
  std::shared_ptr<registry::catalog::MetadataCatalog> catalog;
  std::shared_ptr<registry::storage::MemoryBlobStore> blobs;
  std::shared_ptr<registry::core::InflightHashes>     inflight = std::make_shared<registry::core::InflightHashes>();
  std::shared_ptr<GarbageCollector>                   collector;

  explicit Fixture(GcOptions options) {
    catalog   = std::make_shared<registry::catalog::MetadataCatalog>(std::make_shared<registry::db::memory::MemoryRepository>(), clock,
                                                                     std::make_shared<registry::catalog::EntryCache>());
    blobs     = std::make_shared<registry::storage::MemoryBlobStore>(clock);
    collector = std::make_shared<GarbageCollector>(catalog, blobs, inflight, clock, options);
  }

  std::string Put(const std::string& bytes) {
    BufferSource source(bytes);
    return blobs->Put(source);
  }

  std::string PublishDirect(const std::string& name, const std::string& version, const std::string& bytes) {
    const auto hash        = Put(bytes);
    auto       reservation = catalog->BeginPublish(name, version, bytes.size(), hash);
    catalog->CommitPublish(reservation.entry_id);
    return hash;
  }
};

GcOptions ZeroGrace() {
  GcOptions options;
  options.blob_grace_period    = registry::util::Duration::zero();
  options.staging_grace_period = registry::util::Duration::zero();
  return options;
}

void TestReferencedBlobsSurviveZeroGrace() {
  Fixture f(ZeroGrace());

  const auto published = f.PublishDirect("pkg", "1.0", "published bytes");

  // Pending row whose blob is already promoted.
  const auto pending = f.Put("pending bytes");
  f.catalog->BeginPublish("pkg", "2.0", 13, pending);

  const auto orphan = f.Put("orphan bytes");

  auto report = f.collector->Run();
  assert(report.scanned() == 3);
  assert(report.deleted() == 1);
  assert(report.bytes_reclaimed() == 12);
  assert(report.skipped_referenced() == 2);

  assert(f.blobs->Exists(published));
  assert(f.blobs->Exists(pending));
  assert(!f.blobs->Exists(orphan));
}

void TestYoungBlobsAreSkipped() {
  GcOptions options;
  options.blob_grace_period = std::chrono::hours(1);
  Fixture f(options);

  const auto orphan = f.Put("recent upload");

  auto report = f.collector->Run();
  assert(report.skipped_young() == 1);
  assert(report.deleted() == 0);
  assert(f.blobs->Exists(orphan));

  f.clock->Advance(std::chrono::minutes(61));
  report = f.collector->Run();
  assert(report.deleted() == 1);
  assert(!f.blobs->Exists(orphan));
}

void TestInflightHashIsNotCollected() {
  Fixture f(ZeroGrace());

  const auto hash  = f.Put("being published");
  auto       guard = f.inflight->Register(hash);

  auto report = f.collector->Run();
  assert(report.deleted() == 0);
  assert(report.skipped_referenced() == 1);
  assert(f.blobs->Exists(hash));
}

void TestDeletedEntryKeepsBlobUntilPurged() {
  Fixture f(ZeroGrace());

  const auto hash = f.PublishDirect("pkg", "1.0", "soon deleted");
  f.catalog->SoftDelete("pkg", "1.0");

  f.collector->Run();
  assert(f.blobs->Exists(hash));

  assert(f.catalog->Purge("pkg", "1.0") == 1);
  auto report = f.collector->Run();
  assert(report.deleted() == 1);
  assert(!f.blobs->Exists(hash));
}

void TestSharedBlobSurvivesWhileAnyEntryReferencesIt() {
  Fixture f(ZeroGrace());

  const auto hash = f.PublishDirect("a", "1.0", "shared");
  f.PublishDirect("b", "1.0", "shared");

  f.catalog->SoftDelete("a", "1.0");
  f.catalog->Purge("a", "1.0");

  f.collector->Run();
  assert(f.blobs->Exists(hash));
}

void TestAbandonedStagingIsSwept() {
  GcOptions options            = ZeroGrace();
  options.staging_grace_period = std::chrono::minutes(30);
  Fixture f(options);

  BufferSource source("never promoted");
  auto         staged = f.blobs->Stage(source);
  assert(f.blobs->StagingCount() == 1);

  auto report = f.collector->Run();
  assert(report.staging_removed() == 0);

  f.clock->Advance(std::chrono::minutes(31));
  report = f.collector->Run();
  assert(report.staging_removed() == 1);
  assert(f.blobs->StagingCount() == 0);
  assert(f.blobs->List().empty());
}

void TestEmptyStore() {
  Fixture f(ZeroGrace());
  auto    report = f.collector->Run();
  assert(report.scanned() == 0);
  assert(report.deleted() == 0);
}

} // namespace

int main() {
  TestReferencedBlobsSurviveZeroGrace();
  TestYoungBlobsAreSkipped();
  TestInflightHashIsNotCollected();
  TestDeletedEntryKeepsBlobUntilPurged();
  TestSharedBlobSurvivesWhileAnyEntryReferencesIt();
  TestAbandonedStagingIsSwept();
  TestEmptyStore();

  std::cout << "potato_registry_unit_garbage_collector: pass\n";
  return 0;
}
