#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/retrieval_resolver.hpp"
#include "internal/core/upload_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/storage/memory/memory_blob_store.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace {

using registry::core::ArtifactStream;
using registry::core::PublishRequest;
using registry::core::RetrievalResolver;
using registry::core::UploadCoordinator;
using registry::storage::BufferSource;
using registry::util::Sha256;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "potato_registry_retrieval_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

struct Fixture {
  std::shared_ptr<registry::util::ManualClock>        clock = std::make_shared<registry::util::ManualClock>();
  std::shared_ptr<registry::catalog::MetadataCatalog> catalog;
  registry::storage::BlobStorePtr                     blobs;
  std::shared_ptr<UploadCoordinator>                  coordinator;
  std::shared_ptr<RetrievalResolver>                  resolver;

  explicit Fixture(registry::storage::BlobStorePtr store) : blobs(std::move(store)) {
    catalog = std::make_shared<registry::catalog::MetadataCatalog>(std::make_shared<registry::db::memory::MemoryRepository>(), clock,
                                                                   std::make_shared<registry::catalog::EntryCache>());
    coordinator = std::make_shared<UploadCoordinator>(catalog, blobs, nullptr, registry::util::RetryPolicy{});
    resolver    = std::make_shared<RetrievalResolver>(catalog, blobs);
  }

  std::string Publish(const std::string& name, const std::string& version, const std::string& bytes) {
    PublishRequest request{name, version, Sha256::Of(bytes), bytes.size(), ""};
    BufferSource   source(bytes);
    return coordinator->Publish(request, source).entry_id;
  }

  std::string Fetch(const std::string& name, const std::string& range) {
    auto                           stream = resolver->Fetch(name, range);
    std::string                    out;
    std::shared_ptr<arrow::Buffer> chunk;
    while (stream->Next(&chunk)) out.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
    return out;
  }
};

template <typename E, typename Fn>
void ExpectThrow(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  assert(threw);
}

void TestFetchReturnsPublishedBytes() {
  Fixture f(std::make_shared<registry::storage::MemoryBlobStore>(nullptr, 3));
  f.Publish("left-pad", "1.0.0", "function leftPad() {}");

  assert(f.Fetch("left-pad", "1.0.0") == "function leftPad() {}");
}

void TestFetchResolvesRanges() {
  Fixture f(std::make_shared<registry::storage::MemoryBlobStore>());
  f.Publish("pkg", "1.0.0", "one");
  f.Publish("pkg", "1.4.2", "one-four");
  f.Publish("pkg", "2.0.0", "two");

  assert(f.Fetch("pkg", "^1.0.0") == "one-four");
  assert(f.Fetch("pkg", "latest") == "two");

  auto stream = f.resolver->Fetch("pkg", "~1.0");
  assert(stream->Entry().version == "1.0.0");
  assert(stream->Size() == 3);
}

void TestCompletedFetchRecordsDownload() {
  Fixture    f(std::make_shared<registry::storage::MemoryBlobStore>());
  const auto id = f.Publish("pkg", "1.0", "bytes");

  (void)f.Fetch("pkg", "1.0");
  (void)f.Fetch("pkg", "1.0");

  // An abandoned stream is not a download.
  auto                           partial = f.resolver->Fetch("pkg", "1.0");
  std::shared_ptr<arrow::Buffer> chunk;
  assert(partial->Next(&chunk));

  assert(f.catalog->GetEntry(id)->download_count == 2);
}

void TestUnknownAndPendingAreNotFound() {
  Fixture f(std::make_shared<registry::storage::MemoryBlobStore>());
  ExpectThrow<registry::util::NotFound>([&] { f.resolver->Fetch("ghost", "1.0"); });

  f.catalog->BeginPublish("pkg", "1.0", 3, Sha256::Of("abc"));
  ExpectThrow<registry::util::NotFound>([&] { f.resolver->Fetch("pkg", "1.0"); });
  ExpectThrow<registry::util::NotFound>([&] { f.resolver->Fetch("pkg", "*"); });
}

void TestDeletedIsNotFound() {
  Fixture f(std::make_shared<registry::storage::MemoryBlobStore>());
  f.Publish("pkg", "1.0", "bytes");
  f.catalog->SoftDelete("pkg", "1.0", "yanked");

  ExpectThrow<registry::util::NotFound>([&] { f.resolver->Fetch("pkg", "1.0"); });
}

void TestMissingBlobIsIntegrityError() {
  auto    blobs = std::make_shared<registry::storage::MemoryBlobStore>();
  Fixture f(blobs);
  f.Publish("pkg", "1.0", "bytes");
  assert(blobs->Delete(Sha256::Of("bytes")));

  ExpectThrow<registry::util::IntegrityError>([&] { f.resolver->Fetch("pkg", "1.0"); });
}

void TestCorruptBlobFailsAtEndOfStream() {
  auto    blobs = std::make_shared<registry::storage::DiskBlobStore>(FreshDir("corrupt"), false, 4);
  Fixture f(blobs);
  const auto id = f.Publish("pkg", "1.0", "original bytes");

  {
    std::ofstream out(blobs->PathOf(Sha256::Of("original bytes")), std::ios::binary | std::ios::trunc);
    out << "tampered bytes";
  }

  ExpectThrow<registry::util::IntegrityError>([&] { f.Fetch("pkg", "1.0"); });
  assert(f.catalog->GetEntry(id)->download_count == 0);
}

void TestTruncatedBlobIsIntegrityError() {
  auto    blobs = std::make_shared<registry::storage::DiskBlobStore>(FreshDir("truncated"), false, 4);
  Fixture f(blobs);
  f.Publish("pkg", "1.0", "original bytes");

  {
    std::ofstream out(blobs->PathOf(Sha256::Of("original bytes")), std::ios::binary | std::ios::trunc);
    out << "orig";
  }

  ExpectThrow<registry::util::IntegrityError>([&] { f.resolver->Fetch("pkg", "1.0"); });
}

} // namespace

int main() {
  TestFetchReturnsPublishedBytes();
  TestFetchResolvesRanges();
  TestCompletedFetchRecordsDownload();
  TestUnknownAndPendingAreNotFound();
  TestDeletedIsNotFound();
  TestMissingBlobIsIntegrityError();
  TestCorruptBlobFailsAtEndOfStream();
  TestTruncatedBlobIsIntegrityError();

  std::cout << "potato_registry_unit_retrieval_resolver: pass\n";
  return 0;
}
