#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/upload_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/memory/memory_blob_store.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"

namespace {

using registry::core::PublishRequest;
using registry::core::UploadCoordinator;
using registry::db::ErrorCode;
using registry::db::Result;
using registry::db::Transaction;
using registry::db::model::CatalogEntryRecord;
using registry::storage::BufferSource;
using registry::util::Sha256;

/*
  Repository decorator that reports the next N writes as Busy.
*/
class FlakyRepository final : public registry::db::Repository {
 public:
  explicit FlakyRepository(std::shared_ptr<registry::db::Repository> inner) : inner_(std::move(inner)) {}

  void FailNextWrites(int n) { failures_ = n; }

  std::unique_ptr<Transaction> Begin() override { return inner_->Begin(); }

  Result InsertEntry(Transaction& tx, const CatalogEntryRecord& r) override {
    if (ShouldFail()) return Result::Err(ErrorCode::Busy, "injected");
    return inner_->InsertEntry(tx, r);
  }
  std::optional<CatalogEntryRecord> GetEntry(Transaction& tx, const std::string& id) override { return inner_->GetEntry(tx, id); }
  std::optional<CatalogEntryRecord> FindLiveEntry(Transaction& tx, const std::string& name, const std::string& version) override {
    return inner_->FindLiveEntry(tx, name, version);
  }
  std::vector<CatalogEntryRecord> ListEntriesByName(Transaction& tx, const std::string& name) override {
    return inner_->ListEntriesByName(tx, name);
  }
  std::vector<CatalogEntryRecord> ListEntriesByState(Transaction& tx, registry::v1::EntryState state, uint64_t before) override {
    return inner_->ListEntriesByState(tx, state, before);
  }
  std::vector<std::string> ListPackageNames(Transaction& tx) override { return inner_->ListPackageNames(tx); }
  Result UpdateEntry(Transaction& tx, const CatalogEntryRecord& r) override {
    if (ShouldFail()) return Result::Err(ErrorCode::Busy, "injected");
    return inner_->UpdateEntry(tx, r);
  }
  Result DeleteEntry(Transaction& tx, const std::string& id) override { return inner_->DeleteEntry(tx, id); }
  Result IncrementDownloadCount(Transaction& tx, const std::string& id) override { return inner_->IncrementDownloadCount(tx, id); }
  std::vector<std::string> ListReferencedHashes(Transaction& tx) override { return inner_->ListReferencedHashes(tx); }
  bool IsHashReferenced(Transaction& tx, const std::string& hash) override { return inner_->IsHashReferenced(tx, hash); }

 private:
  bool ShouldFail() { return failures_.fetch_sub(1) > 0; }

  std::shared_ptr<registry::db::Repository> inner_;
  std::atomic<int>                          failures_{0};
};

// Yields one chunk, then reports the peer gone.
class DisconnectingSource final : public registry::storage::ByteSource {
 public:
  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
    if (sent_) throw registry::util::Cancelled("client disconnected");
    sent_  = true;
    *chunk = arrow::Buffer::FromString("first chunk");
    return true;
  }

 private:
  bool sent_ = false;
};

// Yields one chunk, then fails with `Error` (a protocol or storage fault).
template <typename Error>
class FailingSource final : public registry::storage::ByteSource {
 public:
  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
    if (sent_) throw Error("stream broke after the first chunk");
    sent_  = true;
    *chunk = arrow::Buffer::FromString("first chunk");
    return true;
  }

 private:
  bool sent_ = false;
};

struct Fixture {
  std::shared_ptr<registry::util::ManualClock>       clock = std::make_shared<registry::util::ManualClock>();
  std::shared_ptr<FlakyRepository>                   repository;
  std::shared_ptr<registry::catalog::MetadataCatalog> catalog;
  std::shared_ptr<registry::storage::MemoryBlobStore> blobs;
  std::shared_ptr<registry::core::InflightHashes>     inflight = std::make_shared<registry::core::InflightHashes>();
  std::shared_ptr<UploadCoordinator>                  coordinator;

  explicit Fixture(uint32_t max_attempts = 3) {
    repository = std::make_shared<FlakyRepository>(std::make_shared<registry::db::memory::MemoryRepository>());
    catalog    = std::make_shared<registry::catalog::MetadataCatalog>(repository, clock, std::make_shared<registry::catalog::EntryCache>());
    blobs      = std::make_shared<registry::storage::MemoryBlobStore>(clock);

    registry::util::RetryPolicy retry;
    retry.max_attempts    = max_attempts;
    retry.initial_backoff = std::chrono::milliseconds(1);
    retry.max_backoff     = std::chrono::milliseconds(4);
    coordinator           = std::make_shared<UploadCoordinator>(catalog, blobs, inflight, retry);
  }

  registry::core::PublishResult Publish(const std::string& name, const std::string& version, const std::string& bytes) {
    PublishRequest request{name, version, Sha256::Of(bytes), bytes.size(), "tester"};
    BufferSource   source(bytes, 4);
    return coordinator->Publish(request, source);
  }

  std::size_t PendingRows() {
    return catalog->ListStalePending(clock->Now() + std::chrono::hours(24)).size();
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

void TestPublishStoresBlobAndEntry() {
  Fixture f;
  auto    result = f.Publish("left-pad", "1.0.0", "module.exports = pad");
  assert(result.created);

  auto entry = f.catalog->Resolve("left-pad", "1.0.0");
  assert(entry.id == result.entry_id);
  assert(entry.content_hash == Sha256::Of("module.exports = pad"));
  assert(entry.uploader == "tester");
  assert(f.blobs->Exists(entry.content_hash));
  assert(f.blobs->StagingCount() == 0);
  assert(!f.inflight->Contains(entry.content_hash));
}

void TestRepublishIsIdempotent() {
  Fixture f;
  auto    first  = f.Publish("left-pad", "1.0.0", "same bytes");
  auto    second = f.Publish("left-pad", "1.0.0", "same bytes");

  assert(first.created);
  assert(!second.created);
  assert(first.entry_id == second.entry_id);
  assert(f.blobs->List().size() == 1);
  assert(f.catalog->ListVersions("left-pad").size() == 1);
  assert(f.blobs->StagingCount() == 0);
}

void TestDifferentBytesConflictWithoutSideEffects() {
  Fixture f;
  f.Publish("left-pad", "1.0.0", "b1");

  ExpectThrow<registry::util::Conflict>([&] { f.Publish("left-pad", "1.0.0", "b2"); });

  assert(f.catalog->Resolve("left-pad", "1.0.0").content_hash == Sha256::Of("b1"));
  assert(f.blobs->List().size() == 1);
  assert(!f.blobs->Exists(Sha256::Of("b2")));
  assert(f.PendingRows() == 0);
}

void TestIdenticalContentIsDeduplicated() {
  Fixture f;
  f.Publish("pkg-a", "1.0", "shared");
  f.Publish("pkg-b", "2.0", "shared");

  assert(f.blobs->List().size() == 1);
  assert(f.catalog->Resolve("pkg-a", "1.0").content_hash == f.catalog->Resolve("pkg-b", "2.0").content_hash);
}

void TestHashMismatchAbortsAndDiscards() {
  Fixture        f;
  PublishRequest request{"pkg", "1.0", Sha256::Of("declared"), 8, ""};
  BufferSource   source("received");

  ExpectThrow<registry::util::IntegrityError>([&] { f.coordinator->Publish(request, source); });

  assert(f.PendingRows() == 0);
  assert(f.blobs->List().empty());
  assert(f.blobs->StagingCount() == 0);

  // The slot is immediately reusable.
  assert(f.Publish("pkg", "1.0", "declared").created);
}

void TestSizeMismatchAborts() {
  Fixture        f;
  PublishRequest request{"pkg", "1.0", Sha256::Of("bytes"), 999, ""};
  BufferSource   source("bytes");

  ExpectThrow<registry::util::IntegrityError>([&] { f.coordinator->Publish(request, source); });
  assert(f.PendingRows() == 0);
  assert(f.blobs->List().empty());
}

void TestCancellationAbortsOwnedRow() {
  Fixture             f;
  PublishRequest      request{"pkg", "1.0", Sha256::Of("whatever"), 8, ""};
  DisconnectingSource source;

  ExpectThrow<registry::util::Cancelled>([&] { f.coordinator->Publish(request, source); });

  assert(f.PendingRows() == 0);
  assert(f.blobs->StagingCount() == 0);
  assert(f.blobs->List().empty());
  assert(!f.inflight->Contains(Sha256::Of("whatever")));
}

void TestCancellationLeavesForeignRow() {
  Fixture f;
  auto    owner = f.catalog->BeginPublish("pkg", "1.0", 8, Sha256::Of("whatever"));

  PublishRequest      request{"pkg", "1.0", Sha256::Of("whatever"), 8, ""};
  DisconnectingSource source;
  ExpectThrow<registry::util::Cancelled>([&] { f.coordinator->Publish(request, source); });

  auto entry = f.catalog->GetEntry(owner.entry_id);
  assert(entry.has_value());
  assert(entry->state == registry::v1::ENTRY_STATE_PENDING);
}

void TestRejectedStreamFreesSlotImmediately() {
  Fixture                                f;
  PublishRequest                         request{"pkg", "1.0", Sha256::Of("whatever"), 8, ""};
  FailingSource<std::invalid_argument>   source;

  ExpectThrow<std::invalid_argument>([&] { f.coordinator->Publish(request, source); });

  assert(f.PendingRows() == 0);
  assert(f.blobs->StagingCount() == 0);
  assert(!f.inflight->Contains(Sha256::Of("whatever")));

  // No reconciliation needed before the slot can be published again.
  auto result = f.Publish("pkg", "1.0", "new bytes");
  assert(result.created);
  assert(f.catalog->Resolve("pkg", "1.0").content_hash == Sha256::Of("new bytes"));
}

void TestStorageFailureDuringStagingLeavesPendingRow() {
  Fixture                                             f;
  PublishRequest                                      request{"pkg", "1.0", Sha256::Of("whatever"), 8, ""};
  FailingSource<registry::util::TransientStorageError> source;

  ExpectThrow<registry::util::TransientStorageError>([&] { f.coordinator->Publish(request, source); });

  assert(f.PendingRows() == 1);
  assert(f.blobs->StagingCount() == 0);
}

void TestTransientCatalogErrorsAreRetried() {
  Fixture f(3);
  f.repository->FailNextWrites(2);

  auto result = f.Publish("pkg", "1.0", "eventually");
  assert(result.created);
  assert(f.catalog->Resolve("pkg", "1.0").id == result.entry_id);
}

void TestExhaustedReservationRetriesSurface() {
  Fixture f(2);
  f.repository->FailNextWrites(100);

  ExpectThrow<registry::util::TransientStorageError>([&] { f.Publish("pkg", "1.0", "stuck"); });
  f.repository->FailNextWrites(0);

  ExpectThrow<registry::util::NotFound>([&] { f.catalog->Resolve("pkg", "1.0"); });
  assert(f.PendingRows() == 0);
  assert(f.blobs->List().empty());
}

void TestCommitFailureLeavesPendingForReconciler() {
  Fixture f(2);

  // Insert succeeds, then every update fails.
  class FailAfterInsert final : public registry::storage::ByteSource {
   public:
    explicit FailAfterInsert(FlakyRepository* repo) : repo_(repo) {}
    bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
      if (done_) return false;
      done_ = true;
      repo_->FailNextWrites(100);
      *chunk = arrow::Buffer::FromString("payload");
      return true;
    }

   private:
    FlakyRepository* repo_;
    bool             done_ = false;
  };

  PublishRequest  request{"pkg", "1.0", Sha256::Of("payload"), 7, ""};
  FailAfterInsert source(f.repository.get());
  ExpectThrow<registry::util::TransientStorageError>([&] { f.coordinator->Publish(request, source); });
  f.repository->FailNextWrites(0);

  assert(f.PendingRows() == 1);
  // Promotion happened; the blob stays until the row is reconciled and collected.
  assert(f.blobs->Exists(Sha256::Of("payload")));
}

void TestConcurrentPublishesOfSameSlot() {
  Fixture f(50);
  const std::string bytes = "raced content";

  std::atomic<int>         created{0};
  std::atomic<int>         failures{0};
  std::vector<std::string> ids(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        auto result = f.Publish("race", "1.0", bytes);
        ids[i]      = result.entry_id;
        if (result.created) ++created;
      } catch (const std::exception& e) {
        std::cerr << "publish failed: " << e.what() << "\n";
        ++failures;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(failures == 0);
  assert(created == 1);
  for (const auto& id : ids) assert(id == ids[0]);
  assert(f.blobs->List().size() == 1);
  assert(f.blobs->StagingCount() == 0);
  assert(f.PendingRows() == 0);
  assert(f.catalog->Resolve("race", "1.0").id == ids[0]);
}

void TestConcurrentConflictingPublishes() {
  Fixture f(50);

  std::atomic<int>         succeeded{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i] {
      try {
        f.Publish("contested", "1.0", "content-" + std::to_string(i));
        ++succeeded;
      } catch (const registry::util::Conflict&) {
        ++conflicts;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(succeeded == 1);
  assert(conflicts == 5);
  assert(f.blobs->List().size() == 1);
}

} // namespace

int main() {
  TestPublishStoresBlobAndEntry();
  TestRepublishIsIdempotent();
  TestDifferentBytesConflictWithoutSideEffects();
  TestIdenticalContentIsDeduplicated();
  TestHashMismatchAbortsAndDiscards();
  TestSizeMismatchAborts();
  TestCancellationAbortsOwnedRow();
  TestCancellationLeavesForeignRow();
  TestRejectedStreamFreesSlotImmediately();
  TestStorageFailureDuringStagingLeavesPendingRow();
  TestTransientCatalogErrorsAreRetried();
  TestExhaustedReservationRetriesSurface();
  TestCommitFailureLeavesPendingForReconciler();
  TestConcurrentPublishesOfSameSlot();
  TestConcurrentConflictingPublishes();

  std::cout << "potato_registry_unit_upload_coordinator: pass\n";
  return 0;
}
