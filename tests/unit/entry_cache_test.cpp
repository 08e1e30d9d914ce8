#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/entry_cache.hpp"

namespace {

using registry::catalog::EntryCache;
using registry::db::model::CatalogEntryRecord;

CatalogEntryRecord Entry(const std::string& name, const std::string& version, registry::v1::EntryState state) {
  CatalogEntryRecord r;
  r.id      = name + "-" + version;
  r.name    = name;
  r.version = version;
  r.state   = state;
  return r;
}

void TestHydrateKeepsOnlyPublished() {
  EntryCache cache;
  assert(!cache.Hydrated());

  cache.Hydrate({Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED), Entry("a", "2.0", registry::v1::ENTRY_STATE_PENDING),
                 Entry("b", "1.0", registry::v1::ENTRY_STATE_DELETED)});

  assert(cache.Hydrated());
  assert(cache.Size() == 1);
  assert(cache.Get("a", "1.0").has_value());
  assert(!cache.Get("a", "2.0").has_value());
  assert(!cache.Get("b", "1.0").has_value());
}

void TestPutIgnoresUnpublished() {
  EntryCache cache;
  cache.Put(Entry("a", "1.0", registry::v1::ENTRY_STATE_PENDING));
  assert(cache.Size() == 0);
  cache.Put(Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED));
  assert(cache.Size() == 1);
}

void TestInvalidation() {
  EntryCache cache;
  cache.Hydrate({Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED), Entry("a", "2.0", registry::v1::ENTRY_STATE_PUBLISHED),
                 Entry("ab", "1.0", registry::v1::ENTRY_STATE_PUBLISHED)});

  cache.Invalidate("a", "1.0");
  assert(!cache.Get("a", "1.0").has_value());
  assert(cache.Get("a", "2.0").has_value());

  cache.InvalidateName("a");
  assert(!cache.Get("a", "2.0").has_value());
  assert(cache.Get("ab", "1.0").has_value());

  cache.Clear();
  assert(cache.Size() == 0);
  assert(!cache.Hydrated());
}

void TestFillsAfterInvalidationAreDropped() {
  EntryCache cache;
  const auto before = cache.Generation();

  cache.Invalidate("a", "1.0");
  assert(!cache.PutIfGeneration(Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED), before));
  assert(!cache.Get("a", "1.0").has_value());

  const auto current = cache.Generation();
  assert(cache.PutIfGeneration(Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED), current));
  assert(!cache.PutIfGeneration(Entry("a", "2.0", registry::v1::ENTRY_STATE_DELETED), current));

  cache.InvalidateName("unrelated");
  assert(!cache.PutIfGeneration(Entry("a", "3.0", registry::v1::ENTRY_STATE_PUBLISHED), current));

  assert(!cache.Hydrate({Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED)}, current));
  assert(cache.Hydrated());
  assert(cache.Size() == 0);
  assert(cache.Hydrate({Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED)}, cache.Generation()));
  assert(cache.Size() == 1);
}

void TestRecordDownloadUpdatesCachedCopy() {
  EntryCache cache;
  cache.Put(Entry("a", "1.0", registry::v1::ENTRY_STATE_PUBLISHED));
  cache.RecordDownload("a", "1.0");
  cache.RecordDownload("a", "1.0");
  cache.RecordDownload("missing", "1.0");
  assert(cache.Get("a", "1.0")->download_count == 2);
}

void TestConcurrentReadersAndWriters() {
  EntryCache cache;
  cache.Put(Entry("hot", "1.0", registry::v1::ENTRY_STATE_PUBLISHED));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache] {
      for (int i = 0; i < 1000; ++i) {
        auto hit = cache.Get("hot", "1.0");
        assert(hit.has_value());
        cache.RecordDownload("hot", "1.0");
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(cache.Get("hot", "1.0")->download_count == 4000);
}

} // namespace

int main() {
  TestHydrateKeepsOnlyPublished();
  TestPutIgnoresUnpublished();
  TestInvalidation();
  TestFillsAfterInvalidationAreDropped();
  TestRecordDownloadUpdatesCachedCopy();
  TestConcurrentReadersAndWriters();

  std::cout << "potato_registry_unit_entry_cache: pass\n";
  return 0;
}
