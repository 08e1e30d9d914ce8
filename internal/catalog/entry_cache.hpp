#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/catalog_entry_record.hpp"

namespace registry::catalog {

/*
  Process-wide cache of published catalog entries keyed by name@version.

  Hydrated once at startup from the catalog and invalidated explicitly by
  every catalog mutation. Only published entries are ever cached.

  Fills that race a mutation are fenced by a generation counter: a reader
  takes Generation() before its repository read and fills through
  PutIfGeneration(), which drops the record if any invalidation ran since.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class EntryCache {
 public:
  // With `generation` set, returns false and leaves the cache empty (but
  // hydrated) when an invalidation ran after that generation was taken.
  bool Hydrate(const std::vector<db::model::CatalogEntryRecord>& published, std::optional<uint64_t> generation = std::nullopt);

  uint64_t Generation() const;

  std::optional<db::model::CatalogEntryRecord> Get(const std::string& name, const std::string& version) const;

  // Ignores records that are not published.
  void Put(const db::model::CatalogEntryRecord& record);

  bool PutIfGeneration(const db::model::CatalogEntryRecord& record, uint64_t generation);

  void Invalidate(const std::string& name, const std::string& version);

  void InvalidateName(const std::string& name);

  void RecordDownload(const std::string& name, const std::string& version);

  void Clear();

  bool Hydrated() const;

  std::size_t Size() const;

 private:
  static std::string Key(const std::string& name, const std::string& version);

  mutable std::shared_mutex                                  mutex_;
  std::unordered_map<std::string, db::model::CatalogEntryRecord> entries_;
  bool                                                       hydrated_   = false;
  uint64_t                                                   generation_ = 0;
};

} // namespace registry::catalog
