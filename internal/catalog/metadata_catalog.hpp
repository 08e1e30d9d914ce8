#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/entry_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace registry::catalog {

using db::model::CatalogEntryRecord;

struct CatalogOptions {
  // Deleted (name, version) pairs stay reserved until purged.
  bool block_reuse_of_deleted = false;
};

/*
  Outcome of BeginPublish.

  created is true only when this call inserted the pending row; the caller
  owns that row and is the only one allowed to abort it.
*/
struct Reservation {
  std::string              entry_id;
  registry::v1::EntryState state   = registry::v1::ENTRY_STATE_UNSPECIFIED;
  bool                     created = false;
};

/*
  MetadataCatalog

  Publication state machine over db::Repository. Every method runs in its
  own transaction; names and versions are normalized on the way in.

  Errors:
    NotFound, Conflict, InvalidState       per operation
    TransientStorageError                  Busy / serialization / IO in the DB
    std::invalid_argument                  malformed name, version, range, hash
*/
class MetadataCatalog {
 public:
  MetadataCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<EntryCache> cache,
                  CatalogOptions options = {});

  // ------------------------------------------------------------------
  // Publish saga
  // ------------------------------------------------------------------

  Reservation BeginPublish(const std::string& name, const std::string& version, uint64_t expected_size, const std::string& expected_hash,
                           const std::string& uploader = {});

  // pending -> published
  CatalogEntryRecord CommitPublish(const std::string& entry_id);

  // Removes a pending row.
  void AbortPublish(const std::string& entry_id);

  // ------------------------------------------------------------------
  // Lookup
  // ------------------------------------------------------------------

  // Exact version or range. Only published entries are ever returned.
  CatalogEntryRecord Resolve(const std::string& name, const std::string& version_or_range);

  std::optional<CatalogEntryRecord> GetEntry(const std::string& entry_id);

  // Published versions, highest first.
  std::vector<std::string> ListVersions(const std::string& name);

  std::vector<std::string> ListPackages();

  // ------------------------------------------------------------------
  // Deletion
  // ------------------------------------------------------------------

  CatalogEntryRecord SoftDelete(const std::string& name, const std::string& version, const std::string& reason = {});

  // Soft-deletes every published version. Returns the deleted versions.
  std::vector<std::string> DeletePackage(const std::string& name, const std::string& reason = {});

  // Removes the deleted rows of a pair. Returns the number of rows removed.
  uint32_t Purge(const std::string& name, const std::string& version);

  uint32_t PurgeDeleted(util::TimePoint older_than);

  // ------------------------------------------------------------------
  // Sweeps
  // ------------------------------------------------------------------

  std::vector<CatalogEntryRecord> ListStalePending(util::TimePoint older_than);

  std::vector<std::string> ListReferencedHashes();

  bool IsHashReferenced(const std::string& content_hash);

  void RecordDownload(const std::string& entry_id);

  // Loads every published entry into the cache.
  std::size_t HydrateCache();

  const std::shared_ptr<EntryCache>& Cache() const {
    return cache_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::shared_ptr<EntryCache>     cache_;
  CatalogOptions                  options_;
};

} // namespace registry::catalog
