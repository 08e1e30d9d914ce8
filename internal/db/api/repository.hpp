#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/catalog_entry_record.hpp"

namespace registry::db {

/*
  Catalog repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertEntry enforces uniqueness of (name, version) among rows that are
    not in the deleted state, and reports a violation as
    ErrorCode::ConstraintViolation (never silently overwrites)

  The DB is the source of truth for:
    catalog entry state
    which content hashes are referenced
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Catalog entries
  // ---------------------------------------------------------------------

  virtual Result InsertEntry(Transaction&, const model::CatalogEntryRecord&) = 0;

  virtual std::optional<model::CatalogEntryRecord> GetEntry(Transaction&, const std::string& id) = 0;

  // The pending or published row for (name, version), if any.
  virtual std::optional<model::CatalogEntryRecord> FindLiveEntry(Transaction&, const std::string& name, const std::string& version) = 0;

  // Every row for a name, deleted ones included.
  virtual std::vector<model::CatalogEntryRecord> ListEntriesByName(Transaction&, const std::string& name) = 0;

  // Rows in `state` whose last transition happened before `updated_before_ms`.
  virtual std::vector<model::CatalogEntryRecord> ListEntriesByState(Transaction&, registry::v1::EntryState state,
                                                                    uint64_t updated_before_ms) = 0;

  // Names with at least one published entry, sorted.
  virtual std::vector<std::string> ListPackageNames(Transaction&) = 0;

  virtual Result UpdateEntry(Transaction&, const model::CatalogEntryRecord&) = 0;

  virtual Result DeleteEntry(Transaction&, const std::string& id) = 0;

  virtual Result IncrementDownloadCount(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Blob liveness
  // ---------------------------------------------------------------------

  // Distinct content hashes of every row still present.
  virtual std::vector<std::string> ListReferencedHashes(Transaction&) = 0;

  virtual bool IsHashReferenced(Transaction&, const std::string& content_hash) = 0;
};

} // namespace registry::db
