#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace registry::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntry(Transaction&, const model::CatalogEntryRecord&) override;
  std::optional<model::CatalogEntryRecord> GetEntry(Transaction&, const std::string&) override;
  std::optional<model::CatalogEntryRecord> FindLiveEntry(Transaction&, const std::string& name,
                                                         const std::string& version) override;
  std::vector<model::CatalogEntryRecord> ListEntriesByName(Transaction&, const std::string& name) override;
  std::vector<model::CatalogEntryRecord> ListEntriesByState(Transaction&, registry::v1::EntryState state,
                                                            uint64_t updated_before_ms) override;
  std::vector<std::string> ListPackageNames(Transaction&) override;
  Result UpdateEntry(Transaction&, const model::CatalogEntryRecord&) override;
  Result DeleteEntry(Transaction&, const std::string&) override;
  Result IncrementDownloadCount(Transaction&, const std::string&) override;

  std::vector<std::string> ListReferencedHashes(Transaction&) override;
  bool IsHashReferenced(Transaction&, const std::string& content_hash) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace registry::db::sqlite
