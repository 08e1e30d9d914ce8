#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace registry::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace registry::db::postgres
