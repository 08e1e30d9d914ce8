#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace registry::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::CatalogEntryRecord> entries;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace registry::db::memory
