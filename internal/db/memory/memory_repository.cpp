#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace registry::db::memory {

namespace {

bool IsDeleted(const model::CatalogEntryRecord& r) {
  return r.state == registry::v1::ENTRY_STATE_DELETED;
}

bool ByCreation(const model::CatalogEntryRecord& a, const model::CatalogEntryRecord& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  if (TX(t).View().entries.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "entry id exists");
  if (!IsDeleted(r) && FindLiveEntry(t, r.name, r.version)) {
    return Result::Err(ErrorCode::ConstraintViolation, "live entry exists for " + r.name + "@" + r.version);
  }
  TX(t).Mutable().entries[r.id] = r;
  return Result::Ok();
}

std::optional<model::CatalogEntryRecord> MemoryRepository::GetEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(id);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

std::optional<model::CatalogEntryRecord> MemoryRepository::FindLiveEntry(Transaction& t, const std::string& name,
                                                                          const std::string& version) {
  for (const auto& [_, r] : TX(t).View().entries) {
    if (r.name == name && r.version == version && !IsDeleted(r)) return r;
  }
  return std::nullopt;
}

std::vector<model::CatalogEntryRecord> MemoryRepository::ListEntriesByName(Transaction& t, const std::string& name) {
  std::vector<model::CatalogEntryRecord> out;
  for (const auto& [_, r] : TX(t).View().entries) {
    if (r.name == name) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), ByCreation);
  return out;
}

std::vector<model::CatalogEntryRecord> MemoryRepository::ListEntriesByState(Transaction& t, registry::v1::EntryState state,
                                                                            uint64_t updated_before_ms) {
  std::vector<model::CatalogEntryRecord> out;
  for (const auto& [_, r] : TX(t).View().entries) {
    if (r.state == state && r.updated_at_ms < updated_before_ms) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });
  return out;
}

std::vector<std::string> MemoryRepository::ListPackageNames(Transaction& t) {
  std::set<std::string> names;
  for (const auto& [_, r] : TX(t).View().entries) {
    if (r.state == registry::v1::ENTRY_STATE_PUBLISHED) names.insert(r.name);
  }
  return {names.begin(), names.end()};
}

Result MemoryRepository::UpdateEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  auto it = TX(t).View().entries.find(r.id);
  if (it == TX(t).View().entries.end()) return Result::Err(ErrorCode::NotFound);

  auto& stored          = TX(t).Mutable().entries[r.id];
  stored.content_hash   = r.content_hash;
  stored.size_bytes     = r.size_bytes;
  stored.state          = r.state;
  stored.uploader       = r.uploader;
  stored.updated_at_ms  = r.updated_at_ms;
  stored.delete_reason  = r.delete_reason;
  stored.download_count = r.download_count;
  return Result::Ok();
}

Result MemoryRepository::DeleteEntry(Transaction& t, const std::string& id) {
  if (!TX(t).View().entries.contains(id)) return Result::Ok();
  TX(t).Mutable().entries.erase(id);
  return Result::Ok();
}

Result MemoryRepository::IncrementDownloadCount(Transaction& t, const std::string& id) {
  if (!TX(t).View().entries.contains(id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().entries[id].download_count++;
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListReferencedHashes(Transaction& t) {
  std::set<std::string> hashes;
  for (const auto& [_, r] : TX(t).View().entries) hashes.insert(r.content_hash);
  return {hashes.begin(), hashes.end()};
}

bool MemoryRepository::IsHashReferenced(Transaction& t, const std::string& content_hash) {
  for (const auto& [_, r] : TX(t).View().entries) {
    if (r.content_hash == content_hash) return true;
  }
  return false;
}

} // namespace registry::db::memory
