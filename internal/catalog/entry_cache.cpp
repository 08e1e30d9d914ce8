#include "entry_cache.hpp"

#include <mutex>

namespace registry::catalog {

std::string EntryCache::Key(const std::string& name, const std::string& version) {
  return name + "@" + version;
}

bool EntryCache::Hydrate(const std::vector<db::model::CatalogEntryRecord>& published, std::optional<uint64_t> generation) {
  std::unique_lock lock(mutex_);
  entries_.clear();
  hydrated_ = true;
  if (generation && *generation != generation_) return false;
  for (const auto& record : published) {
    if (record.state != registry::v1::ENTRY_STATE_PUBLISHED) continue;
    entries_[Key(record.name, record.version)] = record;
  }
  return true;
}

uint64_t EntryCache::Generation() const {
  std::shared_lock lock(mutex_);
  return generation_;
}

std::optional<db::model::CatalogEntryRecord> EntryCache::Get(const std::string& name, const std::string& version) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(Key(name, version));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void EntryCache::Put(const db::model::CatalogEntryRecord& record) {
  if (record.state != registry::v1::ENTRY_STATE_PUBLISHED) return;
  std::unique_lock lock(mutex_);
  entries_[Key(record.name, record.version)] = record;
}

bool EntryCache::PutIfGeneration(const db::model::CatalogEntryRecord& record, uint64_t generation) {
  if (record.state != registry::v1::ENTRY_STATE_PUBLISHED) return false;
  std::unique_lock lock(mutex_);
  if (generation != generation_) return false;
  entries_[Key(record.name, record.version)] = record;
  return true;
}

void EntryCache::Invalidate(const std::string& name, const std::string& version) {
  std::unique_lock lock(mutex_);
  ++generation_;
  entries_.erase(Key(name, version));
}

void EntryCache::InvalidateName(const std::string& name) {
  std::unique_lock lock(mutex_);
  ++generation_;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.name == name) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

void EntryCache::RecordDownload(const std::string& name, const std::string& version) {
  std::unique_lock lock(mutex_);
  auto it = entries_.find(Key(name, version));
  if (it != entries_.end()) it->second.download_count++;
}

void EntryCache::Clear() {
  std::unique_lock lock(mutex_);
  ++generation_;
  entries_.clear();
  hydrated_ = false;
}

bool EntryCache::Hydrated() const {
  std::shared_lock lock(mutex_);
  return hydrated_;
}

std::size_t EntryCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace registry::catalog
