#include "inflight_hashes.hpp"

namespace registry::core {

InflightHashes::Guard::Guard(InflightHashes* owner, std::string hash) : owner_(owner), hash_(std::move(hash)) {
}

InflightHashes::Guard::Guard(Guard&& other) noexcept : owner_(other.owner_), hash_(std::move(other.hash_)) {
  other.owner_ = nullptr;
}

InflightHashes::Guard::~Guard() {
  if (owner_) owner_->Release(hash_);
}

InflightHashes::Guard InflightHashes::Register(const std::string& hash) {
  std::lock_guard lock(mutex_);
  ++counts_[hash];
  return Guard(this, hash);
}

bool InflightHashes::Contains(const std::string& hash) const {
  std::lock_guard lock(mutex_);
  return counts_.contains(hash);
}

bool InflightHashes::RunIfIdle(const std::string& hash, const std::function<void()>& fn) {
  std::lock_guard lock(mutex_);
  if (counts_.contains(hash)) return false;
  fn();
  return true;
}

void InflightHashes::Release(const std::string& hash) {
  std::lock_guard lock(mutex_);
  auto it = counts_.find(hash);
  if (it == counts_.end()) return;
  if (--it->second == 0) counts_.erase(it);
}

} // namespace registry::core
