#include "memory_blob_store.hpp"

#include <algorithm>
#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace registry::storage {

namespace {

class MemoryBlobReader final : public BlobReader {
public:
  MemoryBlobReader(std::shared_ptr<arrow::Buffer> buffer, int64_t chunk_bytes)
      : buffer_(std::move(buffer)), chunk_bytes_(chunk_bytes) {}

  uint64_t Size() const override { return static_cast<uint64_t>(buffer_->size()); }

  /*
    Zero-copy slices of the stored buffer.
  */
  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
    if (offset_ >= buffer_->size()) return false;
    const int64_t length = std::min(chunk_bytes_, buffer_->size() - offset_);
    *chunk = arrow::SliceBuffer(buffer_, offset_, length);
    offset_ += length;
    return true;
  }

private:
  std::shared_ptr<arrow::Buffer> buffer_;
  int64_t chunk_bytes_;
  int64_t offset_ = 0;
};

} // namespace

MemoryBlobStore::MemoryBlobStore(std::shared_ptr<util::Clock> clock, std::size_t read_chunk_bytes)
    : clock_(clock ? std::move(clock) : std::make_shared<util::WallClock>()),
      read_chunk_bytes_(static_cast<int64_t>(read_chunk_bytes == 0 ? 64 * 1024 : read_chunk_bytes)) {}

StagedBlob MemoryBlobStore::Stage(ByteSource& source) {
  util::Sha256 hasher;
  std::string bytes;

  std::shared_ptr<arrow::Buffer> chunk;
  while (source.Next(&chunk)) {
    hasher.Update(chunk->data(), static_cast<std::size_t>(chunk->size()));
    bytes.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
  }

  const auto staging_id = util::GenerateUUIDString();
  const auto size = static_cast<uint64_t>(bytes.size());
  {
    std::unique_lock lock(mutex_);
    staging_[staging_id] = Stored{arrow::Buffer::FromString(std::move(bytes)), clock_->Now()};
  }
  return StagedBlob(this, staging_id, hasher.HexDigest(), size);
}

void MemoryBlobStore::PromoteStaged(const std::string& staging_id, const std::string& content_hash) {
  common::ValidateContentHash(content_hash);
  std::unique_lock lock(mutex_);

  auto staged = staging_.find(staging_id);
  auto existing = blobs_.find(content_hash);
  if (existing != blobs_.end()) {
    existing->second.modified_at = clock_->Now();
    if (staged != staging_.end()) staging_.erase(staged);
    return;
  }
  if (staged == staging_.end()) {
    throw util::InvalidState("staged blob " + staging_id + " not found");
  }

  blobs_[content_hash] = Stored{std::move(staged->second.buffer), clock_->Now()};
  staging_.erase(staged);
}

void MemoryBlobStore::DiscardStaged(const std::string& staging_id) {
  std::unique_lock lock(mutex_);
  staging_.erase(staging_id);
}

std::unique_ptr<BlobReader> MemoryBlobStore::Open(const std::string& content_hash) {
  common::ValidateContentHash(content_hash);
  std::shared_lock lock(mutex_);
  auto it = blobs_.find(content_hash);
  if (it == blobs_.end()) throw util::NotFound("blob " + content_hash + " not found");
  return std::make_unique<MemoryBlobReader>(it->second.buffer, read_chunk_bytes_);
}

bool MemoryBlobStore::Exists(const std::string& content_hash) {
  common::ValidateContentHash(content_hash);
  std::shared_lock lock(mutex_);
  return blobs_.contains(content_hash);
}

std::optional<BlobInfo> MemoryBlobStore::Stat(const std::string& content_hash) {
  common::ValidateContentHash(content_hash);
  std::shared_lock lock(mutex_);
  auto it = blobs_.find(content_hash);
  if (it == blobs_.end()) return std::nullopt;
  return BlobInfo{content_hash, static_cast<uint64_t>(it->second.buffer->size()), it->second.modified_at};
}

std::vector<BlobInfo> MemoryBlobStore::List() {
  std::shared_lock lock(mutex_);
  std::vector<BlobInfo> out;
  out.reserve(blobs_.size());
  for (const auto& [hash, stored] : blobs_) {
    out.push_back(BlobInfo{hash, static_cast<uint64_t>(stored.buffer->size()), stored.modified_at});
  }
  return out;
}

bool MemoryBlobStore::Delete(const std::string& content_hash) {
  common::ValidateContentHash(content_hash);
  std::unique_lock lock(mutex_);
  return blobs_.erase(content_hash) > 0;
}

uint64_t MemoryBlobStore::SweepStaging(util::TimePoint older_than) {
  std::unique_lock lock(mutex_);
  uint64_t removed = 0;
  for (auto it = staging_.begin(); it != staging_.end();) {
    if (it->second.modified_at < older_than) {
      it = staging_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t MemoryBlobStore::StagingCount() const {
  std::shared_lock lock(mutex_);
  return staging_.size();
}

} // namespace registry::storage
