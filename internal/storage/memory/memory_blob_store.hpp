#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <arrow/buffer.h>

#include "internal/storage/blob_store.hpp"

namespace registry::storage {

/*
  In-memory blob storage.

  Backed by Arrow buffers. Used for tests and ephemeral deployments.
  Modification times come from the injected clock.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryBlobStore final : public BlobStore {
public:
  explicit MemoryBlobStore(std::shared_ptr<util::Clock> clock = nullptr, std::size_t read_chunk_bytes = 64 * 1024);

  StagedBlob Stage(ByteSource& source) override;

  bool Exists(const std::string& content_hash) override;
  std::optional<BlobInfo> Stat(const std::string& content_hash) override;
  std::vector<BlobInfo> List() override;

  bool Delete(const std::string& content_hash) override;
  uint64_t SweepStaging(util::TimePoint older_than) override;

  std::size_t StagingCount() const;

protected:
  void PromoteStaged(const std::string& staging_id, const std::string& content_hash) override;
  void DiscardStaged(const std::string& staging_id) override;
  std::unique_ptr<BlobReader> Open(const std::string& content_hash) override;

private:
  struct Stored {
    std::shared_ptr<arrow::Buffer> buffer;
    util::TimePoint modified_at;
  };

  std::shared_ptr<util::Clock> clock_;
  int64_t read_chunk_bytes_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Stored> blobs_;
  std::unordered_map<std::string, Stored> staging_;
};

} // namespace registry::storage
