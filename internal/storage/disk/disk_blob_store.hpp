#pragma once

#include <cstddef>
#include <filesystem>

#include "internal/storage/blob_store.hpp"

namespace registry::storage {

/*
  Durable disk storage using Arrow IO.

  Layout:
    <root>/blobs/<h[0:2]>/<h[2:4]>/<hash>
    <root>/staging/<uuid>.part

  Properties:
    - staged writes, atomic rename into the final path
    - optional fsync of file and parent directory
    - filesystem failures surface as TransientStorageError
*/

class DiskBlobStore final : public BlobStore {
public:
  DiskBlobStore(std::filesystem::path root, bool fsync, std::size_t read_chunk_bytes);

  StagedBlob Stage(ByteSource& source) override;

  bool Exists(const std::string& content_hash) override;
  std::optional<BlobInfo> Stat(const std::string& content_hash) override;
  std::vector<BlobInfo> List() override;

  bool Delete(const std::string& content_hash) override;
  uint64_t SweepStaging(util::TimePoint older_than) override;

  const std::filesystem::path& Root() const { return root_; }

  // Final location of a blob. Exposed for operators and tests.
  std::filesystem::path PathOf(const std::string& content_hash) const;

protected:
  void PromoteStaged(const std::string& staging_id, const std::string& content_hash) override;
  void DiscardStaged(const std::string& staging_id) override;
  std::unique_ptr<BlobReader> Open(const std::string& content_hash) override;

private:
  std::filesystem::path root_;
  bool fsync_;
  std::size_t read_chunk_bytes_;
};

} // namespace registry::storage
