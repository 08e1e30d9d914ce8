#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/byte_source.hpp"
#include "internal/util/time.hpp"

namespace registry::storage {

/*
  Content-addressed blob storage.

  Blobs are keyed by lowercase hex SHA-256 and are immutable once written.
  A write is split into two steps:

    Stage()    stream bytes into a private staging area while hashing
    Promote()  atomically publish the staged bytes under their hash

  Nothing is visible under a final key until Promote() returns, and a
  promoted key always holds bytes that hash to it.

  Implementations:
    DISK   -> Arrow file IO, rename into a sharded directory tree
    MEMORY -> Arrow buffers in a map
*/

struct BlobInfo {
  std::string     content_hash;
  uint64_t        size_bytes = 0;
  util::TimePoint modified_at;
};

class BlobReader {
 public:
  virtual ~BlobReader() = default;

  virtual uint64_t Size() const = 0;

  // Next chunk, or false at end of stream.
  virtual bool Next(std::shared_ptr<arrow::Buffer>* chunk) = 0;
};

class BlobStore;

/*
  Result of Stage(). Owns the staging file: if it is neither promoted nor
  explicitly discarded, the destructor discards it.
*/
class StagedBlob {
 public:
  StagedBlob(BlobStore* store, std::string staging_id, std::string content_hash, uint64_t size_bytes);
  ~StagedBlob();

  StagedBlob(StagedBlob&& other) noexcept;
  StagedBlob& operator=(StagedBlob&&) = delete;
  StagedBlob(const StagedBlob&)       = delete;

  const std::string& StagingId() const {
    return staging_id_;
  }
  // Hash computed while staging.
  const std::string& ContentHash() const {
    return content_hash_;
  }
  uint64_t SizeBytes() const {
    return size_bytes_;
  }
  bool Pending() const {
    return store_ != nullptr;
  }

  void Discard();

 private:
  friend class BlobStore;

  void Release() {
    store_ = nullptr;
  }

  BlobStore*  store_;
  std::string staging_id_;
  std::string content_hash_;
  uint64_t    size_bytes_;
};

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------

  virtual StagedBlob Stage(ByteSource& source) = 0;

  /*
    Publishes the staged bytes under their computed hash.

    If the hash is already present the staged copy is dropped and the
    existing blob's modification time is refreshed. Safe to call again
    after a TransientStorageError.
  */
  void Promote(StagedBlob& staged);

  // Stage + Promote. Returns the content hash.
  std::string Put(ByteSource& source);

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------

  /*
    Streams a blob in chunks, hashing as it goes. The reader throws
    IntegrityError at end of stream when the bytes do not hash to
    content_hash. Throws NotFound if the blob is absent.
  */
  std::unique_ptr<BlobReader> Get(const std::string& content_hash);

  virtual bool Exists(const std::string& content_hash) = 0;

  virtual std::optional<BlobInfo> Stat(const std::string& content_hash) = 0;

  virtual std::vector<BlobInfo> List() = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------

  // Idempotent. Returns true if a blob was removed.
  virtual bool Delete(const std::string& content_hash) = 0;

  // Removes staging leftovers last modified before `older_than`.
  virtual uint64_t SweepStaging(util::TimePoint older_than) = 0;

 protected:
  friend class StagedBlob;

  virtual void PromoteStaged(const std::string& staging_id, const std::string& content_hash) = 0;

  virtual void DiscardStaged(const std::string& staging_id) = 0;

  // Raw chunked reader without verification.
  virtual std::unique_ptr<BlobReader> Open(const std::string& content_hash) = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

// Drains a reader into a string. Intended for small blobs and tests.
std::string ReadAll(BlobReader& reader);

} // namespace registry::storage
