#include "disk_blob_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace registry::storage {

using namespace registry::storage::common;

namespace {

std::string ErrnoText(const std::string& what, const std::filesystem::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

void SyncFd(int fd, const std::filesystem::path& path) {
  if (::fsync(fd) != 0) throw util::TransientStorageError(ErrnoText("fsync", path));
}

void SyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) throw util::TransientStorageError(ErrnoText("open dir", dir));
  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) throw util::TransientStorageError(ErrnoText("fsync dir", dir));
}

// nullopt when the path does not exist.
std::optional<struct stat> StatPath(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) == 0) return st;
  if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
  throw util::TransientStorageError(ErrnoText("stat", path));
}

util::TimePoint ModifiedAt(const struct stat& st) {
  const auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  return util::TimePoint(std::chrono::duration_cast<util::SystemClock::duration>(since_epoch));
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    REGISTRY_LOG_WARN("failed to remove staging file",
                      {observability::StringField("path", path.string()), observability::ErrorField(ec.message())});
  }
}

class DiskBlobReader final : public BlobReader {
public:
  DiskBlobReader(std::shared_ptr<arrow::io::ReadableFile> file, uint64_t size, int64_t chunk_bytes)
      : file_(std::move(file)), size_(size), chunk_bytes_(chunk_bytes) {}

  ~DiskBlobReader() override {
    auto status = file_->Close();
    if (!status.ok()) {
      REGISTRY_LOG_WARN("failed to close blob", {observability::ErrorField(status.ToString())});
    }
  }

  uint64_t Size() const override { return size_; }

  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
    auto buffer = Unwrap(file_->Read(chunk_bytes_));
    if (buffer->size() == 0) return false;
    *chunk = std::move(buffer);
    return true;
  }

private:
  std::shared_ptr<arrow::io::ReadableFile> file_;
  uint64_t size_;
  int64_t chunk_bytes_;
};

} // namespace

DiskBlobStore::DiskBlobStore(std::filesystem::path root, bool fsync, std::size_t read_chunk_bytes)
    : root_(std::move(root)), fsync_(fsync), read_chunk_bytes_(read_chunk_bytes == 0 ? 64 * 1024 : read_chunk_bytes) {
  std::filesystem::create_directories(BlobDir(root_));
  std::filesystem::create_directories(StagingDir(root_));
}

std::filesystem::path DiskBlobStore::PathOf(const std::string& content_hash) const {
  return BlobPath(root_, content_hash);
}

/*
  Stream into <root>/staging/<uuid>.part, hashing every chunk.
  The partial file is removed if anything goes wrong.
*/
StagedBlob DiskBlobStore::Stage(ByteSource& source) {
  const auto staging_id = util::GenerateUUIDString();
  const auto path       = StagingPath(root_, staging_id);

  util::Sha256 hasher;
  uint64_t     size = 0;

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()));

    std::shared_ptr<arrow::Buffer> chunk;
    while (source.Next(&chunk)) {
      hasher.Update(chunk->data(), static_cast<std::size_t>(chunk->size()));
      Unwrap(out->Write(chunk));
      size += static_cast<uint64_t>(chunk->size());
    }

    Unwrap(out->Flush());
    if (fsync_) SyncFd(out->file_descriptor(), path);
    Unwrap(out->Close());
  } catch (...) {
    RemoveQuietly(path);
    throw;
  }

  return StagedBlob(this, staging_id, hasher.HexDigest(), size);
}

/*
  Atomic publish:
      staging/<id>.part -> blobs/ab/cd/<hash>

  When the blob already exists the staged copy is dropped and the
  existing file is touched so a pending collection treats it as young.
*/
void DiskBlobStore::PromoteStaged(const std::string& staging_id, const std::string& content_hash) {
  const auto staged     = StagingPath(root_, staging_id);
  const auto final_path = BlobPath(root_, content_hash);

  try {
    std::filesystem::create_directories(final_path.parent_path());

    if (std::filesystem::exists(final_path)) {
      std::filesystem::last_write_time(final_path, std::filesystem::file_time_type::clock::now());
      std::filesystem::remove(staged);
      return;
    }

    std::filesystem::rename(staged, final_path);
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::TransientStorageError(std::string("promote ") + content_hash + ": " + e.what());
  }

  if (fsync_) SyncDirectory(final_path.parent_path());
}

void DiskBlobStore::DiscardStaged(const std::string& staging_id) {
  RemoveQuietly(StagingPath(root_, staging_id));
}

std::unique_ptr<BlobReader> DiskBlobStore::Open(const std::string& content_hash) {
  const auto path = BlobPath(root_, content_hash);
  const auto st   = StatPath(path);
  if (!st) throw util::NotFound("blob " + content_hash + " not found");

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return std::make_unique<DiskBlobReader>(std::move(file), static_cast<uint64_t>(st->st_size),
                                          static_cast<int64_t>(read_chunk_bytes_));
}

bool DiskBlobStore::Exists(const std::string& content_hash) {
  return StatPath(BlobPath(root_, content_hash)).has_value();
}

std::optional<BlobInfo> DiskBlobStore::Stat(const std::string& content_hash) {
  const auto st = StatPath(BlobPath(root_, content_hash));
  if (!st) return std::nullopt;
  return BlobInfo{content_hash, static_cast<uint64_t>(st->st_size), ModifiedAt(*st)};
}

std::vector<BlobInfo> DiskBlobStore::List() {
  std::vector<BlobInfo> out;
  try {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(BlobDir(root_))) {
      if (!entry.is_regular_file()) continue;
      const auto name = entry.path().filename().string();
      if (!util::IsContentHash(name)) continue;
      // may vanish between listing and stat
      if (auto info = Stat(name)) out.push_back(std::move(*info));
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::TransientStorageError(std::string("list blobs: ") + e.what());
  }
  return out;
}

bool DiskBlobStore::Delete(const std::string& content_hash) {
  const auto path = BlobPath(root_, content_hash);
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) throw util::TransientStorageError("delete " + content_hash + ": " + ec.message());
  return removed;
}

uint64_t DiskBlobStore::SweepStaging(util::TimePoint older_than) {
  uint64_t removed = 0;
  try {
    for (const auto& entry : std::filesystem::directory_iterator(StagingDir(root_))) {
      if (!entry.is_regular_file()) continue;
      const auto st = StatPath(entry.path());
      if (!st || ModifiedAt(*st) >= older_than) continue;
      std::error_code ec;
      if (std::filesystem::remove(entry.path(), ec)) ++removed;
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::TransientStorageError(std::string("sweep staging: ") + e.what());
  }
  return removed;
}

} // namespace registry::storage
