#include "blob_store.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace registry::storage {

namespace {

class VerifyingReader final : public BlobReader {
 public:
  VerifyingReader(std::unique_ptr<BlobReader> inner, std::string expected)
      : inner_(std::move(inner)), expected_(std::move(expected)) {
  }

  uint64_t Size() const override {
    return inner_->Size();
  }

  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
    if (done_) return false;
    if (inner_->Next(chunk)) {
      hasher_.Update((*chunk)->data(), static_cast<std::size_t>((*chunk)->size()));
      return true;
    }
    done_             = true;
    const auto actual = hasher_.HexDigest();
    if (actual != expected_) {
      throw util::IntegrityError("blob " + expected_ + " hashes to " + actual);
    }
    return false;
  }

 private:
  std::unique_ptr<BlobReader> inner_;
  std::string                 expected_;
  util::Sha256                hasher_;
  bool                        done_ = false;
};

} // namespace

StagedBlob::StagedBlob(BlobStore* store, std::string staging_id, std::string content_hash, uint64_t size_bytes)
    : store_(store), staging_id_(std::move(staging_id)), content_hash_(std::move(content_hash)), size_bytes_(size_bytes) {
}

StagedBlob::StagedBlob(StagedBlob&& other) noexcept
    : store_(other.store_),
      staging_id_(std::move(other.staging_id_)),
      content_hash_(std::move(other.content_hash_)),
      size_bytes_(other.size_bytes_) {
  other.store_ = nullptr;
}

StagedBlob::~StagedBlob() {
  if (!store_) return;
  try {
    Discard();
  } catch (const std::exception& e) {
    REGISTRY_LOG_WARN("failed to discard staged blob",
                      {observability::StringField("staging_id", staging_id_), observability::ErrorField(e.what())});
  }
}

void StagedBlob::Discard() {
  if (!store_) return;
  auto* store = store_;
  store_      = nullptr;
  store->DiscardStaged(staging_id_);
}

void BlobStore::Promote(StagedBlob& staged) {
  if (!staged.Pending()) {
    throw util::InvalidState("staged blob " + staged.StagingId() + " was already consumed");
  }
  PromoteStaged(staged.StagingId(), staged.ContentHash());
  staged.Release();
}

std::string BlobStore::Put(ByteSource& source) {
  auto staged = Stage(source);
  Promote(staged);
  return staged.ContentHash();
}

std::unique_ptr<BlobReader> BlobStore::Get(const std::string& content_hash) {
  return std::make_unique<VerifyingReader>(Open(content_hash), content_hash);
}

std::string ReadAll(BlobReader& reader) {
  std::string                    out;
  std::shared_ptr<arrow::Buffer> chunk;
  out.reserve(static_cast<std::size_t>(reader.Size()));
  while (reader.Next(&chunk)) {
    out.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
  }
  return out;
}

} // namespace registry::storage
