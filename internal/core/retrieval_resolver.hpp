#pragma once

#include <memory>
#include <string>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/storage/blob_store.hpp"

namespace registry::core {

/*
  A resolved artifact being streamed to a caller.

  Chunks are verified against the entry's hash as they pass through; a
  mismatch surfaces as IntegrityError from the final Next() call. Reading
  the stream to the end records a download.
*/
class ArtifactStream {
 public:
  ArtifactStream(catalog::CatalogEntryRecord entry, std::unique_ptr<storage::BlobReader> reader,
                 std::shared_ptr<catalog::MetadataCatalog> catalog);

  const catalog::CatalogEntryRecord& Entry() const {
    return entry_;
  }

  uint64_t Size() const {
    return reader_->Size();
  }

  bool Next(std::shared_ptr<arrow::Buffer>* chunk);

 private:
  catalog::CatalogEntryRecord               entry_;
  std::unique_ptr<storage::BlobReader>      reader_;
  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  bool                                      finished_ = false;
};

class RetrievalResolver {
 public:
  RetrievalResolver(std::shared_ptr<catalog::MetadataCatalog> catalog, storage::BlobStorePtr blobs);

  // NotFound when nothing published matches; IntegrityError when the blob
  // of a published entry is missing.
  std::unique_ptr<ArtifactStream> Fetch(const std::string& name, const std::string& version_or_range);

 private:
  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  storage::BlobStorePtr                     blobs_;
};

} // namespace registry::core
