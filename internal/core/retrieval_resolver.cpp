#include "retrieval_resolver.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace registry::core {

namespace {

std::string Coordinate(const catalog::CatalogEntryRecord& entry) {
  return entry.name + "@" + entry.version;
}

} // namespace

ArtifactStream::ArtifactStream(catalog::CatalogEntryRecord entry, std::unique_ptr<storage::BlobReader> reader,
                               std::shared_ptr<catalog::MetadataCatalog> catalog)
    : entry_(std::move(entry)), reader_(std::move(reader)), catalog_(std::move(catalog)) {
}

bool ArtifactStream::Next(std::shared_ptr<arrow::Buffer>* chunk) {
  if (finished_) return false;

  try {
    if (reader_->Next(chunk)) return true;
  } catch (const util::IntegrityError& e) {
    finished_ = true;
    REGISTRY_LOG_ERROR("stored blob failed verification", {observability::ArtifactField(entry_.name, entry_.version),
                                                           observability::HashField(entry_.content_hash),
                                                           observability::ErrorField(e.what())});
    throw;
  }

  finished_ = true;
  try {
    catalog_->RecordDownload(entry_.id);
  } catch (const std::exception& e) {
    REGISTRY_LOG_WARN("failed to record download",
                      {observability::EntryField(entry_.id), observability::ErrorField(e.what())});
  }
  return false;
}

RetrievalResolver::RetrievalResolver(std::shared_ptr<catalog::MetadataCatalog> catalog, storage::BlobStorePtr blobs)
    : catalog_(std::move(catalog)), blobs_(std::move(blobs)) {
}

std::unique_ptr<ArtifactStream> RetrievalResolver::Fetch(const std::string& name, const std::string& version_or_range) {
  observability::SpanScope span("registry.fetch");
  span.SetAttribute(observability::attr::kArtifactName, name);
  span.SetAttribute(observability::attr::kVersionRange, version_or_range);

  auto entry = catalog_->Resolve(name, version_or_range);
  span.SetArtifact(entry.name, entry.version);
  span.SetContentHash(entry.content_hash);
  span.SetEntryId(entry.id);

  std::unique_ptr<storage::BlobReader> reader;
  try {
    reader = blobs_->Get(entry.content_hash);
  } catch (const util::NotFound&) {
    REGISTRY_LOG_ERROR("blob missing for published entry", {observability::ArtifactField(entry.name, entry.version),
                                                            observability::EntryField(entry.id),
                                                            observability::HashField(entry.content_hash)});
    span.RecordException("blob missing");
    throw util::IntegrityError("blob " + entry.content_hash + " of " + Coordinate(entry) + " is missing");
  }

  if (reader->Size() != entry.size_bytes) {
    REGISTRY_LOG_ERROR("stored blob size mismatch", {observability::ArtifactField(entry.name, entry.version),
                                                     observability::IntField("expected", static_cast<int64_t>(entry.size_bytes)),
                                                     observability::IntField("actual", static_cast<int64_t>(reader->Size()))});
    throw util::IntegrityError("blob " + entry.content_hash + " has " + std::to_string(reader->Size()) + " bytes, expected " +
                               std::to_string(entry.size_bytes));
  }

  return std::make_unique<ArtifactStream>(std::move(entry), std::move(reader), catalog_);
}

} // namespace registry::core
