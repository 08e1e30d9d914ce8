#include "upload_coordinator.hpp"

#include <optional>

#include "internal/model/artifact.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace registry::core {

namespace {

using registry::v1::ENTRY_STATE_PUBLISHED;

} // namespace

UploadCoordinator::UploadCoordinator(std::shared_ptr<catalog::MetadataCatalog> catalog, storage::BlobStorePtr blobs,
                                     std::shared_ptr<InflightHashes> inflight, util::RetryPolicy retry)
    : catalog_(std::move(catalog)),
      blobs_(std::move(blobs)),
      inflight_(inflight ? std::move(inflight) : std::make_shared<InflightHashes>()),
      retry_(retry) {
}

PublishResult UploadCoordinator::Publish(const PublishRequest& raw, storage::ByteSource& source) {
  PublishRequest request = raw;
  request.name           = model::NormalizeName(raw.name);
  request.version        = model::NormalizeVersion(raw.version);
  request.declared_hash  = util::NormalizeContentHash(raw.declared_hash);

  observability::SpanScope span("registry.publish");
  span.SetArtifact(request.name, request.version);
  span.SetContentHash(request.declared_hash);
  span.SetAttribute(observability::attr::kSizeBytes, static_cast<int64_t>(request.declared_size));

  auto inflight_guard = inflight_->Register(request.declared_hash);

  auto reservation = util::RetryTransient(retry_, "begin_publish", [&] {
    return catalog_->BeginPublish(request.name, request.version, request.declared_size, request.declared_hash, request.uploader);
  });
  span.SetEntryId(reservation.entry_id);

  std::optional<storage::StagedBlob> staged;
  try {
    staged.emplace(blobs_->Stage(source));
  } catch (const util::TransientStorageError& e) {
    // Storage IO failed mid-write: the reconciler frees the slot.
    REGISTRY_LOG_WARN("publish staging failed, pending row left for reconciliation",
                      {observability::ArtifactField(request.name, request.version), observability::EntryField(reservation.entry_id),
                       observability::ErrorField(e.what())});
    span.RecordException(e.what());
    throw;
  } catch (const util::Cancelled& e) {
    AbortOwned(reservation, "cancelled");
    span.RecordException(e.what());
    throw;
  } catch (const std::exception& e) {
    REGISTRY_LOG_WARN("publish stream rejected", {observability::ArtifactField(request.name, request.version),
                                                  observability::EntryField(reservation.entry_id),
                                                  observability::ErrorField(e.what())});
    AbortOwned(reservation, "stream rejected");
    span.RecordException(e.what());
    throw;
  }

  if (staged->ContentHash() != request.declared_hash || staged->SizeBytes() != request.declared_size) {
    const auto message = "declared " + request.declared_hash + " (" + std::to_string(request.declared_size) + " bytes), received " +
                         staged->ContentHash() + " (" + std::to_string(staged->SizeBytes()) + " bytes)";
    REGISTRY_LOG_ERROR("publish integrity failure",
                       {observability::ArtifactField(request.name, request.version), observability::ErrorField(message)});
    staged->Discard();
    AbortOwned(reservation, "integrity failure");
    span.RecordException(message);
    throw util::IntegrityError(message);
  }

  if (reservation.state == ENTRY_STATE_PUBLISHED) {
    REGISTRY_LOG_INFO("artifact already published", {observability::ArtifactField(request.name, request.version),
                                                      observability::EntryField(reservation.entry_id)});
    return PublishResult{reservation.entry_id, false};
  }

  try {
    util::RetryTransient(retry_, "promote", [&] { blobs_->Promote(*staged); });
    return Commit(std::move(reservation), request);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw;
  }
}

PublishResult UploadCoordinator::Commit(catalog::Reservation reservation, const PublishRequest& request) {
  for (int round = 0;; ++round) {
    try {
      util::RetryTransient(retry_, "commit_publish", [&] { return catalog_->CommitPublish(reservation.entry_id); });
      REGISTRY_LOG_INFO("artifact published", {observability::ArtifactField(request.name, request.version),
                                                observability::EntryField(reservation.entry_id),
                                                observability::HashField(request.declared_hash),
                                                observability::BytesField(request.declared_size)});
      return PublishResult{reservation.entry_id, reservation.created};
    } catch (const util::InvalidState&) {
      // Another publisher of the same content committed the row first.
      auto entry = catalog_->GetEntry(reservation.entry_id);
      if (entry && entry->state == ENTRY_STATE_PUBLISHED && entry->content_hash == request.declared_hash) {
        return PublishResult{reservation.entry_id, reservation.created};
      }
      throw;
    } catch (const util::NotFound&) {
      // The other publisher's pending row went away; the blob is already promoted, so reserve again.
      if (reservation.created || round > 0) throw;
      reservation = util::RetryTransient(retry_, "begin_publish", [&] {
        return catalog_->BeginPublish(request.name, request.version, request.declared_size, request.declared_hash, request.uploader);
      });
      if (reservation.state == ENTRY_STATE_PUBLISHED) return PublishResult{reservation.entry_id, false};
    }
  }
}

void UploadCoordinator::AbortOwned(const catalog::Reservation& reservation, const std::string& why) {
  if (!reservation.created) return;
  try {
    catalog_->AbortPublish(reservation.entry_id);
  } catch (const std::exception& e) {
    REGISTRY_LOG_WARN("abort failed, pending row left for reconciliation",
                      {observability::EntryField(reservation.entry_id), observability::StringField("reason", why),
                       observability::ErrorField(e.what())});
  }
}

} // namespace registry::core
