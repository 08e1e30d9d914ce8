#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/inflight_hashes.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/util/retry.hpp"

namespace registry::core {

struct PublishRequest {
  std::string name;
  std::string version;
  std::string declared_hash;
  uint64_t    declared_size = 0;
  std::string uploader;
};

struct PublishResult {
  std::string entry_id;
  // true only for the publish whose reservation inserted the catalog entry
  bool created = false;
};

/*
  UploadCoordinator

  Runs a publish as a saga:

    reserve   catalog pending row (Conflict fails fast, no bytes written)
    stage     stream into the blob store while hashing
    verify    computed hash/size against the declared ones
    promote   atomic rename under the hash
    commit    pending -> published

  Transient storage errors in reserve, promote and commit are retried with
  backoff. Anything that fails after the reservation without being an
  integrity error or a cancellation leaves the pending row for the
  reconciler.
*/
class UploadCoordinator {
 public:
  UploadCoordinator(std::shared_ptr<catalog::MetadataCatalog> catalog, storage::BlobStorePtr blobs, std::shared_ptr<InflightHashes> inflight,
                    util::RetryPolicy retry);

  PublishResult Publish(const PublishRequest& request, storage::ByteSource& source);

 private:
  // Abort a row this publish created; failures are logged, never thrown.
  void AbortOwned(const catalog::Reservation& reservation, const std::string& why);

  PublishResult Commit(catalog::Reservation reservation, const PublishRequest& request);

  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  storage::BlobStorePtr                     blobs_;
  std::shared_ptr<InflightHashes>           inflight_;
  util::RetryPolicy                         retry_;
};

} // namespace registry::core
