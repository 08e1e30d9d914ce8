#pragma once

#include <memory>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/inflight_hashes.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/util/time.hpp"
#include "registry/v1/types.pb.h"

namespace registry::gc {

struct GcOptions {
  // Blobs modified more recently than this are never deleted.
  util::Duration blob_grace_period{std::chrono::hours(1)};
  // Age after which an abandoned staging file is removed.
  util::Duration staging_grace_period{std::chrono::hours(1)};
};

/*
  Mark and sweep over the blob store.

  Order matters:
    1. enumerate blobs
    2. snapshot referenced hashes from the catalog
    3. for each unreferenced, old enough blob: with the in-flight registry
       locked, re-check the catalog and delete

  Every blob seen in step 1 existed before the snapshot in step 2, so a
  publish committed after the snapshot always finds its blob in step 3's
  re-check or holds it in the in-flight registry.
*/
class GarbageCollector {
 public:
  GarbageCollector(std::shared_ptr<catalog::MetadataCatalog> catalog, storage::BlobStorePtr blobs,
                   std::shared_ptr<core::InflightHashes> inflight, std::shared_ptr<util::Clock> clock, GcOptions options);

  registry::v1::GcReport Run();

 private:
  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  storage::BlobStorePtr                     blobs_;
  std::shared_ptr<core::InflightHashes>     inflight_;
  std::shared_ptr<util::Clock>              clock_;
  GcOptions                                 options_;
};

} // namespace registry::gc
