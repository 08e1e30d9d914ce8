#include "garbage_collector.hpp"

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace registry::gc {

GarbageCollector::GarbageCollector(std::shared_ptr<catalog::MetadataCatalog> catalog, storage::BlobStorePtr blobs,
                                   std::shared_ptr<core::InflightHashes> inflight, std::shared_ptr<util::Clock> clock, GcOptions options)
    : catalog_(std::move(catalog)),
      blobs_(std::move(blobs)),
      inflight_(std::move(inflight)),
      clock_(clock ? std::move(clock) : std::make_shared<util::WallClock>()),
      options_(options) {
}

registry::v1::GcReport GarbageCollector::Run() {
  observability::SpanScope span("registry.gc");
  registry::v1::GcReport   report;

  const auto now   = clock_->Now();
  const auto blobs = blobs_->List();

  const auto                            hashes = catalog_->ListReferencedHashes();
  const std::unordered_set<std::string> referenced(hashes.begin(), hashes.end());

  for (const auto& blob : blobs) {
    report.set_scanned(report.scanned() + 1);

    if (referenced.contains(blob.content_hash)) {
      report.set_skipped_referenced(report.skipped_referenced() + 1);
      continue;
    }
    if (blob.modified_at + options_.blob_grace_period > now) {
      report.set_skipped_young(report.skipped_young() + 1);
      continue;
    }

    bool removed          = false;
    bool still_referenced = false;
    try {
      const bool idle = inflight_->RunIfIdle(blob.content_hash, [&] {
        if (catalog_->IsHashReferenced(blob.content_hash)) {
          still_referenced = true;
          return;
        }
        removed = blobs_->Delete(blob.content_hash);
      });
      if (!idle) still_referenced = true;
    } catch (const std::exception& e) {
      REGISTRY_LOG_WARN("blob collection failed",
                        {observability::HashField(blob.content_hash), observability::ErrorField(e.what())});
      continue;
    }

    if (still_referenced) {
      report.set_skipped_referenced(report.skipped_referenced() + 1);
      continue;
    }
    if (removed) {
      report.set_deleted(report.deleted() + 1);
      report.set_bytes_reclaimed(report.bytes_reclaimed() + blob.size_bytes);
      REGISTRY_LOG_INFO("blob collected", {observability::HashField(blob.content_hash),
                                           observability::BytesField(blob.size_bytes)});
    }
  }

  report.set_staging_removed(blobs_->SweepStaging(now - options_.staging_grace_period));

  span.SetAttribute("scanned", static_cast<int64_t>(report.scanned()));
  span.SetAttribute("deleted", static_cast<int64_t>(report.deleted()));
  REGISTRY_LOG_INFO("garbage collection finished",
                    {observability::IntField("scanned", static_cast<int64_t>(report.scanned())),
                     observability::IntField("deleted", static_cast<int64_t>(report.deleted())),
                     observability::IntField("bytes_reclaimed", static_cast<int64_t>(report.bytes_reclaimed())),
                     observability::IntField("skipped_young", static_cast<int64_t>(report.skipped_young())),
                     observability::IntField("skipped_referenced", static_cast<int64_t>(report.skipped_referenced())),
                     observability::IntField("staging_removed", static_cast<int64_t>(report.staging_removed()))});
  return report;
}

} // namespace registry::gc
