#include "pending_reconciler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace registry::gc {

PendingReconciler::PendingReconciler(std::shared_ptr<catalog::MetadataCatalog> catalog, std::shared_ptr<util::Clock> clock,
                                     util::Duration pending_timeout)
    : catalog_(std::move(catalog)), clock_(clock ? std::move(clock) : std::make_shared<util::WallClock>()), pending_timeout_(pending_timeout) {
}

uint32_t PendingReconciler::Run() {
  observability::SpanScope span("registry.reconcile");

  uint32_t aborted = 0;
  for (const auto& entry : catalog_->ListStalePending(clock_->Now() - pending_timeout_)) {
    try {
      catalog_->AbortPublish(entry.id);
      ++aborted;
      REGISTRY_LOG_INFO("stale pending entry aborted", {observability::EntryField(entry.id),
                                                        observability::ArtifactField(entry.name, entry.version),
                                                        observability::HashField(entry.content_hash)});
    } catch (const util::InvalidState&) {
      REGISTRY_LOG_DEBUG("pending entry committed before reconciliation", {observability::EntryField(entry.id)});
    } catch (const util::NotFound&) {
      REGISTRY_LOG_DEBUG("pending entry already gone", {observability::EntryField(entry.id)});
    }
  }

  span.SetAttribute("aborted", static_cast<int64_t>(aborted));
  return aborted;
}

} // namespace registry::gc
