#pragma once

#include <cstdint>
#include <memory>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/util/time.hpp"

namespace registry::gc {

/*
  Aborts pending catalog rows older than the publish timeout.

  A publisher that crashed between reservation and commit leaves a pending
  row behind; aborting it frees the (name, version) slot and leaves the
  blob, if any, unreferenced for the collector.
*/
class PendingReconciler {
 public:
  PendingReconciler(std::shared_ptr<catalog::MetadataCatalog> catalog, std::shared_ptr<util::Clock> clock, util::Duration pending_timeout);

  // Returns the number of rows aborted.
  uint32_t Run();

 private:
  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  std::shared_ptr<util::Clock>              clock_;
  util::Duration                            pending_timeout_;
};

} // namespace registry::gc
