#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/gc/garbage_collector.hpp"
#include "internal/gc/pending_reconciler.hpp"
#include "registry/v1/types.pb.h"

namespace registry::gc {

struct MaintenanceOptions {
  util::Duration interval{std::chrono::minutes(5)};
  // Zero keeps deleted rows forever.
  util::Duration deleted_retention{0};
};

/*
  Background worker that keeps the catalog and blob store consistent.

  Each cycle:
      reconcile stale pending rows
      purge deleted rows past retention
      collect unreferenced blobs

  Cycles never overlap, whether started by the timer or by an admin call.
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<PendingReconciler> reconciler, std::shared_ptr<catalog::MetadataCatalog> catalog,
                    std::shared_ptr<GarbageCollector> collector, std::shared_ptr<util::Clock> clock, MaintenanceOptions options);
  ~MaintenanceWorker();

  void Start();
  void Stop();

  registry::v1::GcReport RunOnce();

  // Purge + collection without reconciliation.
  registry::v1::GcReport Collect();

  uint32_t Reconcile();

 private:
  void Run();

  registry::v1::GcReport CollectLocked();

  std::shared_ptr<PendingReconciler>        reconciler_;
  std::shared_ptr<catalog::MetadataCatalog> catalog_;
  std::shared_ptr<GarbageCollector>         collector_;
  std::shared_ptr<util::Clock>              clock_;
  MaintenanceOptions                        options_;

  std::mutex cycle_mutex_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_ = false;
  std::thread             thread_;
};

} // namespace registry::gc
