#include "maintenance_worker.hpp"

#include "internal/observability/logging.hpp"

namespace registry::gc {

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<PendingReconciler> reconciler, std::shared_ptr<catalog::MetadataCatalog> catalog,
                                     std::shared_ptr<GarbageCollector> collector, std::shared_ptr<util::Clock> clock,
                                     MaintenanceOptions options)
    : reconciler_(std::move(reconciler)),
      catalog_(std::move(catalog)),
      collector_(std::move(collector)),
      clock_(clock ? std::move(clock) : std::make_shared<util::WallClock>()),
      options_(options) {
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  {
    std::lock_guard lock(mutex_);
    if (thread_.joinable()) return;
    stop_ = false;
  }
  thread_ = std::thread(&MaintenanceWorker::Run, this);
  REGISTRY_LOG_INFO("maintenance worker started",
                    {observability::IntField("interval_ms", static_cast<int64_t>(options_.interval.count()))});
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

registry::v1::GcReport MaintenanceWorker::RunOnce() {
  std::lock_guard lock(cycle_mutex_);
  reconciler_->Run();
  return CollectLocked();
}

registry::v1::GcReport MaintenanceWorker::Collect() {
  std::lock_guard lock(cycle_mutex_);
  return CollectLocked();
}

uint32_t MaintenanceWorker::Reconcile() {
  std::lock_guard lock(cycle_mutex_);
  return reconciler_->Run();
}

registry::v1::GcReport MaintenanceWorker::CollectLocked() {
  uint32_t purged = 0;
  if (options_.deleted_retention.count() > 0) {
    purged = catalog_->PurgeDeleted(clock_->Now() - options_.deleted_retention);
  }
  auto report = collector_->Run();
  report.set_entries_purged(purged);
  return report;
}

void MaintenanceWorker::Run() {
  std::unique_lock lock(mutex_);
  while (!stop_) {
    if (cv_.wait_for(lock, options_.interval, [this] { return stop_; })) break;

    lock.unlock();
    try {
      RunOnce();
    } catch (const std::exception& e) {
      REGISTRY_LOG_ERROR("maintenance cycle failed", {observability::ErrorField(e.what())});
    }
    lock.lock();
  }
}

} // namespace registry::gc
