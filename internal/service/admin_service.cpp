#include "admin_service.hpp"

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/gc/maintenance_worker.hpp"
#include "traced_call.hpp"

namespace registry::service {

using namespace registry::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GcReport AdminService::RunGarbageCollection() {
  return TracedCall("AdminService.RunGarbageCollection", [&](observability::SpanScope&) { return ctx_.maintenance->Collect(); });
}

ReconcileResponse AdminService::ReconcilePending() {
  return TracedCall("AdminService.ReconcilePending", [&](observability::SpanScope&) {
    ReconcileResponse resp;
    resp.set_aborted(ctx_.maintenance->Reconcile());
    return resp;
  });
}

PurgeResponse AdminService::Purge(const PurgeRequest& req) {
  return TracedCall("AdminService.Purge", [&](observability::SpanScope& span) {
    span.SetArtifact(req.name(), req.version());
    PurgeResponse resp;
    resp.set_purged(ctx_.catalog->Purge(req.name(), req.version()));
    return resp;
  });
}

} // namespace registry::service
