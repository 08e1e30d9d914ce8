#pragma once

#include "registry/v1/registry_service.pb.h"
#include "registry/v1/types.pb.h"
#include "service_context.hpp"

namespace registry::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  registry::v1::GcReport RunGarbageCollection();

  registry::v1::ReconcileResponse ReconcilePending();

  registry::v1::PurgeResponse Purge(const registry::v1::PurgeRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace registry::service
