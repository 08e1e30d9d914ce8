#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "registry/v1/registry_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace registry::grpc {

class AdminServer final : public registry::v1::RegistryAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<registry::service::AdminService> svc);

  ::grpc::Status RunGarbageCollection(::grpc::ServerContext*,
                                      const google::protobuf::Empty*,
                                      registry::v1::GcReport*) override;

  ::grpc::Status ReconcilePending(::grpc::ServerContext*,
                                  const google::protobuf::Empty*,
                                  registry::v1::ReconcileResponse*) override;

  ::grpc::Status Purge(::grpc::ServerContext*,
                       const registry::v1::PurgeRequest*,
                       registry::v1::PurgeResponse*) override;

private:
  std::shared_ptr<registry::service::AdminService> service_;
};

} // namespace registry::grpc
