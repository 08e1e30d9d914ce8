#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "registry/v1/registry_service.grpc.pb.h"
#include "internal/service/registry_service.hpp"

namespace registry::grpc {

/*
  gRPC adapter for RegistryService.

  Publish is client-streaming: header first, then chunks.
  Fetch is server-streaming: descriptor first, then chunks.
*/
class RegistryServer final : public registry::v1::RegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<registry::service::RegistryService> svc);

  ::grpc::Status Publish(::grpc::ServerContext*,
                         ::grpc::ServerReader<registry::v1::PublishRequest>*,
                         registry::v1::PublishResponse*) override;

  ::grpc::Status Fetch(::grpc::ServerContext*,
                       const registry::v1::FetchRequest*,
                       ::grpc::ServerWriter<registry::v1::FetchResponse>*) override;

  ::grpc::Status Delete(::grpc::ServerContext*,
                        const registry::v1::DeleteRequest*,
                        google::protobuf::Empty*) override;

  ::grpc::Status DeletePackage(::grpc::ServerContext*,
                               const registry::v1::DeletePackageRequest*,
                               registry::v1::DeletePackageResponse*) override;

  ::grpc::Status ListVersions(::grpc::ServerContext*,
                              const registry::v1::ListVersionsRequest*,
                              registry::v1::ListVersionsResponse*) override;

  ::grpc::Status ListPackages(::grpc::ServerContext*,
                              const google::protobuf::Empty*,
                              registry::v1::ListPackagesResponse*) override;

private:
  std::shared_ptr<registry::service::RegistryService> service_;
};

} // namespace registry::grpc
