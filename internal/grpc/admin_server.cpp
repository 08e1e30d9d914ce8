#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace registry::grpc {

AdminServer::AdminServer(std::shared_ptr<registry::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::RunGarbageCollection(::grpc::ServerContext*, const google::protobuf::Empty*, registry::v1::GcReport* resp) {
  try {
    *resp = service_->RunGarbageCollection();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ReconcilePending(::grpc::ServerContext*, const google::protobuf::Empty*,
                                             registry::v1::ReconcileResponse* resp) {
  try {
    *resp = service_->ReconcilePending();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Purge(::grpc::ServerContext*, const registry::v1::PurgeRequest* req, registry::v1::PurgeResponse* resp) {
  try {
    *resp = service_->Purge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace registry::grpc
