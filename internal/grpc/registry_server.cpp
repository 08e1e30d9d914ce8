#include "registry_server.hpp"

#include <stdexcept>

#include "grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace registry::grpc {

namespace {

/*
  Publish chunks pulled from the client stream.
*/
class ClientStreamSource final : public registry::storage::ByteSource {
public:
  ClientStreamSource(::grpc::ServerContext* ctx, ::grpc::ServerReader<registry::v1::PublishRequest>* reader)
      : ctx_(ctx), reader_(reader) {}

  bool Next(std::shared_ptr<arrow::Buffer>* chunk) override {
    registry::v1::PublishRequest msg;
    while (reader_->Read(&msg)) {
      if (msg.has_header()) throw std::invalid_argument("publish header sent twice");
      if (msg.chunk().empty()) continue;
      *chunk = arrow::Buffer::FromString(std::move(*msg.mutable_chunk()));
      return true;
    }
    if (ctx_->IsCancelled()) throw registry::util::Cancelled("client cancelled the upload");
    return false;
  }

private:
  ::grpc::ServerContext* ctx_;
  ::grpc::ServerReader<registry::v1::PublishRequest>* reader_;
};

} // namespace

RegistryServer::RegistryServer(std::shared_ptr<registry::service::RegistryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistryServer::Publish(::grpc::ServerContext* ctx,
                                       ::grpc::ServerReader<registry::v1::PublishRequest>* reader,
                                       registry::v1::PublishResponse* resp) {
  try {
    registry::v1::PublishRequest first;
    if (!reader->Read(&first) || !first.has_header()) {
      return {::grpc::StatusCode::INVALID_ARGUMENT, "publish stream must start with a header"};
    }
    ClientStreamSource source(ctx, reader);
    *resp = service_->Publish(first.header(), source);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Fetch(::grpc::ServerContext* ctx,
                                     const registry::v1::FetchRequest* req,
                                     ::grpc::ServerWriter<registry::v1::FetchResponse>* writer) {
  try {
    auto stream = service_->Fetch(*req);

    registry::v1::FetchResponse head;
    *head.mutable_descriptor() = registry::service::RegistryService::Describe(stream->Entry());
    if (!writer->Write(head)) return {::grpc::StatusCode::CANCELLED, "client went away"};

    std::shared_ptr<arrow::Buffer> chunk;
    while (stream->Next(&chunk)) {
      if (ctx->IsCancelled()) return {::grpc::StatusCode::CANCELLED, "client went away"};
      registry::v1::FetchResponse msg;
      msg.set_chunk(reinterpret_cast<const char*>(chunk->data()), static_cast<size_t>(chunk->size()));
      if (!writer->Write(msg)) return {::grpc::StatusCode::CANCELLED, "client went away"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Delete(::grpc::ServerContext*,
                                      const registry::v1::DeleteRequest* req,
                                      google::protobuf::Empty*) {
  try {
    service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::DeletePackage(::grpc::ServerContext*,
                                             const registry::v1::DeletePackageRequest* req,
                                             registry::v1::DeletePackageResponse* resp) {
  try {
    *resp = service_->DeletePackage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListVersions(::grpc::ServerContext*,
                                            const registry::v1::ListVersionsRequest* req,
                                            registry::v1::ListVersionsResponse* resp) {
  try {
    *resp = service_->ListVersions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListPackages(::grpc::ServerContext*,
                                            const google::protobuf::Empty*,
                                            registry::v1::ListPackagesResponse* resp) {
  try {
    *resp = service_->ListPackages();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace registry::grpc
