#include "server.hpp"

#include <grpcpp/resource_quota.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace registry::runtime {

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port_);

  if (options_.worker_threads > 0) {
    ::grpc::ResourceQuota quota("potato-registry");
    quota.SetMaxThreads(options_.worker_threads);
    builder.SetResourceQuota(quota);
  }
  if (options_.max_message_size_bytes > 0) {
    builder.SetMaxReceiveMessageSize(options_.max_message_size_bytes);
    builder.SetMaxSendMessageSize(options_.max_message_size_bytes);
  }

  // Register gRPC services (thin adapters)
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  REGISTRY_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", options_.bind_address),
                                              observability::IntField("port", selected_port_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace registry::runtime
