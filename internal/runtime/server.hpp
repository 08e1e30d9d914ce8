#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace registry::runtime {

struct ServerOptions {
  std::string bind_address = "0.0.0.0:50051";
  // 0 leaves gRPC's default thread limit in place
  int worker_threads = 0;
  // 0 leaves gRPC's default message size limits in place
  int max_message_size_bytes = 0;
};

class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one when it asked for 0.
  int SelectedPort() const { return selected_port_; }

private:
  ServerOptions options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace registry::runtime
