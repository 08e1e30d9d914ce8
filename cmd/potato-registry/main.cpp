#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using registry::factory::Build;
using registry::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Shutdown() {
  registry::observability::ShutdownLogging();
  registry::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: potato-registry <config.yaml> OR potato-registry --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = registry::config::ConfigLoader::LoadFromYaml(config_path);

    registry::observability::InitializeTracing(config);
    registry::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    app.catalog->HydrateCache();

    // Rows left pending by a previous process are aborted before serving.
    const auto aborted = app.maintenance->Reconcile();
    if (aborted > 0) {
      REGISTRY_LOG_INFO("aborted stale pending entries", {registry::observability::IntField("count", aborted)});
    }

    if (!config.gc().disabled()) {
      app.maintenance->Start();
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    registry::runtime::ServerOptions options;
    options.bind_address           = config.server().bind_address();
    options.worker_threads         = static_cast<int>(config.server().worker_threads());
    options.max_message_size_bytes = static_cast<int>(config.server().max_message_size_bytes());

    Server server(options, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    REGISTRY_LOG_INFO("potato registry started", {registry::observability::StringField("bind_address", options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REGISTRY_LOG_INFO("shutting down potato registry");

    server.Stop();
    app.maintenance->Stop();
    Shutdown();
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("Fatal error", {registry::observability::ErrorField(e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
