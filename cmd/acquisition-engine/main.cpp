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

using acquisition::factory::Build;
using acquisition::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: acquisition-engine <config.yaml> OR acquisition-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = acquisition::config::ConfigLoader::LoadFromYaml(config_path);

    acquisition::observability::InitializeTracing(config);
    acquisition::observability::InitializeMetrics(config);
    acquisition::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ACQUISITION_LOG_INFO("Acquisition engine started", {acquisition::observability::StringField("bind_address", config.server().bind_address()),
                                                        acquisition::observability::IntField("backends", config.backends_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ACQUISITION_LOG_INFO("Shutting down acquisition engine");

    server.Stop();
    app.orchestrator->Stop();
    acquisition::observability::ShutdownLogging();
    acquisition::observability::ShutdownMetrics();
    acquisition::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ACQUISITION_LOG_ERROR("Fatal error", {acquisition::observability::StringField("error", e.what())});
    acquisition::observability::ShutdownLogging();
    acquisition::observability::ShutdownMetrics();
    acquisition::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
