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

using roster::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  roster::observability::ShutdownLogging();
  roster::observability::ShutdownMetrics();
  roster::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: roster-ledger <config.yaml> OR roster-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = roster::config::ConfigLoader::LoadFromYaml(config_path);

    roster::observability::InitializeTracing(config);
    roster::observability::InitializeMetrics(config);
    roster::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = roster::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (config.claim_processing().scheduler_enabled()) {
      app.scheduler->Start();
    }
    ROSTER_LOG_INFO("Roster ledger started", {roster::observability::StringField("bind_address", config.server().bind_address()),
                                              roster::observability::BoolField("scheduler", config.claim_processing().scheduler_enabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROSTER_LOG_INFO("Shutting down roster ledger");

    app.scheduler->Stop();
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ROSTER_LOG_ERROR("Fatal error", {roster::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
