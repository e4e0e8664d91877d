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

using nsi::runtime::Server;

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
    std::cerr << "Usage: nsi-requester <config.yaml> OR nsi-requester --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = nsi::config::ConfigLoader::LoadFromYaml(config_path);

    nsi::observability::InitializeTracing(config);
    nsi::observability::InitializeMetrics(config);
    nsi::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = nsi::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    NSI_LOG_INFO("NSI requester started", {nsi::observability::StringField("bind_address", config.server().bind_address()),
                                           nsi::observability::StringField("provider_nsa", config.provider().provider_nsa_id())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    NSI_LOG_INFO("Shutting down NSI requester");

    server.Stop();
    for (auto& worker : app.background_workers) worker->Stop();
    nsi::observability::ShutdownMetrics();
    nsi::observability::ShutdownTracing();
    nsi::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    NSI_LOG_ERROR("Fatal error", {nsi::observability::StringField("error", e.what())});
    nsi::observability::ShutdownMetrics();
    nsi::observability::ShutdownTracing();
    nsi::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
