#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/background/background_pool.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using fleet::runtime::Server;

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
    std::cerr << "Usage: fleet-control <config.yaml> OR fleet-control --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeLogging(config, "fleet-control");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fleet::factory::Build(config);

    if (config.ingest().mode() == fleet::runtime::config::INGEST_MODE_STANDALONE) {
      FLEET_LOG_INFO("Ingestion served by fleet-ingest", {fleet::observability::StringField("ingest_address", config.ingest().bind_address())});
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.scheduler_loop->Start();
    FLEET_LOG_INFO("Fleet control started", {fleet::observability::StringField("bind_address", config.server().bind_address()),
                                             fleet::observability::UintField("sweep_interval_sec", config.scheduler().sweep_interval_sec())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEET_LOG_INFO("Shutting down fleet control");

    app.scheduler_loop->Stop();
    server.Stop();
    fleet::background::ShutdownBackgroundPool();
    fleet::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
    fleet::background::ShutdownBackgroundPool();
    fleet::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
