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
    std::cerr << "Usage: fleet-ingest <config.yaml> OR fleet-ingest --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeLogging(config, "fleet-ingest");

    if (config.ingest().mode() != fleet::runtime::config::INGEST_MODE_STANDALONE) {
      FLEET_LOG_WARN("ingest.mode is embedded; fleet-control also accepts ingestion on its main listener");
    }

    auto app = fleet::factory::BuildIngest(config);

    Server server(config.ingest().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FLEET_LOG_INFO("Fleet ingest started", {fleet::observability::StringField("bind_address", config.ingest().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEET_LOG_INFO("Shutting down fleet ingest");

    // drain in-flight ingests before the pool and logger go away
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
