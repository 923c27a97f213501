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

using datastream::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  datastream::observability::ShutdownLogging();
  datastream::observability::ShutdownMetrics();
  datastream::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: datastream-store <config.yaml> OR datastream-store --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = datastream::config::ConfigLoader::LoadFromYaml(config_path);

    datastream::observability::InitializeTracing(config);
    datastream::observability::InitializeMetrics(config);
    datastream::observability::InitializeLogging(config);

    auto app = datastream::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    DATASTREAM_LOG_INFO("datastream store started", {datastream::observability::StringField("cluster", config.cluster().name()),
                                                     datastream::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DATASTREAM_LOG_INFO("Shutting down datastream store");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    DATASTREAM_LOG_ERROR("Fatal error", {datastream::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
