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

using heroes::factory::Build;
using heroes::runtime::Server;

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
    std::cerr << "Usage: hero-registry <config.yaml> OR hero-registry --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = heroes::config::ConfigLoader::LoadFromYaml(config_path);

    heroes::observability::InitializeTracing(config);
    heroes::observability::InitializeMetrics(config);
    heroes::observability::InitializeLogging(config);

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
    HEROES_LOG_INFO("hero registry started", {heroes::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    HEROES_LOG_INFO("Shutting down hero registry");

    server.Stop();
    heroes::observability::ShutdownLogging();
    heroes::observability::ShutdownMetrics();
    heroes::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    HEROES_LOG_ERROR("Fatal error", {heroes::observability::StringField("error", e.what())});
    heroes::observability::ShutdownLogging();
    heroes::observability::ShutdownMetrics();
    heroes::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
