#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/roster_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using roster::runtime::Server;

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
    std::cerr << "Usage: roster-server <config.yaml> OR roster-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = roster::config::ConfigLoader::LoadFromYaml(config_path);

    roster::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = roster::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<roster::grpc::RosterServer>(app.service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
    Server     server(bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ROSTER_LOG_INFO("Roster server started", {roster::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROSTER_LOG_INFO("Shutting down roster server");

    server.Stop();
    roster::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ROSTER_LOG_ERROR("Fatal error", {roster::observability::StringField("error", e.what())});
    roster::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
