#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/coverage_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using stpa::runtime::Server;

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
    std::cerr << "Usage: stpa-coverage-server <config.yaml> OR stpa-coverage-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = stpa::config::ConfigLoader::LoadFromYaml(config_path);

    stpa::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = stpa::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<stpa::grpc::CoverageServer>(app.coverage_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061")
                                                                     : config.server().bind_address();
    Server server(bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    STPA_LOG_INFO("Coverage server started", {stpa::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STPA_LOG_INFO("Shutting down coverage server",
                  {stpa::observability::IntField("open_sessions", static_cast<std::int64_t>(app.sessions->size()))});

    server.Stop();
    stpa::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    STPA_LOG_ERROR("Fatal error", {stpa::observability::StringField("error", e.what())});
    stpa::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
