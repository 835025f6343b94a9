#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/rollout_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using rollout::runtime::Server;

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
    std::cerr << "Usage: rollout-manager <config.yaml> OR rollout-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rollout::config::ConfigLoader::LoadFromYaml(config_path);

    rollout::observability::InitializeTracing(config);
    rollout::observability::InitializeMetrics(config);
    rollout::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto engine = rollout::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<rollout::grpc::RolloutServer>(engine.rollout_service));
    services.push_back(std::make_unique<rollout::grpc::AdminServer>(engine.admin_service));

    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    engine.Start();
    server.Start();
    ROLLOUT_LOG_INFO("Rollout Manager started", {rollout::observability::StringField("bind_address", config.server().bind_address()),
                                                 rollout::observability::StringField("controller_id", engine.controller->Options().controller_id)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROLLOUT_LOG_INFO("Shutting down rollout manager");

    server.Stop();
    engine.Stop();
    rollout::observability::ShutdownLogging();
    rollout::observability::ShutdownMetrics();
    rollout::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ROLLOUT_LOG_ERROR("Fatal error", {rollout::observability::StringField("error", e.what())});
    rollout::observability::ShutdownLogging();
    rollout::observability::ShutdownMetrics();
    rollout::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
