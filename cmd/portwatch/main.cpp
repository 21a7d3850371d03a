#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/collector/collector_worker.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#if PORTWATCH_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

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
    std::cerr << "Usage: portwatch <config.yaml> OR portwatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = portwatch::config::ConfigLoader::LoadFromYaml(config_path);

    portwatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = portwatch::factory::Build(config);

    // Register signal handlers before starting anything to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.collector->Start();

#if PORTWATCH_WITH_GRPC
    portwatch::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
#else
    PORTWATCH_LOG_WARN("built without gRPC code generation; running the collector only");
#endif

    PORTWATCH_LOG_INFO("portwatch started", {portwatch::observability::StringField("host_id", config.collector().host_id()),
                                             portwatch::observability::IntField("interval_seconds", config.collector().interval_seconds())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    PORTWATCH_LOG_INFO("shutting down portwatch");

#if PORTWATCH_WITH_GRPC
    server.Stop();
#endif
    app.collector->Stop();
    portwatch::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PORTWATCH_LOG_ERROR("fatal error", {portwatch::observability::StringField("error", e.what())});
    portwatch::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
