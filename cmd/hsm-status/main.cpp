#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/sweep_worker.hpp"
#if HSM_STATUS_ENABLE_GRPC
#include "internal/runtime/server.hpp"
#endif

using hsm::factory::Build;
using hsm::observability::StringField;
using hsm::observability::UIntField;
using hsm::runtime::SweepWorker;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  hsm::observability::ShutdownLogging();
  hsm::observability::ShutdownMetrics();
  hsm::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: hsm-status <config.yaml> OR hsm-status --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = hsm::config::ConfigLoader::LoadFromYaml(config_path);

    hsm::observability::InitializeTracing(config);
    hsm::observability::InitializeMetrics(config);
    hsm::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting anything to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

#if HSM_STATUS_ENABLE_GRPC
    hsm::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    HSM_LOG_INFO("HSM status server started", {StringField("bind_address", config.server().bind_address())});
#else
    HSM_LOG_WARN("Built without gRPC; running the reconciliation sweep only");
#endif

    // ------------------------------------------------------------
    // Periodic reconciliation
    // ------------------------------------------------------------
    std::unique_ptr<SweepWorker> sweeper;
    const auto                   interval = config.sweep().interval_seconds();
    if (interval > 0) {
      sweeper = std::make_unique<SweepWorker>(app.status_service, std::chrono::seconds(interval));
      sweeper->Start();
      HSM_LOG_INFO("Reconciliation sweep scheduled", {UIntField("interval_seconds", interval)});
    }

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    HSM_LOG_INFO("Shutting down HSM status service");

    if (sweeper) sweeper->Stop();
#if HSM_STATUS_ENABLE_GRPC
    server.Stop();
#endif
    ShutdownObservability();
  } catch (const std::exception& e) {
    HSM_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
