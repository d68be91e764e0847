#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/retention/retention_worker.hpp"
#include "internal/scheduler/scan_scheduler_worker.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  netsweep::observability::ShutdownLogging();
  netsweep::observability::ShutdownMetrics();
  netsweep::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: netsweep <config.yaml> OR netsweep --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = netsweep::config::ConfigLoader::LoadFromYaml(config_path);

    netsweep::observability::InitializeTracing(config);
    netsweep::observability::InitializeMetrics(config);
    netsweep::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto rt = netsweep::factory::BuildRuntime(config);

    const auto& oui_file = config.enrichment().oui_file();
    if (!oui_file.empty()) {
      try {
        rt.maintenance_service->ImportVendors(oui_file);
      } catch (const std::exception& e) {
        // built-in vendor table still applies
        NETSWEEP_LOG_WARN("vendor import skipped", {netsweep::observability::StringField("path", oui_file),
                                                    netsweep::observability::StringField("error", e.what())});
      }
    }

    // ------------------------------------------------------------
    // Background workers
    // ------------------------------------------------------------
    netsweep::scheduler::ScanSchedulerWorker scan_worker(rt.scan_service, rt.scheduler_options);
    netsweep::retention::RetentionWorker     retention_worker(rt.retention);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    scan_worker.Start();
    retention_worker.Start();
    NETSWEEP_LOG_INFO("netsweep started", {netsweep::observability::BoolField("scheduler", rt.scheduler_options.enabled),
                                           netsweep::observability::IntField("ranges", static_cast<int64_t>(rt.scheduler_options.ranges.size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    NETSWEEP_LOG_INFO("Shutting down netsweep");

    scan_worker.Stop();
    retention_worker.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    NETSWEEP_LOG_ERROR("Fatal error", {netsweep::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
