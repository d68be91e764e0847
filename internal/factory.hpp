#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/scheduler/scan_scheduler_worker.hpp"
#include "internal/service/inventory_service.hpp"
#include "internal/service/maintenance_service.hpp"
#include "internal/service/monitoring_service.hpp"
#include "internal/service/scan_service.hpp"
#include "internal/util/command_runner.hpp"
#include "internal/util/time.hpp"

namespace netsweep::factory {

/*
  Runtime

  Owns all long-lived objects of the daemon or a CLI invocation.
  Background workers are not started here; the daemon owns them.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<util::Clock>    clock;

  std::shared_ptr<retention::RetentionManager> retention;

  std::shared_ptr<service::ScanService>        scan_service;
  std::shared_ptr<service::InventoryService>   inventory_service;
  std::shared_ptr<service::MaintenanceService> maintenance_service;
  std::shared_ptr<service::MonitoringService>  monitoring_service;

  scheduler::SchedulerOptions scheduler_options;
};

// Opens the configured backend and applies the bootstrap schema.
std::shared_ptr<db::Repository> BuildRepository(const netsweep::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root. The only place that knows concrete DB, prober and
  resolver types. runner defaults to a ProcessCommandRunner.
*/
Runtime BuildRuntime(const netsweep::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock = util::DefaultClock(),
                     std::shared_ptr<util::CommandRunner> runner = nullptr);

} // namespace netsweep::factory
