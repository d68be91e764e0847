#pragma once

#include "config/config.pb.h"
#include "internal/enrich/enricher.hpp"
#include "internal/enrich/port_scanner.hpp"
#include "internal/retention/retention_policy.hpp"
#include "internal/scan/batch_scheduler.hpp"
#include "internal/scan/probe_executor.hpp"
#include "internal/scheduler/scan_scheduler_worker.hpp"

namespace netsweep::config {

/*
  RuntimeConfig -> component options.

  Absent values take the component defaults; values that cannot work
  (zero concurrency, a scheduler with no ranges, ...) throw
  util::ValidationError.
*/

inline constexpr uint32_t kMaxConcurrency = 256;

scan::BatchOptions ResolveBatchOptions(const netsweep::runtime::config::RuntimeConfig& config);

scan::ProbeOptions ResolveProbeOptions(const netsweep::runtime::config::RuntimeConfig& config);

enrich::EnrichmentOptions ResolveEnrichmentOptions(const netsweep::runtime::config::RuntimeConfig& config);

enrich::PortScanOptions ResolvePortScanOptions(const netsweep::runtime::config::RuntimeConfig& config);

retention::RetentionPolicy ResolveRetentionPolicy(const netsweep::runtime::config::RuntimeConfig& config);

scheduler::SchedulerOptions ResolveSchedulerOptions(const netsweep::runtime::config::RuntimeConfig& config);

// Checks every section at once so a bad file fails at startup.
void ValidateRuntimeConfig(const netsweep::runtime::config::RuntimeConfig& config);

} // namespace netsweep::config
