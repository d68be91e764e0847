#include "runtime_options.hpp"

#include <string>

#include "internal/scan/range_parser.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netsweep::config {

namespace cfg = netsweep::runtime::config;

scan::BatchOptions ResolveBatchOptions(const cfg::RuntimeConfig& config) {
  scan::BatchOptions options;
  const auto&        scan = config.scan();
  if (scan.has_concurrency()) {
    if (scan.concurrency() == 0 || scan.concurrency() > kMaxConcurrency) {
      throw util::ValidationError("scan.concurrency must be between 1 and " + std::to_string(kMaxConcurrency));
    }
    options.concurrency = scan.concurrency();
  }
  if (scan.has_inter_batch_delay()) {
    const auto& delay = scan.inter_batch_delay();
    if (delay.seconds() < 0 || delay.nanos() < 0) {
      throw util::ValidationError("scan.inter_batch_delay must not be negative");
    }
    options.inter_batch_delay = std::chrono::milliseconds(delay.seconds() * 1000 + delay.nanos() / 1000000);
  }
  return options;
}

scan::ProbeOptions ResolveProbeOptions(const cfg::RuntimeConfig& config) {
  scan::ProbeOptions options;
  const auto&        scan = config.scan();
  if (scan.has_probe_timeout()) {
    options.timeout = util::FromProto(scan.probe_timeout(), options.timeout);
  }
  if (!scan.ping_binary().empty()) {
    options.ping_binary = scan.ping_binary();
  }
  return options;
}

enrich::EnrichmentOptions ResolveEnrichmentOptions(const cfg::RuntimeConfig& config) {
  enrich::EnrichmentOptions options;
  const auto&               enrichment = config.enrichment();

  if (enrichment.has_mac_step_timeout()) {
    options.mac.step_timeout = util::FromProto(enrichment.mac_step_timeout(), options.mac.step_timeout);
  }
  if (!enrichment.neighbor_table_path().empty()) {
    options.mac.neighbor_table_path = enrichment.neighbor_table_path();
  }
  options.mac.arp_scan_enabled   = enrichment.arp_scan_enabled();
  options.mac.arp_scan_interface = enrichment.arp_scan_interface();

  if (enrichment.has_hostname_step_timeout()) {
    options.hostname.step_timeout = util::FromProto(enrichment.hostname_step_timeout(), options.hostname.step_timeout);
  }
  if (!enrichment.hosts_file_path().empty()) {
    options.hostname.hosts_file_path = enrichment.hosts_file_path();
  }
  return options;
}

enrich::PortScanOptions ResolvePortScanOptions(const cfg::RuntimeConfig& config) {
  enrich::PortScanOptions options;
  const auto&             port_scan = config.enrichment().port_scan();

  options.enabled = port_scan.enabled();
  if (!port_scan.port_range().empty()) {
    if (port_scan.port_range().find_first_not_of("0123456789,-") != std::string::npos) {
      throw util::ValidationError("enrichment.port_scan.port_range may only hold ports, ',' and '-'");
    }
    options.port_range = port_scan.port_range();
  }
  options.host_timeout = util::FromProto(port_scan.host_timeout(), options.host_timeout);
  if (port_scan.has_max_hosts()) {
    if (port_scan.max_hosts() == 0) {
      throw util::ValidationError("enrichment.port_scan.max_hosts must be positive");
    }
    options.max_hosts = port_scan.max_hosts();
  }
  if (!port_scan.nmap_binary().empty()) {
    options.nmap_binary = port_scan.nmap_binary();
  }
  return options;
}

retention::RetentionPolicy ResolveRetentionPolicy(const cfg::RuntimeConfig& config) {
  return retention::FromProto(config.retention());
}

scheduler::SchedulerOptions ResolveSchedulerOptions(const cfg::RuntimeConfig& config) {
  scheduler::SchedulerOptions options;
  const auto&                 scheduler = config.scheduler();

  options.enabled = scheduler.enabled();
  options.ranges.assign(scheduler.ranges().begin(), scheduler.ranges().end());
  if (scheduler.mode() == cfg::SCAN_MODE_QUICK) {
    options.mode = netsweep::model::ScanMode::kQuick;
  }
  options.full_scan_interval = util::FromProto(scheduler.full_scan_interval(), options.full_scan_interval);
  options.refresh_interval   = util::FromProto(scheduler.refresh_interval(), options.refresh_interval);

  if (!options.enabled) {
    return options;
  }
  if (options.ranges.empty()) {
    throw util::ValidationError("scheduler.ranges must not be empty when the scheduler is enabled");
  }
  for (const auto& range : options.ranges) {
    scan::ParseRange(range);
  }
  return options;
}

void ValidateRuntimeConfig(const cfg::RuntimeConfig& config) {
  ResolveBatchOptions(config);
  ResolveProbeOptions(config);
  ResolveEnrichmentOptions(config);
  ResolvePortScanOptions(config);
  ResolveRetentionPolicy(config);
  ResolveSchedulerOptions(config);

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::ValidationError("database.sqlite.path must be set");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::ValidationError("database.postgres.connection_uri must be set");
  }
}

} // namespace netsweep::config
