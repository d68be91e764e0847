#include <google/protobuf/util/time_util.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/device_query.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using netsweep::model::DeviceStatus;
using netsweep::model::ScanMode;

namespace {

void Usage() {
  std::cout << "Usage:\n"
            << "  netsweepctl --config <file> scan <range> [quick|full]\n"
            << "  netsweepctl --config <file> refresh\n"
            << "  netsweepctl --config <file> add <ip> [quick|full]\n"
            << "  netsweepctl --config <file> ports\n"
            << "  netsweepctl --config <file> list [--status s] [--ip prefix] [--search q] [--sort field] [--order asc|desc]\n"
            << "                                   [--limit n] [--offset n]\n"
            << "  netsweepctl --config <file> show <ip>\n"
            << "  netsweepctl --config <file> delete <ip>\n"
            << "  netsweepctl --config <file> clear\n"
            << "  netsweepctl --config <file> stats\n"
            << "  netsweepctl --config <file> history [hours]\n"
            << "  netsweepctl --config <file> device-history <ip> [limit]\n"
            << "  netsweepctl --config <file> purge history|scans|offline|latency <days>\n"
            << "  netsweepctl --config <file> purge-now\n"
            << "  netsweepctl --config <file> compact\n"
            << "  netsweepctl --config <file> storage\n"
            << "  netsweepctl --config <file> retention [get|set key=value...]\n"
            << "  netsweepctl --config <file> vendors import <file>\n"
            << "  netsweepctl --config <file> monitor enable|disable|stats <ip>\n"
            << "  netsweepctl --config <file> monitor list\n"
            << "  netsweepctl --config <file> monitor record <ip> <latency_ms|loss>\n";
}

uint64_t ParseNumber(const std::string& text, const std::string& what) {
  std::size_t used = 0;
  uint64_t    value{};
  try {
    value = std::stoull(text, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used == 0 || used != text.size()) {
    throw netsweep::util::ValidationError("invalid " + what + ": " + text);
  }
  return value;
}

uint32_t ParseDays(const std::string& text) {
  const auto days = ParseNumber(text, "days");
  if (days > UINT32_MAX) {
    throw netsweep::util::ValidationError("days out of range: " + text);
  }
  return static_cast<uint32_t>(days);
}

ScanMode ParseMode(const std::vector<std::string>& args, std::size_t index, ScanMode fallback) {
  if (args.size() <= index) return fallback;
  const auto mode = netsweep::model::ParseScanMode(args[index]);
  if (!mode) {
    throw netsweep::util::ValidationError("unknown scan mode: " + args[index]);
  }
  return *mode;
}

std::string OrDash(const std::optional<std::string>& value) {
  return value && !value->empty() ? *value : "--";
}

std::string FormatLatency(const std::optional<double>& latency) {
  if (!latency) return "--";
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << *latency << "ms";
  return out.str();
}

void PrintDeviceRow(const netsweep::db::model::DeviceRecord& device) {
  std::cout << std::left << std::setw(16) << device.ip << " " << std::setw(8) << netsweep::model::ToString(device.status) << " "
            << std::setw(18) << OrDash(device.mac) << " " << std::setw(28) << OrDash(device.hostname) << " " << std::setw(24)
            << OrDash(device.vendor) << " " << std::setw(9) << FormatLatency(device.ping_latency_ms) << " "
            << netsweep::util::FormatUtc(device.last_seen_ms) << "\n";
}

void PrintDevice(const netsweep::db::model::DeviceRecord& device) {
  std::cout << "ip=" << device.ip << "\n"
            << "status=" << netsweep::model::ToString(device.status) << "\n"
            << "mac=" << OrDash(device.mac) << "\n"
            << "hostname=" << OrDash(device.hostname) << " (" << OrDash(device.hostname_source) << ")\n"
            << "vendor=" << OrDash(device.vendor) << " (" << OrDash(device.vendor_source) << ")\n"
            << "ping_latency=" << FormatLatency(device.ping_latency_ms) << "\n"
            << "first_seen=" << netsweep::util::FormatUtc(device.first_seen_ms) << "\n"
            << "last_seen=" << netsweep::util::FormatUtc(device.last_seen_ms) << "\n"
            << "scan_count=" << device.scan_count << "\n"
            << "extra_info=" << device.extra_info << "\n";
}

void PrintSummary(const netsweep::scan::ScanSummary& summary) {
  std::cout << "scanned=" << summary.scanned << "\n"
            << "found=" << summary.found << "\n"
            << "updated=" << summary.updated << "\n"
            << "online=" << summary.online << "\n"
            << "offline=" << summary.offline << "\n"
            << "persistence_failures=" << summary.persistence_failures << "\n"
            << "duration_ms=" << summary.duration_ms << "\n";
}

void PrintPolicy(const netsweep::retention::RetentionPolicy& policy) {
  std::cout << "history_days=" << policy.history_days << "\n"
            << "scans_days=" << policy.scans_days << "\n"
            << "offline_days=" << policy.offline_days << "\n"
            << "latency_days=" << policy.latency_days << "\n"
            << "auto_purge=" << (policy.auto_purge ? "true" : "false") << "\n"
            << "purge_interval=" << google::protobuf::util::TimeUtil::ToString(netsweep::util::ToProto(policy.purge_interval)) << "\n";
}

void ApplyPolicySetting(netsweep::retention::RetentionPolicy& policy, const std::string& assignment) {
  const auto eq = assignment.find('=');
  if (eq == std::string::npos) {
    throw netsweep::util::ValidationError("expected key=value: " + assignment);
  }
  const auto key   = assignment.substr(0, eq);
  const auto value = assignment.substr(eq + 1);

  if (key == "history_days") {
    policy.history_days = ParseDays(value);
  } else if (key == "scans_days") {
    policy.scans_days = ParseDays(value);
  } else if (key == "offline_days") {
    policy.offline_days = ParseDays(value);
  } else if (key == "latency_days") {
    policy.latency_days = ParseDays(value);
  } else if (key == "auto_purge") {
    if (value != "true" && value != "false") {
      throw netsweep::util::ValidationError("auto_purge must be true or false");
    }
    policy.auto_purge = value == "true";
  } else if (key == "purge_interval") {
    google::protobuf::Duration duration;
    if (!google::protobuf::util::TimeUtil::FromString(value, &duration)) {
      throw netsweep::util::ValidationError("purge_interval must look like \"86400s\": " + value);
    }
    policy.purge_interval = netsweep::util::FromProto(duration, std::chrono::milliseconds(0));
  } else {
    throw netsweep::util::ValidationError("unknown retention key: " + key);
  }
}

netsweep::query::DeviceQuery ParseListArgs(const std::vector<std::string>& args) {
  netsweep::query::DeviceQuery query;
  query.limit = 100;

  for (std::size_t i = 1; i < args.size(); i += 2) {
    if (i + 1 >= args.size()) {
      throw netsweep::util::ValidationError("missing value for " + args[i]);
    }
    const auto& flag  = args[i];
    const auto& value = args[i + 1];

    if (flag == "--status") {
      const auto status = netsweep::model::ParseDeviceStatus(value);
      if (!status) throw netsweep::util::ValidationError("unknown status: " + value);
      query.filter.status = *status;
    } else if (flag == "--ip") {
      query.filter.ip_prefix = value;
    } else if (flag == "--search") {
      query.filter.search = value;
    } else if (flag == "--sort") {
      const auto field = netsweep::query::ParseSortField(value);
      if (!field) throw netsweep::util::ValidationError("unknown sort field: " + value);
      query.sort = *field;
    } else if (flag == "--order") {
      if (value != "asc" && value != "desc") throw netsweep::util::ValidationError("order must be asc or desc");
      query.order = value == "asc" ? netsweep::db::SortOrder::kAsc : netsweep::db::SortOrder::kDesc;
    } else if (flag == "--limit") {
      query.limit = ParseNumber(value, "limit");
    } else if (flag == "--offset") {
      query.offset = ParseNumber(value, "offset");
    } else {
      throw netsweep::util::ValidationError("unknown option: " + flag);
    }
  }
  return query;
}

int RunMonitor(netsweep::factory::Runtime& rt, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;
  auto&       monitoring = *rt.monitoring_service;
  const auto& action     = args[1];

  if (action == "list") {
    for (const auto& ip : monitoring.EnabledIps()) std::cout << ip << "\n";
    return 0;
  }
  if (args.size() < 3) return 1;
  const auto& ip = args[2];

  if (action == "enable") {
    monitoring.EnableMonitoring(ip);
    std::cout << "enabled\n";
    return 0;
  }
  if (action == "disable") {
    monitoring.DisableMonitoring(ip);
    std::cout << "disabled\n";
    return 0;
  }
  if (action == "stats") {
    const auto stats = monitoring.Statistics(ip);
    std::cout << "enabled=" << (monitoring.IsMonitoringEnabled(ip) ? "true" : "false") << "\n"
              << "avg_1h=" << FormatLatency(stats.avg_last_hour_ms) << "\n"
              << "avg_24h=" << FormatLatency(stats.avg_24h_ms) << "\n"
              << "min=" << FormatLatency(stats.min_ms) << "\n"
              << "max=" << FormatLatency(stats.max_ms) << "\n"
              << "packet_loss_percent=" << stats.packet_loss_percent << "\n"
              << "total_measurements=" << stats.total_measurements << "\n";
    return 0;
  }
  if (action == "record") {
    if (args.size() < 4) return 1;
    if (args[3] == "loss") {
      monitoring.RecordMeasurement(ip, std::nullopt, true);
    } else {
      double latency = 0.0;
      try {
        latency = std::stod(args[3]);
      } catch (const std::exception&) {
        throw netsweep::util::ValidationError("invalid latency: " + args[3]);
      }
      monitoring.RecordMeasurement(ip, latency, false);
    }
    std::cout << "recorded\n";
    return 0;
  }
  return 1;
}

int Dispatch(netsweep::factory::Runtime& rt, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  if (cmd == "scan") {
    if (args.size() < 2) return 1;
    PrintSummary(rt.scan_service->ScanRange(args[1], ParseMode(args, 2, ScanMode::kFull)));
    return 0;
  }

  if (cmd == "refresh") {
    PrintSummary(rt.scan_service->RefreshKnown());
    return 0;
  }

  if (cmd == "ports") {
    const auto report = rt.scan_service->ScanOpenPorts();
    if (report.skipped) {
      std::cout << "nmap not available, nothing scanned\n";
      return 3;
    }
    std::cout << "candidates=" << report.candidates << " scanned=" << report.scanned << " failed=" << report.failed << "\n";
    return 0;
  }

  if (cmd == "add") {
    if (args.size() < 2) return 1;
    const auto device = rt.scan_service->ScanAddress(args[1], ParseMode(args, 2, ScanMode::kFull));
    if (!device) {
      std::cout << "no answer from " << args[1] << ", nothing stored\n";
      return 3;
    }
    PrintDevice(*device);
    return 0;
  }

  if (cmd == "list") {
    const auto page = rt.inventory_service->ListDevices(ParseListArgs(args));
    for (const auto& device : page.devices) PrintDeviceRow(device);
    std::cout << "total=" << page.total << "\n";
    return 0;
  }

  if (cmd == "show") {
    if (args.size() < 2) return 1;
    PrintDevice(rt.inventory_service->GetDevice(args[1]));
    return 0;
  }

  if (cmd == "delete") {
    if (args.size() < 2) return 1;
    rt.inventory_service->DeleteDevice(args[1]);
    std::cout << "deleted\n";
    return 0;
  }

  if (cmd == "clear") {
    std::cout << "deleted=" << rt.inventory_service->DeleteAll() << "\n";
    return 0;
  }

  if (cmd == "stats") {
    const auto stats = rt.inventory_service->Stats();
    std::cout << "total=" << stats.total << "\n"
              << "online=" << stats.online << "\n"
              << "offline=" << stats.offline << "\n"
              << "unknown=" << stats.unknown << "\n"
              << "last_scan=" << (stats.last_scan_ms ? netsweep::util::FormatUtc(*stats.last_scan_ms) : "--") << "\n";
    return 0;
  }

  if (cmd == "history") {
    const uint32_t hours = args.size() >= 2 ? static_cast<uint32_t>(ParseNumber(args[1], "hours")) : 24;
    for (const auto& bucket : rt.inventory_service->HistoricalStats(hours)) {
      std::cout << bucket.label << " total=" << bucket.total << " online=" << bucket.online << " offline=" << bucket.offline << "\n";
    }
    return 0;
  }

  if (cmd == "device-history") {
    if (args.size() < 2) return 1;
    const std::size_t limit = args.size() >= 3 ? ParseNumber(args[2], "limit") : 100;
    for (const auto& row : rt.inventory_service->DeviceHistory(args[1], limit)) {
      std::cout << netsweep::util::FormatUtc(row.seen_at_ms) << " " << netsweep::model::ToString(row.status) << " "
                << FormatLatency(row.ping_latency_ms) << "\n";
    }
    return 0;
  }

  if (cmd == "purge") {
    if (args.size() < 3) return 1;
    auto&       maintenance = *rt.maintenance_service;
    const auto  days        = ParseDays(args[2]);
    const auto& target      = args[1];
    uint64_t    removed     = 0;
    if (target == "history") {
      removed = maintenance.PurgeHistory(days);
    } else if (target == "scans") {
      removed = maintenance.PurgeDevices(days);
    } else if (target == "offline") {
      removed = maintenance.PurgeOfflineDevices(days);
    } else if (target == "latency") {
      removed = maintenance.PurgeLatency(days);
    } else {
      return 1;
    }
    std::cout << "deleted=" << removed << "\n";
    return 0;
  }

  if (cmd == "purge-now") {
    const auto report = rt.maintenance_service->ExecutePurge();
    std::cout << "history=" << report.history << "\n"
              << "offline_devices=" << report.offline_devices << "\n"
              << "devices=" << report.devices << "\n"
              << "latency=" << report.latency << "\n"
              << "compacted=" << (report.compacted ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "compact") {
    rt.maintenance_service->Compact();
    std::cout << "compacted\n";
    return 0;
  }

  if (cmd == "storage") {
    const auto stats = rt.maintenance_service->StorageStats();
    std::cout << "devices=" << stats.devices << "\n"
              << "history=" << stats.history << "\n"
              << "latency=" << stats.latency << "\n"
              << "vendors=" << stats.vendors << "\n"
              << "oldest_device=" << (stats.oldest_first_seen_ms ? netsweep::util::FormatUtc(*stats.oldest_first_seen_ms) : "--") << "\n"
              << "oldest_history=" << (stats.oldest_history_ms ? netsweep::util::FormatUtc(*stats.oldest_history_ms) : "--") << "\n"
              << "estimated_bytes=" << stats.estimated_bytes << "\n";
    return 0;
  }

  if (cmd == "retention") {
    auto& maintenance = *rt.maintenance_service;
    if (args.size() < 2 || args[1] == "get") {
      PrintPolicy(maintenance.GetRetentionPolicy());
      return 0;
    }
    if (args[1] != "set" || args.size() < 3) return 1;

    auto policy = maintenance.GetRetentionPolicy();
    for (std::size_t i = 2; i < args.size(); ++i) ApplyPolicySetting(policy, args[i]);
    maintenance.SetRetentionPolicy(policy);
    PrintPolicy(policy);
    return 0;
  }

  if (cmd == "vendors") {
    if (args.size() < 3 || args[1] != "import") return 1;
    std::cout << "imported=" << rt.maintenance_service->ImportVendors(args[2]) << "\n";
    return 0;
  }

  if (cmd == "monitor") {
    return RunMonitor(rt, args);
  }

  return 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = netsweep::config::ConfigLoader::LoadFromYaml(config_path);
    // stdout carries command output
    netsweep::observability::InitializeLogging(config, netsweep::observability::LogTarget::kStderr);

    auto rt = netsweep::factory::BuildRuntime(config);

    const int rc = Dispatch(rt, args);
    if (rc == 1) Usage();
    netsweep::observability::ShutdownLogging();
    return rc;
  } catch (const netsweep::util::ValidationError& e) {
    std::cerr << "invalid request: " << e.what() << "\n";
  } catch (const netsweep::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  netsweep::observability::ShutdownLogging();
  return 2;
}
