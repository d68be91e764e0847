#include "scan_service.hpp"

#include "internal/core/network_scanner.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ipv4.hpp"
#include "observe_call.hpp"

namespace netsweep::service {

using netsweep::model::ScanMode;

ScanService::ScanService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void ScanService::PublishDeviceCounts() {
  try {
    auto tx     = ctx_.repository->Begin();
    auto counts = ctx_.repository->CountByStatus(*tx);
    tx->Commit();

    auto& metrics = netsweep::observability::Metrics::Instance();
    metrics.SetDeviceCount("online", counts.online);
    metrics.SetDeviceCount("offline", counts.offline);
    metrics.SetDeviceCount("unknown", counts.unknown);
  } catch (const std::exception& e) {
    NETSWEEP_LOG_WARN("device gauge update failed", {netsweep::observability::StringField("error", e.what())});
  }
}

scan::ScanSummary ScanService::ScanRange(const std::string& range, ScanMode mode) {
  return ObserveCall("ScanService.ScanRange", range, [&] {
    auto summary = ctx_.scanner->ScanRange(range, mode);
    PublishDeviceCounts();
    if (mode == ScanMode::kFull && ctx_.port_scan && ctx_.port_scan->Enabled()) {
      try {
        ctx_.port_scan->Run();
      } catch (const std::exception& e) {
        // the sweep itself succeeded
        NETSWEEP_LOG_WARN("port scan pass failed", {netsweep::observability::StringField("error", e.what())});
      }
    }
    return summary;
  });
}

scan::ScanSummary ScanService::RefreshKnown() {
  return ObserveCall("ScanService.RefreshKnown", {}, [&] {
    auto summary = ctx_.scanner->RefreshKnown();
    PublishDeviceCounts();
    return summary;
  });
}

std::optional<db::model::DeviceRecord> ScanService::ScanAddress(const std::string& ip, ScanMode mode) {
  return ObserveCall("ScanService.ScanAddress", ip, [&]() -> std::optional<db::model::DeviceRecord> {
    const auto outcome = ctx_.scanner->ScanAddress(ip, mode);
    if (outcome.kind == scan::SettleKind::kSkipped) {
      return std::nullopt;
    }
    PublishDeviceCounts();

    auto tx     = ctx_.repository->Begin();
    auto device = ctx_.repository->GetDevice(*tx, util::FormatIpv4(*util::ParseIpv4(ip)));
    tx->Commit();
    return device;
  });
}

core::PortScanReport ScanService::ScanOpenPorts() {
  return ObserveCall("ScanService.ScanOpenPorts", {}, [&] {
    if (!ctx_.port_scan) {
      throw util::ValidationError("port scanning is not configured");
    }
    return ctx_.port_scan->Run();
  });
}

} // namespace netsweep::service
