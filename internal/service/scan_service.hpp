#pragma once

#include <optional>
#include <string>

#include "internal/core/port_scan_pass.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/model/scan_mode.hpp"
#include "internal/scan/batch_scheduler.hpp"
#include "service_context.hpp"

namespace netsweep::service {

class ScanService {
 public:
  explicit ScanService(ServiceContext ctx);

  // Full mode is followed by an open-port pass when port scanning is enabled.
  scan::ScanSummary ScanRange(const std::string& range, netsweep::model::ScanMode mode);

  scan::ScanSummary RefreshKnown();

  // The stored record afterwards; empty when the address did not answer and was unknown.
  std::optional<db::model::DeviceRecord> ScanAddress(const std::string& ip, netsweep::model::ScanMode mode);

  // On demand, whether or not the automatic pass is enabled.
  core::PortScanReport ScanOpenPorts();

 private:
  void PublishDeviceCounts();

  ServiceContext ctx_;
};

} // namespace netsweep::service
