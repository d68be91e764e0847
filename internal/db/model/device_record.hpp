#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/device_status.hpp"

namespace netsweep::db::model {

/*
  Persistent device row, one per IP.

  first_seen_ms is written once at creation. last_seen_ms only moves on a
  status transition (see StateReconciler). scan_count never decreases.
*/
struct DeviceRecord {
  std::string ip;

  std::optional<std::string> mac;
  std::optional<std::string> hostname;
  std::optional<std::string> vendor;

  // provenance tags: "scanner", "manual", ...
  std::optional<std::string> hostname_source;
  std::optional<std::string> vendor_source;

  netsweep::model::DeviceStatus status = netsweep::model::DeviceStatus::kUnknown;

  std::optional<double> ping_latency_ms;

  uint64_t first_seen_ms = 0;
  uint64_t last_seen_ms  = 0;
  uint64_t scan_count    = 0;

  // opaque JSON object text, e.g. {"openPorts":[{"port":22}]}
  std::string extra_info = "{}";
};

} // namespace netsweep::db::model
