#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/device_status.hpp"

namespace netsweep::db::model {

// Append-only timeline row written by every reconciliation.
struct HistoryRecord {
  std::string                   ip;
  netsweep::model::DeviceStatus status = netsweep::model::DeviceStatus::kUnknown;
  std::optional<double>         ping_latency_ms;
  uint64_t                      seen_at_ms = 0;
};

} // namespace netsweep::db::model
