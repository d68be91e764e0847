#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace netsweep::db::model {

/*
  Sample produced by the external latency monitor.
  latency_ms is empty when the probe was lost.
*/
struct LatencyRecord {
  std::string           ip;
  std::optional<double> latency_ms;
  bool                  packet_loss    = false;
  uint64_t              measured_at_ms = 0;
};

struct MonitoringToggleRecord {
  std::string ip;
  bool        enabled       = false;
  uint64_t    updated_at_ms = 0;
};

} // namespace netsweep::db::model
