#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/latency_record.hpp"
#include "internal/query/history_stats.hpp"
#include "service_context.hpp"

namespace netsweep::service {

/*
  Latency monitoring store.

  Toggles say which addresses the external latency monitor should
  sample; the monitor reports back through RecordMeasurement.
*/
class MonitoringService {
 public:
  explicit MonitoringService(ServiceContext ctx);

  void EnableMonitoring(const std::string& ip);
  void DisableMonitoring(const std::string& ip);
  bool IsMonitoringEnabled(const std::string& ip);

  std::vector<std::string> EnabledIps();

  // Unknown addresses map to false.
  std::map<std::string, bool> MonitoringStatus(const std::vector<std::string>& ips);

  // latency_ms empty for a lost probe.
  void RecordMeasurement(const std::string& ip, std::optional<double> latency_ms, bool packet_loss);

  // Ascending by time.
  std::vector<db::model::LatencyRecord> Measurements(const std::string& ip, uint32_t days);

  query::LatencyStatistics Statistics(const std::string& ip);

 private:
  void SetEnabled(const std::string& ip, bool enabled);

  ServiceContext ctx_;
};

} // namespace netsweep::service
