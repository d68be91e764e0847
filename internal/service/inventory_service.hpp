#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/device_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/query/device_query.hpp"
#include "internal/query/history_stats.hpp"
#include "service_context.hpp"

namespace netsweep::service {

struct DeviceStats {
  uint64_t                total   = 0;
  uint64_t                online  = 0;
  uint64_t                offline = 0;
  uint64_t                unknown = 0;
  std::optional<uint64_t> last_scan_ms; // newest last_seen
};

class InventoryService {
 public:
  explicit InventoryService(ServiceContext ctx);

  query::DevicePage ListDevices(const query::DeviceQuery& query);

  // Throws util::NotFound.
  db::model::DeviceRecord GetDevice(const std::string& ip);

  DeviceStats Stats();

  std::vector<query::TimeBucket> HistoricalStats(uint32_t hours = 24);

  std::vector<db::model::HistoryRecord> DeviceHistory(const std::string& ip, std::size_t limit = 100);

  // Throws util::NotFound.
  void DeleteDevice(const std::string& ip);

  uint64_t DeleteAll();

 private:
  ServiceContext ctx_;
};

} // namespace netsweep::service
