#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace netsweep::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             LockDevice(Transaction&, const std::string& ip) override;
  Result                             InsertDevice(Transaction&, const model::DeviceRecord&) override;
  Result                             UpdateDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& ip) override;
  Result                             DeleteDevice(Transaction&, const std::string& ip) override;
  std::vector<model::DeviceRecord>   ListDevices(Transaction&, const DeviceFilter&, const std::optional<NativeOrder>&,
                                                 const std::optional<Pagination>&) override;
  uint64_t                           CountDevices(Transaction&, const DeviceFilter&) override;
  std::vector<std::string>           ListDeviceIps(Transaction&) override;
  StatusCounts                       CountByStatus(Transaction&) override;
  Result DeleteDevicesLastSeenBefore(Transaction&, std::optional<uint64_t> cutoff_ms, std::optional<netsweep::model::DeviceStatus> status) override;

  Result                             AppendHistory(Transaction&, const model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ListHistorySince(Transaction&, uint64_t since_ms) override;
  std::vector<model::HistoryRecord> ListDeviceHistory(Transaction&, const std::string& ip, std::size_t limit) override;
  Result                             DeleteHistoryBefore(Transaction&, std::optional<uint64_t> cutoff_ms) override;

  Result                                       UpsertMonitoring(Transaction&, const model::MonitoringToggleRecord&) override;
  std::optional<model::MonitoringToggleRecord> GetMonitoring(Transaction&, const std::string& ip) override;
  std::vector<model::MonitoringToggleRecord>   ListMonitoring(Transaction&) override;
  Result                                       AppendLatency(Transaction&, const model::LatencyRecord&) override;
  std::vector<model::LatencyRecord>            ListLatencySince(Transaction&, const std::string& ip, uint64_t since_ms) override;
  Result                                       DeleteLatencyBefore(Transaction&, std::optional<uint64_t> cutoff_ms) override;

  Result                     ReplaceVendors(Transaction&, const std::vector<model::VendorRecord>&) override;
  std::optional<std::string> LookupVendor(Transaction&, const std::string& oui) override;

  Result                     PutSetting(Transaction&, const std::string& key, const std::string& value) override;
  std::optional<std::string> GetSetting(Transaction&, const std::string& key) override;
  StorageCounts              CountStorage(Transaction&) override;
  Result                     Compact() override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::DeviceRecord>                     devices;
    std::vector<model::HistoryRecord>                               history;
    std::unordered_map<std::string, model::MonitoringToggleRecord> monitoring;
    std::vector<model::LatencyRecord>                               latency;
    std::unordered_map<std::string, std::string>                   vendors;
    std::unordered_map<std::string, std::string>                   settings;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;

  // addresses held through LockDevice, released when the holder ends
  std::set<std::string>   locked_devices_;
  std::condition_variable device_released_;
};

} // namespace netsweep::db::memory
