#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace netsweep::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  Result                            AppendHistory(Transaction&, const model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ListHistorySince(Transaction&, uint64_t since_ms) override;
  std::vector<model::HistoryRecord> ListDeviceHistory(Transaction&, const std::string& ip, std::size_t limit) override;
  Result                            DeleteHistoryBefore(Transaction&, std::optional<uint64_t> cutoff_ms) override;

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction&     TX(Transaction& t);
  static Result             Translate(const std::exception& e);
};

} // namespace netsweep::db::postgres
