#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace netsweep::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace netsweep::db::sqlite
