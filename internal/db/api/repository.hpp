#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/latency_record.hpp"
#include "internal/db/model/vendor_record.hpp"

namespace netsweep::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - History and latency reads return rows in time order
  - Bulk deletes report the removed row count in Result::affected

  The DB is the source of truth for:
    devices
    history timeline
    latency samples and monitoring toggles
    vendor table
    persisted settings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  // Serializes writers of one address until the transaction ends, across
  // processes sharing the store. Call before any read or write of the device.
  virtual Result LockDevice(Transaction&, const std::string& ip) = 0;

  virtual Result InsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual Result UpdateDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& ip) = 0;

  virtual Result DeleteDevice(Transaction&, const std::string& ip) = 0;

  // order/page empty: unordered, everything that matches.
  virtual std::vector<model::DeviceRecord> ListDevices(Transaction&, const DeviceFilter& filter, const std::optional<NativeOrder>& order,
                                                       const std::optional<Pagination>& page) = 0;

  virtual uint64_t CountDevices(Transaction&, const DeviceFilter& filter) = 0;

  virtual std::vector<std::string> ListDeviceIps(Transaction&) = 0;

  virtual StatusCounts CountByStatus(Transaction&) = 0;

  // cutoff empty: every row matching status. status empty: any status.
  virtual Result DeleteDevicesLastSeenBefore(Transaction&, std::optional<uint64_t> cutoff_ms,
                                             std::optional<netsweep::model::DeviceStatus> status) = 0;

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  virtual Result AppendHistory(Transaction&, const model::HistoryRecord&) = 0;

  virtual std::vector<model::HistoryRecord> ListHistorySince(Transaction&, uint64_t since_ms) = 0;

  // newest first
  virtual std::vector<model::HistoryRecord> ListDeviceHistory(Transaction&, const std::string& ip, std::size_t limit) = 0;

  virtual Result DeleteHistoryBefore(Transaction&, std::optional<uint64_t> cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Latency monitoring
  // ---------------------------------------------------------------------

  virtual Result UpsertMonitoring(Transaction&, const model::MonitoringToggleRecord&) = 0;

  virtual std::optional<model::MonitoringToggleRecord> GetMonitoring(Transaction&, const std::string& ip) = 0;

  virtual std::vector<model::MonitoringToggleRecord> ListMonitoring(Transaction&) = 0;

  virtual Result AppendLatency(Transaction&, const model::LatencyRecord&) = 0;

  virtual std::vector<model::LatencyRecord> ListLatencySince(Transaction&, const std::string& ip, uint64_t since_ms) = 0;

  virtual Result DeleteLatencyBefore(Transaction&, std::optional<uint64_t> cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Vendor table
  // ---------------------------------------------------------------------

  virtual Result ReplaceVendors(Transaction&, const std::vector<model::VendorRecord>& vendors) = 0;

  virtual std::optional<std::string> LookupVendor(Transaction&, const std::string& oui) = 0;

  // ---------------------------------------------------------------------
  // Settings / maintenance
  // ---------------------------------------------------------------------

  virtual Result PutSetting(Transaction&, const std::string& key, const std::string& value) = 0;

  virtual std::optional<std::string> GetSetting(Transaction&, const std::string& key) = 0;

  virtual StorageCounts CountStorage(Transaction&) = 0;

  // Runs outside any transaction (VACUUM cannot).
  virtual Result Compact() = 0;
};

} // namespace netsweep::db
