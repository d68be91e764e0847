#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/json.hpp"
#include "internal/util/strings.hpp"
#include "memory_tx.hpp"

namespace netsweep::db::memory {

namespace {

bool MatchesSearch(const model::DeviceRecord& r, const std::string& needle) {
  auto contains = [&](const std::optional<std::string>& field) { return field && util::ContainsIgnoreCase(*field, needle); };

  return util::ContainsIgnoreCase(r.ip, needle) || contains(r.mac) || contains(r.hostname) || contains(r.vendor) ||
         util::JsonLeafContains(r.extra_info, needle);
}

bool Matches(const model::DeviceRecord& r, const DeviceFilter& f) {
  if (f.status && r.status != *f.status) return false;
  if (f.ip_prefix && r.ip.compare(0, f.ip_prefix->size(), *f.ip_prefix) != 0) return false;
  if (f.last_seen_since_ms && r.last_seen_ms < *f.last_seen_since_ms) return false;
  if (f.last_seen_until_ms && r.last_seen_ms > *f.last_seen_until_ms) return false;
  if (f.search && !f.search->empty() && !MatchesSearch(r, *f.search)) return false;
  return true;
}

// -1 / 0 / 1 on the native column; empty latency always sorts last.
int CompareColumn(const model::DeviceRecord& a, const model::DeviceRecord& b, NativeSortField field) {
  auto three_way = [](auto x, auto y) { return x < y ? -1 : (y < x ? 1 : 0); };

  switch (field) {
    case NativeSortField::kLastSeen:
      return three_way(a.last_seen_ms, b.last_seen_ms);
    case NativeSortField::kFirstSeen:
      return three_way(a.first_seen_ms, b.first_seen_ms);
    case NativeSortField::kStatus:
      return three_way(netsweep::model::ToString(a.status), netsweep::model::ToString(b.status));
    case NativeSortField::kPingLatency:
      return three_way(a.ping_latency_ms.value_or(0.0), b.ping_latency_ms.value_or(0.0));
    case NativeSortField::kScanCount:
      return three_way(a.scan_count, b.scan_count);
  }
  return 0;
}

void SortNative(std::vector<model::DeviceRecord>& records, const NativeOrder& order) {
  std::sort(records.begin(), records.end(), [&](const model::DeviceRecord& a, const model::DeviceRecord& b) {
    if (order.field == NativeSortField::kPingLatency && a.ping_latency_ms.has_value() != b.ping_latency_ms.has_value()) {
      return a.ping_latency_ms.has_value();
    }
    int cmp = CompareColumn(a, b, order.field);
    if (order.order == SortOrder::kDesc) cmp = -cmp;
    if (cmp != 0) return cmp < 0;
    return a.ip < b.ip;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::LockDevice(Transaction& t, const std::string& ip) {
  auto& tx = TX(t);
  for (const auto& held : tx.locked_devices_) {
    if (held == ip) return Result::Ok();
  }
  if (tx.dirty_) return Result::Err(ErrorCode::Conflict, "lock of " + ip + " after a write");

  std::unique_lock lock(mutex_);
  device_released_.wait(lock, [&] { return !locked_devices_.contains(ip); });
  locked_devices_.insert(ip);
  tx.locked_devices_.push_back(ip);

  tx.working_          = committed_;
  tx.snapshot_version_ = committed_version_;
  return Result::Ok();
}

Result MemoryRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  if (TX(t).View().devices.contains(r.ip)) return Result::Err(ErrorCode::AlreadyExists, "device " + r.ip);
  TX(t).Mutable().devices[r.ip] = r;
  return Result::Ok(1);
}

Result MemoryRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  if (!TX(t).View().devices.contains(r.ip)) return Result::Err(ErrorCode::NotFound, "device " + r.ip);
  TX(t).Mutable().devices[r.ip] = r;
  return Result::Ok(1);
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& ip) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(ip);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteDevice(Transaction& t, const std::string& ip) {
  if (!TX(t).View().devices.contains(ip)) return Result::Ok(0);
  return Result::Ok(TX(t).Mutable().devices.erase(ip));
}

std::vector<model::DeviceRecord> MemoryRepository::ListDevices(Transaction& t, const DeviceFilter& filter, const std::optional<NativeOrder>& order,
                                                               const std::optional<Pagination>& page) {
  std::vector<model::DeviceRecord> out;
  for (const auto& [_, record] : TX(t).View().devices) {
    if (Matches(record, filter)) out.push_back(record);
  }

  if (order) SortNative(out, *order);

  if (page) {
    if (page->offset >= out.size()) return {};
    const auto end = std::min(out.size(), page->offset + page->limit);
    return {out.begin() + static_cast<std::ptrdiff_t>(page->offset), out.begin() + static_cast<std::ptrdiff_t>(end)};
  }
  return out;
}

uint64_t MemoryRepository::CountDevices(Transaction& t, const DeviceFilter& filter) {
  uint64_t count = 0;
  for (const auto& [_, record] : TX(t).View().devices) {
    if (Matches(record, filter)) ++count;
  }
  return count;
}

std::vector<std::string> MemoryRepository::ListDeviceIps(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [ip, _] : TX(t).View().devices) out.push_back(ip);
  return out;
}

StatusCounts MemoryRepository::CountByStatus(Transaction& t) {
  StatusCounts counts;
  for (const auto& [_, record] : TX(t).View().devices) {
    ++counts.total;
    switch (record.status) {
      case netsweep::model::DeviceStatus::kOnline:
        ++counts.online;
        break;
      case netsweep::model::DeviceStatus::kOffline:
        ++counts.offline;
        break;
      default:
        ++counts.unknown;
        break;
    }
    if (!counts.max_last_seen_ms || record.last_seen_ms > *counts.max_last_seen_ms) counts.max_last_seen_ms = record.last_seen_ms;
  }
  return counts;
}

Result MemoryRepository::DeleteDevicesLastSeenBefore(Transaction& t, std::optional<uint64_t> cutoff_ms,
                                                     std::optional<netsweep::model::DeviceStatus> status) {
  auto&    devices = TX(t).Mutable().devices;
  uint64_t removed = 0;
  for (auto it = devices.begin(); it != devices.end();) {
    const bool status_match = !status || it->second.status == *status;
    const bool age_match    = !cutoff_ms || it->second.last_seen_ms < *cutoff_ms;
    if (status_match && age_match) {
      it = devices.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return Result::Ok(removed);
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  TX(t).Mutable().history.push_back(r);
  return Result::Ok(1);
}

std::vector<model::HistoryRecord> MemoryRepository::ListHistorySince(Transaction& t, uint64_t since_ms) {
  std::vector<model::HistoryRecord> out;
  for (const auto& h : TX(t).View().history) {
    if (h.seen_at_ms >= since_ms) out.push_back(h);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.seen_at_ms < b.seen_at_ms; });
  return out;
}

std::vector<model::HistoryRecord> MemoryRepository::ListDeviceHistory(Transaction& t, const std::string& ip, std::size_t limit) {
  std::vector<model::HistoryRecord> out;
  const auto&                       history = TX(t).View().history;
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (it->ip == ip) out.push_back(*it);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.seen_at_ms > b.seen_at_ms; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::DeleteHistoryBefore(Transaction& t, std::optional<uint64_t> cutoff_ms) {
  auto&      history = TX(t).Mutable().history;
  const auto before  = history.size();
  std::erase_if(history, [&](const model::HistoryRecord& h) { return !cutoff_ms || h.seen_at_ms < *cutoff_ms; });
  return Result::Ok(before - history.size());
}

// ------------------------------------------------------------------
// Latency monitoring
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMonitoring(Transaction& t, const model::MonitoringToggleRecord& r) {
  TX(t).Mutable().monitoring[r.ip] = r;
  return Result::Ok(1);
}

std::optional<model::MonitoringToggleRecord> MemoryRepository::GetMonitoring(Transaction& t, const std::string& ip) {
  const auto& s  = TX(t).View();
  auto        it = s.monitoring.find(ip);
  if (it == s.monitoring.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MonitoringToggleRecord> MemoryRepository::ListMonitoring(Transaction& t) {
  std::vector<model::MonitoringToggleRecord> out;
  for (const auto& [_, record] : TX(t).View().monitoring) out.push_back(record);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ip < b.ip; });
  return out;
}

Result MemoryRepository::AppendLatency(Transaction& t, const model::LatencyRecord& r) {
  TX(t).Mutable().latency.push_back(r);
  return Result::Ok(1);
}

std::vector<model::LatencyRecord> MemoryRepository::ListLatencySince(Transaction& t, const std::string& ip, uint64_t since_ms) {
  std::vector<model::LatencyRecord> out;
  for (const auto& m : TX(t).View().latency) {
    if (m.ip == ip && m.measured_at_ms >= since_ms) out.push_back(m);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.measured_at_ms < b.measured_at_ms; });
  return out;
}

Result MemoryRepository::DeleteLatencyBefore(Transaction& t, std::optional<uint64_t> cutoff_ms) {
  auto&      latency = TX(t).Mutable().latency;
  const auto before  = latency.size();
  std::erase_if(latency, [&](const model::LatencyRecord& m) { return !cutoff_ms || m.measured_at_ms < *cutoff_ms; });
  return Result::Ok(before - latency.size());
}

// ------------------------------------------------------------------
// Vendors / settings
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceVendors(Transaction& t, const std::vector<model::VendorRecord>& vendors) {
  auto& table = TX(t).Mutable().vendors;
  table.clear();
  for (const auto& v : vendors) table[v.oui] = v.vendor;
  return Result::Ok(table.size());
}

std::optional<std::string> MemoryRepository::LookupVendor(Transaction& t, const std::string& oui) {
  const auto& s  = TX(t).View();
  auto        it = s.vendors.find(oui);
  if (it == s.vendors.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().settings[key] = value;
  return Result::Ok(1);
}

std::optional<std::string> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.settings.find(key);
  if (it == s.settings.end()) return std::nullopt;
  return it->second;
}

StorageCounts MemoryRepository::CountStorage(Transaction& t) {
  const auto&   s = TX(t).View();
  StorageCounts counts;
  counts.devices = s.devices.size();
  counts.history = s.history.size();
  counts.latency = s.latency.size();
  counts.vendors = s.vendors.size();

  for (const auto& [_, d] : s.devices) {
    if (!counts.oldest_first_seen_ms || d.first_seen_ms < *counts.oldest_first_seen_ms) counts.oldest_first_seen_ms = d.first_seen_ms;
  }
  for (const auto& h : s.history) {
    if (!counts.oldest_history_ms || h.seen_at_ms < *counts.oldest_history_ms) counts.oldest_history_ms = h.seen_at_ms;
  }
  return counts;
}

Result MemoryRepository::Compact() {
  std::scoped_lock lock(mutex_);
  committed_.history.shrink_to_fit();
  committed_.latency.shrink_to_fit();
  return Result::Ok();
}

} // namespace netsweep::db::memory
