#include "inventory_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace netsweep::service {

namespace {

constexpr uint64_t kMillisPerHour = 60ull * 60 * 1000;

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound(prefix + ": " + result.message);
  }
  throw util::PersistenceError(prefix + ": " + result.message);
}

} // namespace

InventoryService::InventoryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

query::DevicePage InventoryService::ListDevices(const query::DeviceQuery& query) {
  return ObserveCall("InventoryService.ListDevices", {}, [&] { return ctx_.query->Find(query); });
}

db::model::DeviceRecord InventoryService::GetDevice(const std::string& ip) {
  return ObserveCall("InventoryService.GetDevice", ip, [&] {
    auto tx     = ctx_.repository->Begin();
    auto device = ctx_.repository->GetDevice(*tx, ip);
    tx->Commit();
    if (!device) {
      throw util::NotFound("device not found: " + ip);
    }
    return *device;
  });
}

DeviceStats InventoryService::Stats() {
  return ObserveCall("InventoryService.Stats", {}, [&] {
    auto tx     = ctx_.repository->Begin();
    auto counts = ctx_.repository->CountByStatus(*tx);
    tx->Commit();

    DeviceStats stats;
    stats.total        = counts.total;
    stats.online       = counts.online;
    stats.offline      = counts.offline;
    stats.unknown      = counts.unknown;
    stats.last_scan_ms = counts.max_last_seen_ms;
    return stats;
  });
}

std::vector<query::TimeBucket> InventoryService::HistoricalStats(uint32_t hours) {
  return ObserveCall("InventoryService.HistoricalStats", {}, [&] {
    const uint64_t now_ms = util::ToUnixMillis(ctx_.clock->Now());
    const uint64_t window = static_cast<uint64_t>(hours) * kMillisPerHour;

    auto tx   = ctx_.repository->Begin();
    auto rows = ctx_.repository->ListHistorySince(*tx, now_ms > window ? now_ms - window : 0);
    tx->Commit();
    return query::BucketHistory(rows);
  });
}

std::vector<db::model::HistoryRecord> InventoryService::DeviceHistory(const std::string& ip, std::size_t limit) {
  return ObserveCall("InventoryService.DeviceHistory", ip, [&] {
    auto tx   = ctx_.repository->Begin();
    auto rows = ctx_.repository->ListDeviceHistory(*tx, ip, limit);
    tx->Commit();
    return rows;
  });
}

void InventoryService::DeleteDevice(const std::string& ip) {
  ObserveCall("InventoryService.DeleteDevice", ip, [&] {
    auto tx     = ctx_.repository->Begin();
    auto result = ctx_.repository->DeleteDevice(*tx, ip);
    ThrowIfDbError(result, "delete device " + ip);
    if (result.affected == 0) {
      throw util::NotFound("device not found: " + ip);
    }
    tx->Commit();
  });
}

uint64_t InventoryService::DeleteAll() {
  return ObserveCall("InventoryService.DeleteAll", {}, [&] {
    auto tx     = ctx_.repository->Begin();
    auto result = ctx_.repository->DeleteDevicesLastSeenBefore(*tx, std::nullopt, std::nullopt);
    ThrowIfDbError(result, "delete all devices");
    tx->Commit();
    return result.affected;
  });
}

} // namespace netsweep::service
