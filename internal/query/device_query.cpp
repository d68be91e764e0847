#include "device_query.hpp"

#include <algorithm>
#include <limits>

#include "device_sort.hpp"
#include "internal/db/api/repository.hpp"

namespace netsweep::query {

namespace {

constexpr std::size_t kUnbounded = static_cast<std::size_t>(std::numeric_limits<int64_t>::max());

std::optional<db::NativeSortField> AsNative(SortField field) {
  switch (field) {
    case SortField::kLastSeen:
      return db::NativeSortField::kLastSeen;
    case SortField::kFirstSeen:
      return db::NativeSortField::kFirstSeen;
    case SortField::kStatus:
      return db::NativeSortField::kStatus;
    case SortField::kPingLatency:
      return db::NativeSortField::kPingLatency;
    case SortField::kScanCount:
      return db::NativeSortField::kScanCount;
    default:
      return std::nullopt;
  }
}

DerivedSortField AsDerived(SortField field) {
  switch (field) {
    case SortField::kHostname:
      return DerivedSortField::kHostname;
    case SortField::kMac:
      return DerivedSortField::kMac;
    case SortField::kVendor:
      return DerivedSortField::kVendor;
    case SortField::kIp:
    default:
      return DerivedSortField::kIp;
  }
}

} // namespace

std::optional<SortField> ParseSortField(std::string_view text) {
  if (text == "last_seen" || text == "lastSeen") return SortField::kLastSeen;
  if (text == "first_seen" || text == "firstSeen") return SortField::kFirstSeen;
  if (text == "status") return SortField::kStatus;
  if (text == "ping_latency" || text == "pingLatency" || text == "latency") return SortField::kPingLatency;
  if (text == "scan_count" || text == "scanCount") return SortField::kScanCount;
  if (text == "ip") return SortField::kIp;
  if (text == "hostname") return SortField::kHostname;
  if (text == "mac") return SortField::kMac;
  if (text == "vendor") return SortField::kVendor;
  return std::nullopt;
}

std::string_view ToString(SortField field) {
  switch (field) {
    case SortField::kLastSeen:
      return "last_seen";
    case SortField::kFirstSeen:
      return "first_seen";
    case SortField::kStatus:
      return "status";
    case SortField::kPingLatency:
      return "ping_latency";
    case SortField::kScanCount:
      return "scan_count";
    case SortField::kIp:
      return "ip";
    case SortField::kHostname:
      return "hostname";
    case SortField::kMac:
      return "mac";
    case SortField::kVendor:
      return "vendor";
  }
  return "last_seen";
}

DeviceQueryEngine::DeviceQueryEngine(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

DevicePage DeviceQueryEngine::Find(const DeviceQuery& query) const {
  auto tx = repository_->Begin();

  DevicePage page;
  page.total = repository_->CountDevices(*tx, query.filter);

  if (const auto native = AsNative(query.sort)) {
    db::Pagination window;
    window.limit  = query.limit.value_or(kUnbounded);
    window.offset = query.offset;
    page.devices  = repository_->ListDevices(*tx, query.filter, db::NativeOrder{*native, query.order}, window);
    tx->Commit();
    return page;
  }

  auto all = repository_->ListDevices(*tx, query.filter, std::nullopt, std::nullopt);
  tx->Commit();

  SortDevices(all, AsDerived(query.sort), query.order);

  if (query.offset >= all.size()) {
    return page;
  }
  const auto available = all.size() - query.offset;
  const auto count     = std::min(available, query.limit.value_or(available));
  const auto first     = all.begin() + static_cast<std::ptrdiff_t>(query.offset);
  page.devices.assign(std::make_move_iterator(first), std::make_move_iterator(first + static_cast<std::ptrdiff_t>(count)));
  return page;
}

uint64_t DeviceQueryEngine::Count(const db::DeviceFilter& filter) const {
  auto tx    = repository_->Begin();
  auto total = repository_->CountDevices(*tx, filter);
  tx->Commit();
  return total;
}

} // namespace netsweep::query
