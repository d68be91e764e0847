#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/device_status.hpp"

namespace netsweep::db {

enum class SortOrder : std::uint8_t {
  kAsc,
  kDesc,
};

// Orderings every backend can express as a plain ORDER BY.
enum class NativeSortField : std::uint8_t {
  kLastSeen,
  kFirstSeen,
  kStatus,
  kPingLatency,
  kScanCount,
};

struct NativeOrder {
  NativeSortField field = NativeSortField::kLastSeen;
  SortOrder       order = SortOrder::kDesc;
};

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

/*
  Device filter. All set members must match.

  search is a case-insensitive substring over ip, mac, hostname, vendor
  and every scalar value nested inside extra_info.
*/
struct DeviceFilter {
  std::optional<netsweep::model::DeviceStatus> status;
  std::optional<std::string>                   ip_prefix;
  std::optional<std::string>                   search;
  std::optional<uint64_t>                      last_seen_since_ms;
  std::optional<uint64_t>                      last_seen_until_ms;
};

struct StatusCounts {
  uint64_t                total   = 0;
  uint64_t                online  = 0;
  uint64_t                offline = 0;
  uint64_t                unknown = 0;
  std::optional<uint64_t> max_last_seen_ms;
};

struct StorageCounts {
  uint64_t                devices = 0;
  uint64_t                history = 0;
  uint64_t                latency = 0;
  uint64_t                vendors = 0;
  std::optional<uint64_t> oldest_first_seen_ms;
  std::optional<uint64_t> oldest_history_ms;
};

} // namespace netsweep::db
