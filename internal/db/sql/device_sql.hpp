#pragma once

#include <string>

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace netsweep::db::sql {

inline constexpr const char* kDeviceColumns =
    "ip,mac,hostname,vendor,hostname_source,vendor_source,status,ping_latency_ms,first_seen_ms,last_seen_ms,scan_count,extra_info";

/*
  WHERE clause for a DeviceFilter ("" when the filter is empty).
  Placeholders are numbered from first_placeholder for postgres.
*/
Fragment BuildDeviceWhere(const DeviceFilter& filter, Dialect dialect, int first_placeholder = 1);

// " ORDER BY ..." with NULLs last and ip as tie-break.
std::string BuildDeviceOrderBy(const NativeOrder& order);

} // namespace netsweep::db::sql
