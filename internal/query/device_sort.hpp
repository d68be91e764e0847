#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/device_record.hpp"

namespace netsweep::query {

// Orderings a plain ORDER BY gets wrong.
enum class DerivedSortField {
  kIp,
  kHostname,
  kMac,
  kVendor,
};

// Numeric comparison of dotted quads; unparsable addresses sort after valid ones.
int CompareIpv4(const std::string& a, const std::string& b);

// null, blank after trim, or the "--" placeholder.
bool IsEmptySortValue(const std::optional<std::string>& value);

/*
  Stable in-memory sort.

  For hostname/mac/vendor, empty values go after every populated value
  in both directions and keep their relative order; populated values
  compare case-insensitively.
*/
void SortDevices(std::vector<db::model::DeviceRecord>& devices, DerivedSortField field, db::SortOrder order);

} // namespace netsweep::query
