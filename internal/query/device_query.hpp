#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/device_record.hpp"

namespace netsweep::db {
class Repository;
}

namespace netsweep::query {

enum class SortField {
  // native
  kLastSeen,
  kFirstSeen,
  kStatus,
  kPingLatency,
  kScanCount,
  // derived
  kIp,
  kHostname,
  kMac,
  kVendor,
};

std::optional<SortField> ParseSortField(std::string_view text);
std::string_view         ToString(SortField field);

struct DeviceQuery {
  db::DeviceFilter filter;

  SortField     sort  = SortField::kLastSeen;
  db::SortOrder order = db::SortOrder::kDesc;

  // empty: every row from offset on
  std::optional<std::size_t> limit;
  std::size_t                offset = 0;
};

struct DevicePage {
  std::vector<db::model::DeviceRecord> devices;
  // rows matching the filter, before pagination
  uint64_t total = 0;
};

/*
  Read side of the device inventory.

  Native sort fields are pushed to the repository together with the
  page. Derived fields (ip, hostname, mac, vendor) always fetch the whole
  filtered set, sort it in memory and only then slice offset/limit;
  slicing first would cut pages out of storage order.
*/
class DeviceQueryEngine {
 public:
  explicit DeviceQueryEngine(std::shared_ptr<db::Repository> repository);

  DevicePage Find(const DeviceQuery& query) const;

  uint64_t Count(const db::DeviceFilter& filter) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace netsweep::query
