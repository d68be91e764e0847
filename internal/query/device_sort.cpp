#include "device_sort.hpp"

#include <algorithm>

#include "internal/util/ipv4.hpp"
#include "internal/util/strings.hpp"

namespace netsweep::query {

namespace {

const std::optional<std::string>& TextField(const db::model::DeviceRecord& device, DerivedSortField field) {
  switch (field) {
    case DerivedSortField::kHostname:
      return device.hostname;
    case DerivedSortField::kMac:
      return device.mac;
    case DerivedSortField::kVendor:
    default:
      return device.vendor;
  }
}

int CompareText(const std::string& a, const std::string& b) {
  return util::ToLower(util::Trim(a)).compare(util::ToLower(util::Trim(b)));
}

} // namespace

int CompareIpv4(const std::string& a, const std::string& b) {
  const auto left  = util::ParseIpv4(a);
  const auto right = util::ParseIpv4(b);
  if (left && right) {
    if (*left == *right) return 0;
    return *left < *right ? -1 : 1;
  }
  if (left) return -1;
  if (right) return 1;
  return a.compare(b);
}

bool IsEmptySortValue(const std::optional<std::string>& value) {
  if (!value) return true;
  const auto trimmed = util::Trim(*value);
  return trimmed.empty() || trimmed == "--";
}

void SortDevices(std::vector<db::model::DeviceRecord>& devices, DerivedSortField field, db::SortOrder order) {
  const bool descending = order == db::SortOrder::kDesc;

  if (field == DerivedSortField::kIp) {
    std::stable_sort(devices.begin(), devices.end(), [descending](const auto& a, const auto& b) {
      const int cmp = CompareIpv4(a.ip, b.ip);
      return descending ? cmp > 0 : cmp < 0;
    });
    return;
  }

  // Populated values first; only they are ordered, empties keep their place at the back.
  auto first_empty = std::stable_partition(devices.begin(), devices.end(),
                                           [field](const auto& device) { return !IsEmptySortValue(TextField(device, field)); });

  std::stable_sort(devices.begin(), first_empty, [field, descending](const auto& a, const auto& b) {
    const int cmp = CompareText(*TextField(a, field), *TextField(b, field));
    return descending ? cmp > 0 : cmp < 0;
  });
}

} // namespace netsweep::query
