#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace netsweep::model {

enum class DeviceStatus : std::uint8_t {
  kUnknown = 0,
  kOnline  = 1,
  kOffline = 2,
};

constexpr std::string_view ToString(DeviceStatus status) {
  switch (status) {
    case DeviceStatus::kOnline:
      return "online";
    case DeviceStatus::kOffline:
      return "offline";
    case DeviceStatus::kUnknown:
    default:
      return "unknown";
  }
}

constexpr std::optional<DeviceStatus> ParseDeviceStatus(std::string_view text) {
  if (text == "online") return DeviceStatus::kOnline;
  if (text == "offline") return DeviceStatus::kOffline;
  if (text == "unknown") return DeviceStatus::kUnknown;
  return std::nullopt;
}

} // namespace netsweep::model
