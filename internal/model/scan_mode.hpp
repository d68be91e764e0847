#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace netsweep::model {

// Full runs the enrichment resolvers for live hosts; quick only probes.
enum class ScanMode : std::uint8_t {
  kQuick = 0,
  kFull  = 1,
};

constexpr std::string_view ToString(ScanMode mode) {
  return mode == ScanMode::kFull ? "full" : "quick";
}

constexpr std::optional<ScanMode> ParseScanMode(std::string_view text) {
  if (text == "full") return ScanMode::kFull;
  if (text == "quick") return ScanMode::kQuick;
  return std::nullopt;
}

} // namespace netsweep::model
