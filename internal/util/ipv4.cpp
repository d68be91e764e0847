#include "ipv4.hpp"

#include <array>

namespace netsweep::util {

std::optional<uint32_t> ParseIpv4(std::string_view text) {
  uint32_t    address = 0;
  int         octets  = 0;
  std::size_t pos     = 0;

  while (octets < 4) {
    if (pos >= text.size()) return std::nullopt;

    uint32_t    value  = 0;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      value = value * 10 + static_cast<uint32_t>(text[pos] - '0');
      ++pos;
      if (++digits > 3) return std::nullopt;
    }
    if (digits == 0 || value > 255) return std::nullopt;

    address = (address << 8) | value;
    ++octets;

    if (octets < 4) {
      if (pos >= text.size() || text[pos] != '.') return std::nullopt;
      ++pos;
    }
  }

  if (pos != text.size()) return std::nullopt;
  return address;
}

std::string FormatIpv4(uint32_t address) {
  return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) + "." + std::to_string((address >> 8) & 0xFF) + "." +
         std::to_string(address & 0xFF);
}

std::optional<int> PrivateBlock(uint32_t address) {
  struct Block {
    uint32_t network;
    uint32_t mask;
  };
  static constexpr std::array<Block, 3> kBlocks = {{
      {0x0A000000u, 0xFF000000u}, // 10.0.0.0/8
      {0xAC100000u, 0xFFF00000u}, // 172.16.0.0/12
      {0xC0A80000u, 0xFFFF0000u}, // 192.168.0.0/16
  }};

  for (std::size_t i = 0; i < kBlocks.size(); ++i) {
    if ((address & kBlocks[i].mask) == kBlocks[i].network) return static_cast<int>(i);
  }
  return std::nullopt;
}

} // namespace netsweep::util
