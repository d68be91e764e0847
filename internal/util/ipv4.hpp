#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netsweep::util {

/*
  IPv4 helpers. Addresses are carried as dotted-quad strings everywhere
  else; these convert to host-order 32-bit values for arithmetic and
  ordering.
*/

// Strict dotted quad: four decimal octets 0-255, no leading sign or spaces.
std::optional<uint32_t> ParseIpv4(std::string_view text);

std::string FormatIpv4(uint32_t address);

// Index of the RFC 1918 block containing address (0: 10/8, 1: 172.16/12,
// 2: 192.168/16), nullopt for public space.
std::optional<int> PrivateBlock(uint32_t address);

inline bool IsPrivate(uint32_t address) {
  return PrivateBlock(address).has_value();
}

} // namespace netsweep::util
