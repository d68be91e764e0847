#include "range_parser.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

#include "internal/util/errors.hpp"
#include "internal/util/ipv4.hpp"
#include "internal/util/strings.hpp"

namespace netsweep::scan {

namespace {

std::optional<int> ParseSmallInt(std::string_view text) {
  if (text.empty() || text.size() > 3) return std::nullopt;
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

uint32_t ParseAddressOrThrow(std::string_view text, std::string_view range) {
  auto address = util::ParseIpv4(text);
  if (!address) {
    throw util::ValidationError("invalid IPv4 address '" + std::string(text) + "' in range '" + std::string(range) + "'");
  }
  return *address;
}

void RequirePrivate(uint32_t first, uint32_t last, std::string_view range) {
  const auto first_block = util::PrivateBlock(first);
  const auto last_block  = util::PrivateBlock(last);
  if (!first_block || !last_block || *first_block != *last_block) {
    throw util::ValidationError("range '" + std::string(range) + "' is outside private address space (10/8, 172.16/12, 192.168/16)");
  }
}

std::vector<std::string> ExpandCidr(std::string_view range, std::size_t slash) {
  const uint32_t network = ParseAddressOrThrow(range.substr(0, slash), range);
  const auto     prefix  = ParseSmallInt(range.substr(slash + 1));
  if (!prefix) {
    throw util::ValidationError("invalid prefix length in '" + std::string(range) + "'");
  }

  if (*prefix == 24) {
    const uint32_t base = network & 0xFFFFFF00u;
    RequirePrivate(base + 1, base + 254, range);

    std::vector<std::string> out;
    out.reserve(254);
    for (uint32_t host = 1; host <= 254; ++host) out.push_back(util::FormatIpv4(base + host));
    return out;
  }

  if (*prefix < 16 || *prefix > 23) {
    throw util::ValidationError("unsupported prefix /" + std::to_string(*prefix) + ", use /16 to /24 or a dash range");
  }

  const uint32_t size  = 1u << (32 - *prefix);
  const uint32_t first = network & ~(size - 1);
  const uint32_t last  = first + size - 1;

  // two of every 256 addresses carry a .0 or .255 last octet
  const std::size_t count = size - (size / 256) * 2;
  if (count > kMaxRangeAddresses) {
    throw util::ValidationError("range '" + std::string(range) + "' expands to " + std::to_string(count) + " addresses, limit is " +
                                std::to_string(kMaxRangeAddresses));
  }
  RequirePrivate(first, last, range);

  std::vector<std::string> out;
  out.reserve(count);
  for (uint32_t address = first; address <= last; ++address) {
    const auto octet = address & 0xFFu;
    if (octet == 0 || octet == 255) continue;
    out.push_back(util::FormatIpv4(address));
  }
  return out;
}

std::vector<std::string> ExpandDash(std::string_view range, std::size_t dash) {
  const uint32_t start = ParseAddressOrThrow(util::Trim(range.substr(0, dash)), range);
  const auto     end   = ParseSmallInt(util::Trim(range.substr(dash + 1)));
  if (!end || *end < 1 || *end > 255) {
    throw util::ValidationError("range end in '" + std::string(range) + "' must be a number between 1 and 255");
  }

  const uint32_t start_octet = start & 0xFFu;
  if (static_cast<uint32_t>(*end) < start_octet) {
    throw util::ValidationError("range end " + std::to_string(*end) + " is below range start in '" + std::string(range) + "'");
  }

  const uint32_t base = start & 0xFFFFFF00u;
  const uint32_t last = base + static_cast<uint32_t>(*end);
  RequirePrivate(start, last, range);

  std::vector<std::string> out;
  out.reserve(last - start + 1);
  for (uint32_t address = start; address <= last; ++address) out.push_back(util::FormatIpv4(address));
  return out;
}

} // namespace

std::vector<std::string> ParseRange(std::string_view text) {
  const std::string range = util::Trim(text);
  if (range.empty()) {
    throw util::ValidationError("range is empty");
  }

  if (const auto slash = range.find('/'); slash != std::string::npos) {
    return ExpandCidr(range, slash);
  }

  if (const auto dash = range.find('-'); dash != std::string::npos) {
    return ExpandDash(range, dash);
  }

  const uint32_t address = ParseAddressOrThrow(range, range);
  RequirePrivate(address, address, range);
  return {util::FormatIpv4(address)};
}

} // namespace netsweep::scan
