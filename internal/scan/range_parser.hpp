#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace netsweep::scan {

// Upper bound on addresses one request may expand to.
inline constexpr std::size_t kMaxRangeAddresses = 1000;

/*
  Expands a human range into an ordered, duplicate-free address list.

  Accepted forms (surrounding whitespace ignored):
    192.168.1.0/24      hosts .1 .. .254
    10.0.0.0/16 .. /23  prefix-aligned hosts, last octet 0 and 255 skipped
    192.168.1.10-20     inclusive dash range on the last octet
    192.168.1.7         single address

  Every address must be RFC 1918 private and the whole range must sit in
  one private block. Throws util::ValidationError; never truncates.
*/
std::vector<std::string> ParseRange(std::string_view text);

} // namespace netsweep::scan
