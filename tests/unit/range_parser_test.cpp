#include "internal/scan/range_parser.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using netsweep::scan::ParseRange;

bool Rejects(const std::string& range) {
  try {
    ParseRange(range);
  } catch (const netsweep::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestSlash24YieldsUsableHosts() {
  const auto addresses = ParseRange("192.168.1.0/24");
  assert(addresses.size() == 254);
  assert(addresses.front() == "192.168.1.1");
  assert(addresses.back() == "192.168.1.254");
}

void TestDashRangeIsInclusive() {
  const auto addresses = ParseRange("192.168.1.10-20");
  assert(addresses.size() == 11);
  assert(addresses.front() == "192.168.1.10");
  assert(addresses.back() == "192.168.1.20");
}

void TestSingleAddressAndWhitespace() {
  const auto addresses = ParseRange("  10.1.2.3 ");
  assert(addresses.size() == 1);
  assert(addresses[0] == "10.1.2.3");
}

void TestPublicSpaceIsRejected() {
  assert(Rejects("8.8.8.8/24"));
  assert(Rejects("8.8.8.8"));
  assert(Rejects("172.32.0.1-10"));
}

void TestOversizedRangeIsRejected() {
  assert(Rejects("10.0.0.0/8"));
  assert(Rejects("10.0.0.0/16"));
  assert(Rejects("10.0.0.0/22"));
}

void TestPrefix23IsAlignedAndSkipsEdges() {
  const auto addresses = ParseRange("10.0.5.77/23");
  assert(addresses.size() == 508);
  assert(addresses.front() == "10.0.4.1");
  assert(addresses.back() == "10.0.5.254");

  const std::set<std::string> unique(addresses.begin(), addresses.end());
  assert(unique.size() == addresses.size());
  assert(!unique.count("10.0.4.255"));
  assert(!unique.count("10.0.5.0"));
}

void TestMalformedInputIsRejected() {
  assert(Rejects(""));
  assert(Rejects("192.168.1"));
  assert(Rejects("192.168.1.300"));
  assert(Rejects("192.168.1.20-10"));
  assert(Rejects("192.168.1.10-256"));
  assert(Rejects("192.168.1.0/33"));
  assert(Rejects("192.168.1.0/abc"));
}

} // namespace

int main() {
  TestSlash24YieldsUsableHosts();
  TestDashRangeIsInclusive();
  TestSingleAddressAndWhitespace();
  TestPublicSpaceIsRejected();
  TestOversizedRangeIsRejected();
  TestPrefix23IsAlignedAndSkipsEdges();
  TestMalformedInputIsRejected();

  std::cout << "netsweep_range_parser: pass\n";
  return 0;
}
