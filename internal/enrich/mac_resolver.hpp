#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/command_runner.hpp"
#include "resolver_chain.hpp"

namespace netsweep::enrich {

// First MAC-shaped token in text, lowercase colon form. The all-zero
// address (incomplete neighbor entry) is not a MAC.
std::optional<std::string> ExtractMac(std::string_view text);

// /proc/net/arp: "IP address  HW type  Flags  HW address  Mask  Device"
std::optional<std::string> ParseNeighborTable(std::string_view table, std::string_view ip);

// arp-scan -q: "<ip>\t<mac>" per answering host
std::optional<std::string> ParseArpScan(std::string_view output, std::string_view ip);

struct MacResolverOptions {
  std::chrono::milliseconds step_timeout{3000};
  std::chrono::milliseconds arp_scan_timeout{5000};
  std::string               neighbor_table_path = "/proc/net/arp";
  bool                      arp_scan_enabled    = false;
  // empty: first non-loopback IPv4 interface
  std::string arp_scan_interface;
};

/*
  MAC address chain:
    1. ip neigh get     (forces a neighbor solicitation)
    2. neighbor table   (passive read)
    3. arp-scan         (only when enabled, needs privileges)
    4. arp -n           (legacy net-tools)

  Steps own copies of the runner and options, so copies of a resolver
  are independent of each other.
*/
class MacResolver {
 public:
  MacResolver(std::shared_ptr<util::CommandRunner> runner, MacResolverOptions options);

  std::optional<std::string> Resolve(const std::string& ip) const;

  const ResolverChain<std::string>& Chain() const {
    return chain_;
  }

 private:
  ResolverChain<std::string> chain_{"mac"};
};

// Name of the first up, non-loopback interface carrying an IPv4 address.
std::optional<std::string> DetectPrimaryInterface();

} // namespace netsweep::enrich
