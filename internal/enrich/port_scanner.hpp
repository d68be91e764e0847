#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/command_runner.hpp"

namespace netsweep::enrich {

struct OpenPort {
  uint16_t    port = 0;
  std::string protocol;

  bool operator==(const OpenPort& other) const {
    return port == other.port && protocol == other.protocol;
  }
};

struct PortScanOptions {
  bool                      enabled      = false;
  std::string               port_range   = "1-10000";
  std::chrono::milliseconds host_timeout = std::chrono::seconds(120);
  std::size_t               max_hosts    = 200;
  std::string               nmap_binary  = "nmap";
};

// "22/tcp open ssh" rows of nmap's normal output, ordered by port then
// protocol. Filtered, closed and open|filtered rows are dropped.
std::vector<OpenPort> ParseNmapOpenPorts(std::string_view output);

// {"openPorts":[{"port":22,"protocol":"tcp"}],"lastPortScan":"<UTC>"}
std::string OpenPortsJson(const std::vector<OpenPort>& ports, uint64_t scanned_at_ms);

/*
  TCP connect scan of one host through nmap.

  Needs no privileges (-sT) and skips host discovery (-Pn) since the
  caller only hands in hosts that just answered a ping.
*/
class PortScanner {
 public:
  PortScanner(std::shared_ptr<util::CommandRunner> runner, PortScanOptions options);

  // False when the nmap binary cannot be started.
  bool Available() const;

  // util::ResolverError when nmap is missing or overran host_timeout.
  std::vector<OpenPort> Scan(const std::string& ip) const;

  const PortScanOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<util::CommandRunner> runner_;
  PortScanOptions                      options_;
};

} // namespace netsweep::enrich
