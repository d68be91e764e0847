#include "mac_resolver.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <regex>
#include <sstream>

#include "command_step.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file.hpp"
#include "internal/util/strings.hpp"

namespace netsweep::enrich {

namespace {

const std::regex& MacPattern() {
  static const std::regex pattern("([0-9a-f]{2}[:-]){5}[0-9a-f]{2}", std::regex::icase);
  return pattern;
}

std::string NormalizeMac(std::string mac) {
  mac = util::ToLower(mac);
  for (auto& c : mac) {
    if (c == '-') c = ':';
  }
  return mac;
}

bool IsZeroMac(const std::string& mac) {
  return mac == "00:00:00:00:00:00";
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

std::optional<std::string> NeighborGet(util::CommandRunner& runner, const MacResolverOptions& options, const std::string& ip) {
  auto output = RunStep(runner, {"ip", "neigh", "get", ip}, options.step_timeout);
  if (auto mac = ExtractMac(output)) return mac;

  // older iproute2 has no "get"
  return ExtractMac(RunStep(runner, {"ip", "neigh", "show", ip}, options.step_timeout));
}

std::optional<std::string> NeighborTable(const MacResolverOptions& options, const std::string& ip) {
  auto table = util::ReadTextFile(options.neighbor_table_path);
  if (!table) {
    throw util::ResolverError("cannot read " + options.neighbor_table_path);
  }
  return ParseNeighborTable(*table, ip);
}

std::optional<std::string> ArpScan(util::CommandRunner& runner, const MacResolverOptions& options, const std::string& ip) {
  auto iface = options.arp_scan_interface.empty() ? DetectPrimaryInterface() : std::optional<std::string>(options.arp_scan_interface);
  if (!iface) {
    throw util::ResolverError("no interface for arp-scan");
  }
  return ParseArpScan(RunStep(runner, {"arp-scan", "-l", "-q", "-x", "-I", *iface}, options.arp_scan_timeout), ip);
}

std::optional<std::string> LegacyArp(util::CommandRunner& runner, const MacResolverOptions& options, const std::string& ip) {
  return ExtractMac(RunStep(runner, {"arp", "-n", ip}, options.step_timeout));
}

} // namespace

std::optional<std::string> ExtractMac(std::string_view text) {
  const std::string haystack(text);
  for (auto it = std::sregex_iterator(haystack.begin(), haystack.end(), MacPattern()); it != std::sregex_iterator(); ++it) {
    auto mac = NormalizeMac(it->str());
    if (!IsZeroMac(mac)) return mac;
  }
  return std::nullopt;
}

std::optional<std::string> ParseNeighborTable(std::string_view table, std::string_view ip) {
  std::istringstream in{std::string(table)};
  std::string        line;
  while (std::getline(in, line)) {
    const auto fields = util::SplitFields(line);
    if (fields.size() < 4 || fields[0] != ip) continue;

    auto mac = ExtractMac(fields[3]);
    if (mac && *mac == NormalizeMac(fields[3])) return mac;
  }
  return std::nullopt;
}

std::optional<std::string> ParseArpScan(std::string_view output, std::string_view ip) {
  std::istringstream in{std::string(output)};
  std::string        line;
  while (std::getline(in, line)) {
    const auto fields = util::SplitFields(line);
    if (fields.size() < 2 || fields[0] != ip) continue;
    return ExtractMac(fields[1]);
  }
  return std::nullopt;
}

MacResolver::MacResolver(std::shared_ptr<util::CommandRunner> runner, MacResolverOptions options) {
  chain_.Add("ip-neigh", [runner, options](const std::string& ip) { return NeighborGet(*runner, options, ip); });
  chain_.Add("neighbor-table", [options](const std::string& ip) { return NeighborTable(options, ip); });
  if (options.arp_scan_enabled) {
    chain_.Add("arp-scan", [runner, options](const std::string& ip) { return ArpScan(*runner, options, ip); });
  }
  chain_.Add("arp", [runner, options](const std::string& ip) { return LegacyArp(*runner, options, ip); });
}

std::optional<std::string> MacResolver::Resolve(const std::string& ip) const {
  return chain_.Resolve(ip);
}

std::optional<std::string> DetectPrimaryInterface() {
  ifaddrs* addrs = nullptr;
  if (getifaddrs(&addrs) != 0) return std::nullopt;
  std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard(addrs, &freeifaddrs);

  for (auto* it = addrs; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) continue;

    const std::string_view name = it->ifa_name;
    if (StartsWith(name, "docker") || StartsWith(name, "veth") || StartsWith(name, "br-")) continue;
    return std::string(name);
  }
  return std::nullopt;
}

} // namespace netsweep::enrich
