#include "port_scanner.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <tuple>

#include "internal/enrich/command_step.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace netsweep::enrich {

namespace {

constexpr std::chrono::milliseconds kVersionTimeout{5000};

const std::regex& PortRow() {
  static const std::regex row(R"(^\s*(\d+)/(tcp|udp)\s+open(\s|$))", std::regex::icase);
  return row;
}

} // namespace

std::vector<OpenPort> ParseNmapOpenPorts(std::string_view output) {
  std::vector<OpenPort> ports;
  std::istringstream    in{std::string(output)};
  std::string           line;
  std::smatch           match;

  while (std::getline(in, line)) {
    if (!std::regex_search(line, match, PortRow()) || match[1].length() > 5) continue;

    const auto number = std::stoul(match[1].str());
    if (number == 0 || number > 65535) continue;

    ports.push_back({static_cast<uint16_t>(number), util::ToLower(match[2].str())});
  }

  std::sort(ports.begin(), ports.end(),
            [](const OpenPort& a, const OpenPort& b) { return std::tie(a.port, a.protocol) < std::tie(b.port, b.protocol); });
  ports.erase(std::unique(ports.begin(), ports.end()), ports.end());
  return ports;
}

std::string OpenPortsJson(const std::vector<OpenPort>& ports, uint64_t scanned_at_ms) {
  std::string json = R"({"openPorts":[)";
  for (std::size_t i = 0; i < ports.size(); ++i) {
    if (i > 0) json += ',';
    json += R"({"port":)" + std::to_string(ports[i].port) + R"(,"protocol":")" + ports[i].protocol + "\"}";
  }
  json += R"(],"lastPortScan":")" + util::FormatUtc(scanned_at_ms) + "\"}";
  return json;
}

PortScanner::PortScanner(std::shared_ptr<util::CommandRunner> runner, PortScanOptions options)
    : runner_(std::move(runner)),
      options_(std::move(options)) {
}

bool PortScanner::Available() const {
  auto result = runner_->Run({options_.nmap_binary, "--version"}, kVersionTimeout);
  return result.Spawned() && result.exit_code == 0;
}

std::vector<OpenPort> PortScanner::Scan(const std::string& ip) const {
  // nmap exits non-zero on some partial scans; whatever it printed still counts
  auto output = RunStep(*runner_, {options_.nmap_binary, "-sT", "-Pn", "-p", options_.port_range, ip}, options_.host_timeout);
  return ParseNmapOpenPorts(output);
}

} // namespace netsweep::enrich
