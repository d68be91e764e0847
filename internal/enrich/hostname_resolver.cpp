#include "hostname_resolver.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <future>
#include <sstream>
#include <thread>

#include "command_step.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file.hpp"
#include "internal/util/strings.hpp"

namespace netsweep::enrich {

namespace {

std::optional<std::string> Usable(std::string name) {
  name = util::Trim(name);
  if (!IsUsableHostname(name)) return std::nullopt;
  return name;
}

} // namespace

bool IsUsableHostname(std::string_view name) {
  return !name.empty() && name.find("in-addr.arpa") == std::string_view::npos;
}

std::optional<std::string> ParseGetentHosts(std::string_view output) {
  const auto fields = util::SplitFields(output);
  if (fields.size() < 2) return std::nullopt;
  return Usable(fields[1]);
}

std::optional<std::string> ParseHostsFile(std::string_view content, std::string_view ip) {
  std::istringstream in{std::string(content)};
  std::string        line;
  while (std::getline(in, line)) {
    if (const auto comment = line.find('#'); comment != std::string::npos) line.erase(comment);

    const auto fields = util::SplitFields(line);
    if (fields.size() < 2 || fields[0] != ip) continue;
    if (auto name = Usable(fields[1])) return name;
  }
  return std::nullopt;
}

std::optional<std::string> ParseNmblookup(std::string_view output) {
  std::istringstream in{std::string(output)};
  std::string        line;
  while (std::getline(in, line)) {
    const auto marker = line.find("<00>");
    if (marker == std::string::npos || line.find("<GROUP>") != std::string::npos) continue;

    const auto fields = util::SplitFields(std::string_view(line).substr(0, marker));
    if (fields.empty()) continue;
    return Usable(fields.back());
  }
  return std::nullopt;
}

std::optional<std::string> ReverseDns(const std::string& ip, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
    throw util::ResolverError("not an IPv4 address: " + ip);
  }

  auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
  auto answer  = promise->get_future();

  std::thread([promise, addr] {
    char host[NI_MAXHOST] = {};
    const int rc = getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    promise->set_value(rc == 0 ? std::optional<std::string>(host) : std::nullopt);
  }).detach();

  if (answer.wait_for(timeout) != std::future_status::ready) {
    throw util::ResolverError("reverse DNS timed out for " + ip);
  }
  auto name = answer.get();
  if (!name) return std::nullopt;
  return Usable(*name);
}

HostnameResolver::HostnameResolver(std::shared_ptr<util::CommandRunner> runner, HostnameResolverOptions options) {
  const auto timeout = options.step_timeout;

  chain_.Add("reverse-dns", [timeout](const std::string& ip) { return ReverseDns(ip, timeout); });
  chain_.Add("getent", [runner, timeout](const std::string& ip) { return ParseGetentHosts(RunStep(*runner, {"getent", "hosts", ip}, timeout)); });
  chain_.Add("hosts-file", [path = options.hosts_file_path](const std::string& ip) {
    auto content = util::ReadTextFile(path);
    if (!content) {
      throw util::ResolverError("cannot read " + path);
    }
    return ParseHostsFile(*content, ip);
  });
  chain_.Add("nmblookup", [runner, timeout](const std::string& ip) { return ParseNmblookup(RunStep(*runner, {"nmblookup", "-A", ip}, timeout)); });
}

std::optional<std::string> HostnameResolver::Resolve(const std::string& ip) const {
  return chain_.Resolve(ip);
}

} // namespace netsweep::enrich
