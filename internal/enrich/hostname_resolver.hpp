#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/command_runner.hpp"
#include "resolver_chain.hpp"

namespace netsweep::enrich {

// Generic PTR answers ("5.1.168.192.in-addr.arpa") are not names.
bool IsUsableHostname(std::string_view name);

// getent hosts: "<ip>  <name> [aliases...]"
std::optional<std::string> ParseGetentHosts(std::string_view output);

// hosts(5) lookup; text after '#' is ignored.
std::optional<std::string> ParseHostsFile(std::string_view content, std::string_view ip);

// nmblookup -A: first "<00>" name that is not a <GROUP> entry.
std::optional<std::string> ParseNmblookup(std::string_view output);

// getnameinfo(NI_NAMEREQD) bounded by timeout. The lookup thread is
// detached, so a resolver that hangs costs a thread, not the scan.
std::optional<std::string> ReverseDns(const std::string& ip, std::chrono::milliseconds timeout);

struct HostnameResolverOptions {
  std::chrono::milliseconds step_timeout{2000};
  std::string               hosts_file_path = "/etc/hosts";
};

/*
  Hostname chain:
    1. reverse DNS
    2. getent hosts  (nsswitch: files, mdns, ...)
    3. hosts file
    4. nmblookup     (NetBIOS)

  Steps own copies of the runner and options.
*/
class HostnameResolver {
 public:
  HostnameResolver(std::shared_ptr<util::CommandRunner> runner, HostnameResolverOptions options);

  std::optional<std::string> Resolve(const std::string& ip) const;

  const ResolverChain<std::string>& Chain() const {
    return chain_;
  }

 private:
  ResolverChain<std::string> chain_{"hostname"};
};

} // namespace netsweep::enrich
