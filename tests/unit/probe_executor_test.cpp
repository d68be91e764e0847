#include "internal/scan/probe_executor.hpp"

#include <cassert>
#include <cerrno>
#include <iostream>
#include <memory>
#include <string>

#include "tests/fakes.hpp"

namespace {

using netsweep::scan::ParsePingLatency;
using netsweep::scan::ProbeExecutor;
using netsweep::scan::ProbeFailure;
using netsweep::scan::ProbeOptions;
using netsweep::testing::ScriptedRunner;

constexpr const char* kPingLine = "ping -c 1 -W 2 192.168.1.5";

void TestLatencyParsing() {
  auto linux_reply = ParsePingLatency("64 bytes from 192.168.1.5: icmp_seq=1 ttl=64 time=12.3 ms\n");
  assert(linux_reply && *linux_reply == 12.3);

  auto sub_ms = ParsePingLatency("64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time<1ms\n");
  assert(sub_ms.has_value());

  auto busybox = ParsePingLatency("64 bytes from 10.0.0.1: seq=0 ttl=64 time=4ms\n");
  assert(busybox && *busybox == 4.0);

  assert(!ParsePingLatency("1 packets transmitted, 0 received, 100% packet loss").has_value());
}

void TestAliveHostReportsLatency() {
  auto runner = std::make_shared<ScriptedRunner>();
  netsweep::util::CommandResult reply;
  reply.exit_code = 0;
  reply.output    = "PING 192.168.1.5 56(84) bytes of data.\n64 bytes from 192.168.1.5: icmp_seq=1 ttl=64 time=0.8 ms\n";
  runner->On(kPingLine, reply);

  ProbeExecutor probe(runner, ProbeOptions{});
  const auto    result = probe.Probe("192.168.1.5");
  assert(result.success);
  assert(result.latency_ms && *result.latency_ms == 0.8);
  assert(result.failure == ProbeFailure::kNone);
}

void TestExitStatusIsIgnoredWhenOutputHasLatency() {
  auto runner = std::make_shared<ScriptedRunner>();
  netsweep::util::CommandResult reply;
  reply.exit_code = 1;
  reply.output    = "64 bytes from 192.168.1.5: icmp_seq=1 ttl=64 time=3.1 ms\n";
  runner->On(kPingLine, reply);

  ProbeExecutor probe(runner, ProbeOptions{});
  assert(probe.Probe("192.168.1.5").success);
}

void TestFailureClassification() {
  auto runner = std::make_shared<ScriptedRunner>();
  ProbeExecutor probe(runner, ProbeOptions{});

  netsweep::util::CommandResult silent;
  silent.exit_code = 1;
  silent.output    = "1 packets transmitted, 0 received, 100% packet loss\n";
  runner->On(kPingLine, silent);
  auto unreachable = probe.Probe("192.168.1.5");
  assert(!unreachable.success && unreachable.failure == ProbeFailure::kUnreachable && !unreachable.latency_ms);

  netsweep::util::CommandResult overran;
  overran.timed_out = true;
  runner->On(kPingLine, overran);
  assert(probe.Probe("192.168.1.5").failure == ProbeFailure::kTimeout);

  netsweep::util::CommandResult denied;
  denied.exit_code    = 2;
  denied.error_output = "ping: socket: Operation not permitted\n";
  runner->On(kPingLine, denied);
  assert(probe.Probe("192.168.1.5").failure == ProbeFailure::kPermissionDenied);

  netsweep::util::CommandResult missing;
  missing.spawn_errno = ENOENT;
  runner->On(kPingLine, missing);
  assert(probe.Probe("192.168.1.5").failure == ProbeFailure::kBinaryMissing);

  netsweep::util::CommandResult shell_missing;
  shell_missing.exit_code = 127;
  runner->On(kPingLine, shell_missing);
  assert(probe.Probe("192.168.1.5").failure == ProbeFailure::kBinaryMissing);
}

void TestTimeoutRoundsUpToWholeSeconds() {
  auto runner = std::make_shared<ScriptedRunner>();
  ProbeOptions options;
  options.timeout     = std::chrono::milliseconds(1500);
  options.ping_binary = "/bin/ping";

  ProbeExecutor probe(runner, options);
  probe.Probe("10.0.0.9");
  const auto calls = runner->Calls();
  assert(calls.size() == 1);
  assert(calls[0] == "/bin/ping -c 1 -W 2 10.0.0.9");
}

} // namespace

int main() {
  TestLatencyParsing();
  TestAliveHostReportsLatency();
  TestExitStatusIsIgnoredWhenOutputHasLatency();
  TestFailureClassification();
  TestTimeoutRoundsUpToWholeSeconds();

  std::cout << "netsweep_probe_executor: pass\n";
  return 0;
}
