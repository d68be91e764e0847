#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/command_runner.hpp"

namespace netsweep::scan {

enum class ProbeFailure {
  kNone,
  kUnreachable,
  kTimeout,
  kPermissionDenied,
  kBinaryMissing,
  kSpawnFailed,
};

std::string_view ToString(ProbeFailure failure);

struct ProbeResult {
  bool                  success = false;
  std::optional<double> latency_ms;
  ProbeFailure          failure = ProbeFailure::kUnreachable;

  static ProbeResult Alive(double latency_ms) {
    return ProbeResult{true, latency_ms, ProbeFailure::kNone};
  }

  static ProbeResult Failed(ProbeFailure failure) {
    return ProbeResult{false, std::nullopt, failure};
  }
};

// Liveness check for one address. Never throws for a host that does not answer.
class Prober {
 public:
  virtual ~Prober() = default;

  virtual ProbeResult Probe(const std::string& ip) = 0;
};

struct ProbeOptions {
  std::chrono::milliseconds timeout{2000};
  std::string               ping_binary = "ping";
};

// Round-trip time out of a ping report: "time=12.3 ms", "time<1ms", "time=4ms".
std::optional<double> ParsePingLatency(std::string_view output);

/*
  Probes with the system ping tool through a CommandRunner.

  The exit status is ignored; a host is alive exactly when a round-trip
  time can be read from the output. The process deadline is the probe
  timeout plus a fixed grace so ping can report on its own first.
*/
class ProbeExecutor final : public Prober {
 public:
  static constexpr std::chrono::milliseconds kDeadlineGrace{500};

  ProbeExecutor(std::shared_ptr<util::CommandRunner> runner, ProbeOptions options);

  ProbeResult Probe(const std::string& ip) override;

 private:
  ProbeFailure Classify(const util::CommandResult& result) const;

  std::shared_ptr<util::CommandRunner> runner_;
  ProbeOptions                         options_;
};

} // namespace netsweep::scan
