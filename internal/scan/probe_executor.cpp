#include "probe_executor.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/strings.hpp"

namespace netsweep::scan {

namespace {

using netsweep::observability::StringField;

// exit code of a shell-less exec that could not find its program
constexpr int kCommandNotFound = 127;

bool IsLatencyChar(char c) {
  return (c >= '0' && c <= '9') || c == '.';
}

} // namespace

std::string_view ToString(ProbeFailure failure) {
  switch (failure) {
    case ProbeFailure::kNone:
      return "success";
    case ProbeFailure::kUnreachable:
      return "unreachable";
    case ProbeFailure::kTimeout:
      return "timeout";
    case ProbeFailure::kPermissionDenied:
      return "permission_denied";
    case ProbeFailure::kBinaryMissing:
      return "binary_missing";
    case ProbeFailure::kSpawnFailed:
      return "spawn_failed";
  }
  return "unknown";
}

std::optional<double> ParsePingLatency(std::string_view output) {
  std::size_t pos = 0;
  while ((pos = output.find("time", pos)) != std::string_view::npos) {
    pos += 4;
    if (pos >= output.size() || (output[pos] != '=' && output[pos] != '<')) continue;
    ++pos;

    const auto start = pos;
    while (pos < output.size() && IsLatencyChar(output[pos])) ++pos;
    if (pos == start) continue;

    // "time=12.3 ms" or "time=4ms"
    auto unit = pos;
    while (unit < output.size() && output[unit] == ' ') ++unit;
    if (output.substr(unit, 2) != "ms") continue;

    double value = 0;
    auto [ptr, ec] = std::from_chars(output.data() + start, output.data() + pos, value);
    if (ec == std::errc() && ptr == output.data() + pos) return value;
  }
  return std::nullopt;
}

ProbeExecutor::ProbeExecutor(std::shared_ptr<util::CommandRunner> runner, ProbeOptions options)
    : runner_(std::move(runner)),
      options_(std::move(options)) {
}

ProbeResult ProbeExecutor::Probe(const std::string& ip) {
  auto& metrics = netsweep::observability::Metrics::Instance();

  // ping -W takes whole seconds
  const auto wait_seconds = std::max<long long>(1, (options_.timeout.count() + 999) / 1000);
  const std::vector<std::string> argv = {options_.ping_binary, "-c", "1", "-W", std::to_string(wait_seconds), ip};

  const auto result = runner_->Run(argv, options_.timeout + kDeadlineGrace);

  if (auto latency = ParsePingLatency(result.output)) {
    metrics.RecordProbe(ToString(ProbeFailure::kNone));
    metrics.ObserveProbeLatencyMs(*latency);
    return ProbeResult::Alive(*latency);
  }

  const auto failure = Classify(result);
  switch (failure) {
    case ProbeFailure::kBinaryMissing:
      NETSWEEP_LOG_ERROR("ping binary not found", {StringField("binary", options_.ping_binary), StringField("ip", ip)});
      break;
    case ProbeFailure::kSpawnFailed:
      NETSWEEP_LOG_ERROR("ping could not be started",
                         {StringField("ip", ip), netsweep::observability::IntField("errno", result.spawn_errno)});
      break;
    case ProbeFailure::kPermissionDenied:
      NETSWEEP_LOG_WARN("ping permission denied", {StringField("ip", ip), StringField("stderr", util::Trim(result.error_output))});
      break;
    case ProbeFailure::kTimeout:
      NETSWEEP_LOG_DEBUG("ping timed out", {StringField("ip", ip)});
      break;
    default:
      break;
  }

  metrics.RecordProbe(ToString(failure));
  return ProbeResult::Failed(failure);
}

ProbeFailure ProbeExecutor::Classify(const util::CommandResult& result) const {
  if (!result.Spawned()) {
    return result.spawn_errno == ENOENT ? ProbeFailure::kBinaryMissing : ProbeFailure::kSpawnFailed;
  }
  if (result.exit_code == kCommandNotFound) {
    return ProbeFailure::kBinaryMissing;
  }
  if (result.timed_out) {
    return ProbeFailure::kTimeout;
  }

  const auto diagnostics = util::ToLower(result.error_output + result.output);
  if (diagnostics.find("permission denied") != std::string::npos || diagnostics.find("operation not permitted") != std::string::npos) {
    return ProbeFailure::kPermissionDenied;
  }
  return ProbeFailure::kUnreachable;
}

} // namespace netsweep::scan
