#include "monitoring_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ipv4.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace netsweep::service {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw util::PersistenceError(prefix + ": " + result.message);
}

void RequireIpv4(const std::string& ip) {
  if (!util::ParseIpv4(ip)) {
    throw util::ValidationError("invalid IPv4 address: " + ip);
  }
}

} // namespace

MonitoringService::MonitoringService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void MonitoringService::SetEnabled(const std::string& ip, bool enabled) {
  RequireIpv4(ip);

  db::model::MonitoringToggleRecord toggle;
  toggle.ip            = ip;
  toggle.enabled       = enabled;
  toggle.updated_at_ms = util::ToUnixMillis(ctx_.clock->Now());

  auto tx = ctx_.repository->Begin();
  ThrowIfDbError(ctx_.repository->UpsertMonitoring(*tx, toggle), "monitoring toggle " + ip);
  tx->Commit();
}

void MonitoringService::EnableMonitoring(const std::string& ip) {
  ObserveCall("MonitoringService.EnableMonitoring", ip, [&] { SetEnabled(ip, true); });
}

void MonitoringService::DisableMonitoring(const std::string& ip) {
  ObserveCall("MonitoringService.DisableMonitoring", ip, [&] { SetEnabled(ip, false); });
}

bool MonitoringService::IsMonitoringEnabled(const std::string& ip) {
  return ObserveCall("MonitoringService.IsMonitoringEnabled", ip, [&] {
    auto tx     = ctx_.repository->Begin();
    auto toggle = ctx_.repository->GetMonitoring(*tx, ip);
    tx->Commit();
    return toggle && toggle->enabled;
  });
}

std::vector<std::string> MonitoringService::EnabledIps() {
  return ObserveCall("MonitoringService.EnabledIps", {}, [&] {
    auto tx      = ctx_.repository->Begin();
    auto toggles = ctx_.repository->ListMonitoring(*tx);
    tx->Commit();

    std::vector<std::string> ips;
    for (const auto& toggle : toggles) {
      if (toggle.enabled) ips.push_back(toggle.ip);
    }
    return ips;
  });
}

std::map<std::string, bool> MonitoringService::MonitoringStatus(const std::vector<std::string>& ips) {
  return ObserveCall("MonitoringService.MonitoringStatus", {}, [&] {
    auto tx      = ctx_.repository->Begin();
    auto toggles = ctx_.repository->ListMonitoring(*tx);
    tx->Commit();

    std::map<std::string, bool> status;
    for (const auto& ip : ips) status[ip] = false;
    for (const auto& toggle : toggles) {
      auto it = status.find(toggle.ip);
      if (it != status.end()) it->second = toggle.enabled;
    }
    return status;
  });
}

void MonitoringService::RecordMeasurement(const std::string& ip, std::optional<double> latency_ms, bool packet_loss) {
  ObserveCall("MonitoringService.RecordMeasurement", ip, [&] {
    RequireIpv4(ip);

    db::model::LatencyRecord sample;
    sample.ip             = ip;
    sample.latency_ms     = packet_loss ? std::nullopt : latency_ms;
    sample.packet_loss    = packet_loss;
    sample.measured_at_ms = util::ToUnixMillis(ctx_.clock->Now());

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->AppendLatency(*tx, sample), "latency sample " + ip);
    tx->Commit();
  });
}

std::vector<db::model::LatencyRecord> MonitoringService::Measurements(const std::string& ip, uint32_t days) {
  return ObserveCall("MonitoringService.Measurements", ip, [&] {
    const uint64_t now_ms = util::ToUnixMillis(ctx_.clock->Now());
    const uint64_t window = static_cast<uint64_t>(days) * util::kMillisPerDay;

    auto tx      = ctx_.repository->Begin();
    auto samples = ctx_.repository->ListLatencySince(*tx, ip, now_ms > window ? now_ms - window : 0);
    tx->Commit();
    return samples;
  });
}

query::LatencyStatistics MonitoringService::Statistics(const std::string& ip) {
  return ObserveCall("MonitoringService.Statistics", ip, [&] {
    const uint64_t now_ms = util::ToUnixMillis(ctx_.clock->Now());

    auto tx      = ctx_.repository->Begin();
    auto samples = ctx_.repository->ListLatencySince(*tx, ip, now_ms > util::kMillisPerDay ? now_ms - util::kMillisPerDay : 0);
    tx->Commit();
    return query::SummarizeLatency(samples, now_ms);
  });
}

} // namespace netsweep::service
