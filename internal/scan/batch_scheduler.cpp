#include "batch_scheduler.hpp"

#include <algorithm>
#include <future>
#include <list>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace netsweep::scan {

namespace {

using netsweep::observability::StringField;

constexpr std::chrono::milliseconds kPollInterval{5};

struct Pending {
  std::string              ip;
  std::future<Observation> result;
};

Observation Collect(Pending& pending) {
  try {
    return pending.result.get();
  } catch (const std::exception& e) {
    NETSWEEP_LOG_DEBUG("scan work item failed", {StringField("ip", pending.ip), StringField("error", e.what())});
    return Observation{pending.ip, ProbeResult::Failed(ProbeFailure::kUnreachable), {}, {}, {}};
  }
}

void Tally(const SettleOutcome& outcome, ScanSummary& summary) {
  if (outcome.kind == SettleKind::kSkipped) return;

  if (outcome.kind == SettleKind::kCreated) {
    ++summary.found;
  } else {
    ++summary.updated;
  }

  if (outcome.status == netsweep::model::DeviceStatus::kOnline) {
    ++summary.online;
  } else if (outcome.status == netsweep::model::DeviceStatus::kOffline) {
    ++summary.offline;
  }
}

} // namespace

BatchScheduler::BatchScheduler(BatchOptions options, std::shared_ptr<util::Clock> clock) : options_(options), clock_(std::move(clock)) {
}

ScanSummary BatchScheduler::Run(const std::vector<std::string>& addresses, const Work& work, const Settle& settle) const {
  const auto started_at  = std::chrono::steady_clock::now();
  const auto concurrency = std::max<std::size_t>(1, options_.concurrency);

  ScanSummary summary;
  summary.scanned = addresses.size();

  for (std::size_t begin = 0; begin < addresses.size(); begin += concurrency) {
    const auto end = std::min(addresses.size(), begin + concurrency);

    std::list<Pending> pending;
    for (auto i = begin; i < end; ++i) {
      const auto& ip = addresses[i];
      try {
        pending.push_back({ip, std::async(std::launch::async, [&work, ip] { return work(ip); })});
      } catch (const std::system_error& e) {
        // thread exhaustion: run inline so the address is still covered
        NETSWEEP_LOG_WARN("scan worker thread unavailable", {StringField("ip", ip), StringField("error", e.what())});
        std::promise<Observation> inline_result;
        try {
          inline_result.set_value(work(ip));
        } catch (const std::exception&) {
          inline_result.set_exception(std::current_exception());
        }
        pending.push_back({ip, inline_result.get_future()});
      }
    }

    while (!pending.empty()) {
      for (auto it = pending.begin(); it != pending.end();) {
        if (it->result.wait_for(kPollInterval) != std::future_status::ready) {
          ++it;
          continue;
        }

        const auto observation = Collect(*it);
        it                     = pending.erase(it);

        try {
          Tally(settle(observation), summary);
        } catch (const std::exception& e) {
          ++summary.persistence_failures;
          NETSWEEP_LOG_ERROR("reconciliation failed", {StringField("ip", observation.ip), StringField("error", e.what())});
        }
      }
    }

    if (end < addresses.size() && options_.inter_batch_delay.count() > 0) {
      clock_->SleepFor(options_.inter_batch_delay);
    }
  }

  summary.duration_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  return summary;
}

} // namespace netsweep::scan
