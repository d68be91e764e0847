#include "scan_scheduler_worker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/service/scan_service.hpp"

namespace netsweep::scheduler {

using netsweep::observability::StringField;
using SteadyClock = std::chrono::steady_clock;

ScanSchedulerWorker::ScanSchedulerWorker(std::shared_ptr<service::ScanService> scans, SchedulerOptions options)
    : scans_(std::move(scans)),
      options_(std::move(options)) {
}

ScanSchedulerWorker::~ScanSchedulerWorker() {
  Stop();
}

void ScanSchedulerWorker::Start() {
  if (!options_.enabled) {
    NETSWEEP_LOG_INFO("scan scheduler disabled");
    return;
  }
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ScanSchedulerWorker::Run, this);
}

void ScanSchedulerWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ScanSchedulerWorker::RunFullScan() {
  for (const auto& range : options_.ranges) {
    if (!running_) return;
    try {
      scans_->ScanRange(range, options_.mode);
    } catch (const std::exception& e) {
      NETSWEEP_LOG_ERROR("scheduled scan failed", {StringField("range", range), StringField("error", e.what())});
    }
  }
}

void ScanSchedulerWorker::RunRefresh() {
  try {
    scans_->RefreshKnown();
  } catch (const std::exception& e) {
    NETSWEEP_LOG_ERROR("scheduled refresh failed", {StringField("error", e.what())});
  }
}

void ScanSchedulerWorker::Run() {
  auto next_full    = SteadyClock::now();
  auto next_refresh = next_full + options_.refresh_interval;

  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      if (wake_.wait_until(lock, std::min(next_full, next_refresh), [this] { return !running_; })) break;
    }

    const auto now = SteadyClock::now();
    if (now >= next_full) {
      RunFullScan();
      next_full = SteadyClock::now() + options_.full_scan_interval;
    } else if (now >= next_refresh) {
      RunRefresh();
      next_refresh = SteadyClock::now() + options_.refresh_interval;
    }
  }
}

} // namespace netsweep::scheduler
