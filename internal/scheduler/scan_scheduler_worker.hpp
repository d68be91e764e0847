#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/scan_mode.hpp"

namespace netsweep::service {
class ScanService;
}

namespace netsweep::scheduler {

struct SchedulerOptions {
  bool                      enabled = false;
  std::vector<std::string>  ranges;
  netsweep::model::ScanMode mode = netsweep::model::ScanMode::kFull;
  std::chrono::milliseconds full_scan_interval{std::chrono::minutes(60)};
  std::chrono::milliseconds refresh_interval{std::chrono::minutes(15)};
};

/*
  Background scanner for the daemon.

  Scans every configured range each full_scan_interval and runs a
  refresh pass over known devices each refresh_interval. The first full
  scan runs right after Start. A failing pass is logged and the loop
  keeps its schedule.
*/
class ScanSchedulerWorker {
 public:
  ScanSchedulerWorker(std::shared_ptr<service::ScanService> scans, SchedulerOptions options);
  ~ScanSchedulerWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void RunFullScan();
  void RunRefresh();

  std::shared_ptr<service::ScanService> scans_;
  SchedulerOptions                      options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace netsweep::scheduler
