#include "retention_worker.hpp"

#include "internal/observability/logging.hpp"
#include "retention_manager.hpp"

namespace netsweep::retention {

using netsweep::observability::StringField;

namespace {

// Poll period while auto purge is off.
constexpr std::chrono::minutes kIdleRecheck{5};

} // namespace

RetentionWorker::RetentionWorker(std::shared_ptr<RetentionManager> manager) : manager_(std::move(manager)) {
}

RetentionWorker::~RetentionWorker() {
  Stop();
}

void RetentionWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RetentionWorker::Run, this);
}

void RetentionWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RetentionWorker::Run() {
  while (running_) {
    std::chrono::milliseconds wait = kIdleRecheck;
    try {
      const auto policy = manager_->GetPolicy();
      if (policy.auto_purge) wait = policy.purge_interval;
    } catch (const std::exception& e) {
      NETSWEEP_LOG_ERROR("retention worker: policy read failed", {StringField("error", e.what())});
    }

    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      if (wake_.wait_for(lock, wait, [this] { return !running_; })) break;
    }

    try {
      if (manager_->GetPolicy().auto_purge) manager_->ExecutePurge();
    } catch (const std::exception& e) {
      NETSWEEP_LOG_ERROR("retention worker: purge failed", {StringField("error", e.what())});
    }
  }
}

} // namespace netsweep::retention
