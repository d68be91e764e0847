#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace netsweep::retention {

class RetentionManager;

/*
  Background auto purge.

  Re-reads the policy on every wake so a changed interval or a disabled
  auto_purge takes effect without a restart.
*/
class RetentionWorker {
 public:
  explicit RetentionWorker(std::shared_ptr<RetentionManager> manager);
  ~RetentionWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<RetentionManager> manager_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace netsweep::retention
