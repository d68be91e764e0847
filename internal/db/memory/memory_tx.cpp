#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace netsweep::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  // read-only transactions never conflict
  if (!dirty_) {
    committed_ = true;
    ReleaseDeviceLocksLocked();
    return;
  }
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::TransactionConflict("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
  ReleaseDeviceLocksLocked();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (locked_devices_.empty()) return;

  std::scoped_lock lock(repo_.mutex_);
  ReleaseDeviceLocksLocked();
}

void MemoryTransaction::ReleaseDeviceLocksLocked() {
  if (locked_devices_.empty()) return;
  for (const auto& ip : locked_devices_) {
    repo_.locked_devices_.erase(ip);
  }
  locked_devices_.clear();
  repo_.device_released_.notify_all();
}

} // namespace netsweep::db::memory
