#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace netsweep::db::memory {

/*
  Transaction = snapshot + write set.

  Commit fails with util::TransactionConflict when another transaction
  committed after this snapshot was taken. LockDevice retakes the
  snapshot once the address is held, so a writer that waited for it
  starts from the previous holder's commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  friend class MemoryRepository;

  // caller holds repo_.mutex_
  void ReleaseDeviceLocksLocked();

  MemoryRepository&        repo_;
  std::vector<std::string> locked_devices_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
  bool                    dirty_            = false;
};

} // namespace netsweep::db::memory
