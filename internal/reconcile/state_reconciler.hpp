#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/model/device_status.hpp"
#include "internal/scan/batch_scheduler.hpp"
#include "internal/scan/observation.hpp"
#include "internal/util/time.hpp"

namespace netsweep::db {
class Repository;
}

namespace netsweep::reconcile {

// Provenance tag for values the resolvers produced.
inline constexpr const char* kScannerSource = "scanner";

/*
  The only writer of DeviceRecord rows.

  Per observation, in one repository transaction:
    - unknown address that answered    -> create (scan_count 1)
    - unknown address that did not     -> nothing at all
    - known address                    -> merge, scan_count + 1
  followed by exactly one history row for every create or merge.

  Merging keeps any field the observation has no new value for.
  last_seen_ms moves only when the device comes online from any other
  state or drops from online to offline. Observations never touch
  extra_info; MergeExtraInfo is its only writer.

  Reconciliations of the same IP are serialized in-process by a mutex
  that lives only while someone holds or waits for it, and across
  processes by Repository::LockDevice. Transaction conflicts are
  retried, other failures raise util::PersistenceError.
*/
class StateReconciler {
 public:
  static constexpr int kMaxAttempts = 3;

  StateReconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  scan::SettleOutcome Reconcile(const scan::Observation& observation);

  // Sets the top-level members of fields_json in the device's extra_info,
  // keeping the others. No history row, no scan_count change. False when
  // the device is unknown; util::ValidationError for a non-object patch.
  bool MergeExtraInfo(const std::string& ip, const std::string& fields_json);

  // Addresses with a reconciliation running or waiting.
  std::size_t TrackedAddresses();

 private:
  struct AddressMutex {
    std::mutex  mutex;
    std::size_t holders = 0;
  };

  // Locks the address for its lifetime; the last holder drops the entry.
  class AddressHold {
   public:
    AddressHold(StateReconciler& owner, const std::string& ip);
    ~AddressHold();

    AddressHold(const AddressHold&)            = delete;
    AddressHold& operator=(const AddressHold&) = delete;

   private:
    StateReconciler&              owner_;
    std::string                   ip_;
    std::shared_ptr<AddressMutex> entry_;
  };

  scan::SettleOutcome ReconcileOnce(const scan::Observation& observation);

  bool MergeExtraInfoOnce(const std::string& ip, const std::string& fields_json);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;

  std::mutex                                                    address_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<AddressMutex>> address_mutexes_;
};

} // namespace netsweep::reconcile
