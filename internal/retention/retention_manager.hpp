#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "retention_policy.hpp"

namespace netsweep::db {
class Repository;
}

namespace netsweep::util {
class Clock;
}

namespace netsweep::retention {

struct PurgeReport {
  uint64_t history         = 0;
  uint64_t offline_devices = 0;
  uint64_t devices         = 0;
  uint64_t latency         = 0;
  bool     compacted       = false;

  uint64_t Total() const {
    return history + offline_devices + devices + latency;
  }
};

struct StorageStats {
  uint64_t                devices = 0;
  uint64_t                history = 0;
  uint64_t                latency = 0;
  uint64_t                vendors = 0;
  std::optional<uint64_t> oldest_first_seen_ms;
  std::optional<uint64_t> oldest_history_ms;
  uint64_t                estimated_bytes = 0;
};

/*
  History & retention.

  Every purge is one transaction deleting whole rows by timestamp, so it
  is idempotent and can run next to a scan. days == 0 removes every
  matching row regardless of age. Failures raise util::RetentionError
  and leave nothing committed.
*/
class RetentionManager {
 public:
  static constexpr uint64_t    kCompactThreshold = 100;
  static constexpr const char* kPolicySettingKey = "retention_policy";

  RetentionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, RetentionPolicy configured);

  uint64_t PurgeHistory(uint32_t days);
  uint64_t PurgeDevices(uint32_t days);
  uint64_t PurgeOfflineDevices(uint32_t days);
  uint64_t PurgeLatency(uint32_t days);

  // history, offline devices, devices, latency; then compacts past the threshold.
  PurgeReport ExecutePurge();

  void Compact();

  StorageStats GetStorageStats();

  // Persisted policy, else the configured one.
  RetentionPolicy GetPolicy();
  void            SetPolicy(const RetentionPolicy& policy);

 private:
  std::optional<uint64_t> Cutoff(uint32_t days) const;

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  RetentionPolicy                 configured_;
};

} // namespace netsweep::retention
