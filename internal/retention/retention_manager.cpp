#include "retention_manager.hpp"

#include <functional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netsweep::retention {

using netsweep::model::DeviceStatus;
using netsweep::observability::IntField;
using netsweep::observability::StringField;

namespace {

constexpr int kMaxAttempts = 3;

constexpr uint64_t kDeviceRowBytes  = 200;
constexpr uint64_t kHistoryRowBytes = 100;
constexpr uint64_t kLatencyRowBytes = 64;

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::SerializationFailure || result.code == db::ErrorCode::Busy) {
    throw util::TransactionConflict(prefix + ": " + result.message);
  }
  throw util::RetentionError(prefix + ": " + result.message);
}

// One delete in one transaction; conflicting commits are retried.
uint64_t RunPurge(db::Repository& repository, const std::string& table, const std::function<db::Result(db::Transaction&)>& purge) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx     = repository.Begin();
      auto result = purge(*tx);
      ThrowIfDbError(result, "purge " + table);
      tx->Commit();

      netsweep::observability::Metrics::Instance().RecordPurgedRows(table, result.affected);
      if (result.affected > 0) {
        NETSWEEP_LOG_INFO("purged rows", {StringField("table", table), IntField("rows", static_cast<int64_t>(result.affected))});
      }
      return result.affected;
    } catch (const util::TransactionConflict& e) {
      if (attempt >= kMaxAttempts) {
        throw util::RetentionError("purge " + table + ": " + e.what());
      }
    } catch (const util::RetentionError&) {
      throw;
    } catch (const std::exception& e) {
      throw util::RetentionError("purge " + table + ": " + e.what());
    }
  }
}

} // namespace

RetentionManager::RetentionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, RetentionPolicy configured)
    : repository_(std::move(repository)),
      clock_(std::move(clock)),
      configured_(configured) {
}

std::optional<uint64_t> RetentionManager::Cutoff(uint32_t days) const {
  if (days == 0) {
    return std::nullopt;
  }
  const uint64_t now_ms = util::ToUnixMillis(clock_->Now());
  const uint64_t window = static_cast<uint64_t>(days) * util::kMillisPerDay;
  return now_ms > window ? now_ms - window : 0;
}

uint64_t RetentionManager::PurgeHistory(uint32_t days) {
  const auto cutoff = Cutoff(days);
  return RunPurge(*repository_, "device_history", [&](db::Transaction& tx) { return repository_->DeleteHistoryBefore(tx, cutoff); });
}

uint64_t RetentionManager::PurgeDevices(uint32_t days) {
  const auto cutoff = Cutoff(days);
  return RunPurge(*repository_, "devices", [&](db::Transaction& tx) { return repository_->DeleteDevicesLastSeenBefore(tx, cutoff, std::nullopt); });
}

uint64_t RetentionManager::PurgeOfflineDevices(uint32_t days) {
  const auto cutoff = Cutoff(days);
  return RunPurge(*repository_, "devices", [&](db::Transaction& tx) {
    return repository_->DeleteDevicesLastSeenBefore(tx, cutoff, DeviceStatus::kOffline);
  });
}

uint64_t RetentionManager::PurgeLatency(uint32_t days) {
  const auto cutoff = Cutoff(days);
  return RunPurge(*repository_, "latency_measurements", [&](db::Transaction& tx) { return repository_->DeleteLatencyBefore(tx, cutoff); });
}

PurgeReport RetentionManager::ExecutePurge() {
  netsweep::observability::SpanScope span("RetentionManager.ExecutePurge");

  const auto  policy = GetPolicy();
  PurgeReport report;
  report.history         = PurgeHistory(policy.history_days);
  report.offline_devices = PurgeOfflineDevices(policy.offline_days);
  report.devices         = PurgeDevices(policy.scans_days);
  report.latency         = PurgeLatency(policy.latency_days);

  if (report.Total() > kCompactThreshold) {
    Compact();
    report.compacted = true;
  }

  NETSWEEP_LOG_INFO("retention purge finished",
                    {IntField("history", static_cast<int64_t>(report.history)), IntField("offline_devices", static_cast<int64_t>(report.offline_devices)),
                     IntField("devices", static_cast<int64_t>(report.devices)), IntField("latency", static_cast<int64_t>(report.latency)),
                     netsweep::observability::BoolField("compacted", report.compacted)});
  return report;
}

void RetentionManager::Compact() {
  const auto result = repository_->Compact();
  if (!result) {
    throw util::RetentionError("compact: " + result.message);
  }
}

StorageStats RetentionManager::GetStorageStats() {
  db::StorageCounts counts;
  try {
    auto tx = repository_->Begin();
    counts  = repository_->CountStorage(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::RetentionError(std::string("storage stats: ") + e.what());
  }

  StorageStats stats;
  stats.devices              = counts.devices;
  stats.history              = counts.history;
  stats.latency              = counts.latency;
  stats.vendors              = counts.vendors;
  stats.oldest_first_seen_ms = counts.oldest_first_seen_ms;
  stats.oldest_history_ms    = counts.oldest_history_ms;
  stats.estimated_bytes      = counts.devices * kDeviceRowBytes + counts.history * kHistoryRowBytes + counts.latency * kLatencyRowBytes;
  return stats;
}

RetentionPolicy RetentionManager::GetPolicy() {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetSetting(*tx, kPolicySettingKey);
  tx->Commit();

  if (!stored) {
    return configured_;
  }
  try {
    return FromJson(*stored, configured_);
  } catch (const util::ValidationError& e) {
    NETSWEEP_LOG_WARN("ignoring stored retention policy", {StringField("error", e.what())});
    return configured_;
  }
}

void RetentionManager::SetPolicy(const RetentionPolicy& policy) {
  if (policy.purge_interval.count() <= 0) {
    throw util::ValidationError("purge_interval must be positive");
  }

  auto tx     = repository_->Begin();
  auto result = repository_->PutSetting(*tx, kPolicySettingKey, ToJson(policy));
  if (!result) {
    throw util::PersistenceError("store retention policy: " + result.message);
  }
  tx->Commit();
}

} // namespace netsweep::retention
