#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/fakes.hpp"

namespace {

using netsweep::db::model::DeviceRecord;
using netsweep::model::DeviceStatus;
using netsweep::retention::RetentionManager;
using netsweep::retention::RetentionPolicy;
using netsweep::testing::FakeClock;
using netsweep::testing::FaultyRepository;
using netsweep::util::kMillisPerDay;

struct Harness {
  std::shared_ptr<FakeClock>                              clock  = std::make_shared<FakeClock>();
  std::shared_ptr<netsweep::db::memory::MemoryRepository> memory = std::make_shared<netsweep::db::memory::MemoryRepository>();
  std::shared_ptr<FaultyRepository>                       repo   = std::make_shared<FaultyRepository>(memory);

  uint64_t DaysAgo(uint64_t days) const {
    return clock->NowMs() - days * kMillisPerDay;
  }

  void AddDevice(const std::string& ip, DeviceStatus status, uint64_t last_seen_ms) {
    DeviceRecord d;
    d.ip            = ip;
    d.status        = status;
    d.first_seen_ms = last_seen_ms;
    d.last_seen_ms  = last_seen_ms;
    d.scan_count    = 1;

    auto tx       = repo->Begin();
    auto inserted = repo->InsertDevice(*tx, d);
    assert(inserted);
    tx->Commit();
  }

  void AddHistory(const std::string& ip, uint64_t at_ms, int rows = 1) {
    auto tx = repo->Begin();
    for (int i = 0; i < rows; ++i) {
      auto appended = repo->AppendHistory(*tx, {ip, DeviceStatus::kOnline, 1.0, at_ms});
      assert(appended);
    }
    tx->Commit();
  }

  void AddLatency(const std::string& ip, uint64_t at_ms) {
    auto tx       = repo->Begin();
    auto appended = repo->AppendLatency(*tx, {ip, 2.0, false, at_ms});
    assert(appended);
    tx->Commit();
  }

  netsweep::db::StorageCounts Counts() {
    auto tx     = repo->Begin();
    auto counts = repo->CountStorage(*tx);
    tx->Commit();
    return counts;
  }
};

void TestPurgeDevicesByAge() {
  Harness          h;
  RetentionManager manager(h.repo, h.clock, RetentionPolicy{});

  h.AddDevice("10.0.0.1", DeviceStatus::kOnline, h.DaysAgo(100));
  h.AddDevice("10.0.0.2", DeviceStatus::kOffline, h.DaysAgo(10));
  h.AddDevice("10.0.0.3", DeviceStatus::kOnline, h.DaysAgo(1));

  assert(manager.PurgeDevices(30) == 1);
  assert(h.Counts().devices == 2);

  // a second run finds nothing left to delete
  assert(manager.PurgeDevices(30) == 0);

  assert(manager.PurgeDevices(0) == 2);
  assert(h.Counts().devices == 0);
}

void TestOfflinePurgeKeepsOnlineDevices() {
  Harness          h;
  RetentionManager manager(h.repo, h.clock, RetentionPolicy{});

  h.AddDevice("10.0.0.1", DeviceStatus::kOffline, h.DaysAgo(20));
  h.AddDevice("10.0.0.2", DeviceStatus::kOnline, h.DaysAgo(20));
  h.AddDevice("10.0.0.3", DeviceStatus::kOffline, h.DaysAgo(2));

  assert(manager.PurgeOfflineDevices(7) == 1);
  assert(manager.PurgeOfflineDevices(0) == 1);
  assert(h.Counts().devices == 1);
}

void TestHistoryAndLatencyPurges() {
  Harness          h;
  RetentionManager manager(h.repo, h.clock, RetentionPolicy{});

  h.AddHistory("10.0.0.1", h.DaysAgo(40), 3);
  h.AddHistory("10.0.0.1", h.DaysAgo(1), 2);
  h.AddLatency("10.0.0.1", h.DaysAgo(40));
  h.AddLatency("10.0.0.1", h.DaysAgo(1));

  assert(manager.PurgeHistory(30) == 3);
  assert(manager.PurgeLatency(30) == 1);
  auto counts = h.Counts();
  assert(counts.history == 2);
  assert(counts.latency == 1);
}

void TestExecutePurgeUsesPolicyAndCompacts() {
  Harness          h;
  RetentionPolicy  configured;
  RetentionManager manager(h.repo, h.clock, configured);

  h.AddHistory("10.0.0.1", h.DaysAgo(40), 150);
  h.AddHistory("10.0.0.1", h.DaysAgo(1), 5);
  h.AddDevice("10.0.0.1", DeviceStatus::kOffline, h.DaysAgo(8));
  h.AddDevice("10.0.0.2", DeviceStatus::kOnline, h.DaysAgo(91));
  h.AddDevice("10.0.0.3", DeviceStatus::kOnline, h.DaysAgo(1));

  auto report = manager.ExecutePurge();
  assert(report.history == 150);
  assert(report.offline_devices == 1);
  assert(report.devices == 1);
  assert(report.latency == 0);
  assert(report.compacted);

  auto again = manager.ExecutePurge();
  assert(again.Total() == 0);
  assert(!again.compacted);
}

void TestPolicyPersistence() {
  Harness         h;
  RetentionPolicy configured;
  configured.history_days = 14;
  RetentionManager manager(h.repo, h.clock, configured);

  assert(manager.GetPolicy().history_days == 14);

  RetentionPolicy stored   = configured;
  stored.history_days      = 3;
  stored.auto_purge        = false;
  stored.purge_interval    = std::chrono::hours(6);
  manager.SetPolicy(stored);

  auto loaded = manager.GetPolicy();
  assert(loaded.history_days == 3);
  assert(!loaded.auto_purge);
  assert(loaded.purge_interval == std::chrono::hours(6));
  assert(loaded.scans_days == 90);

  RetentionPolicy bad;
  bad.purge_interval = std::chrono::milliseconds(0);
  bool threw         = false;
  try {
    manager.SetPolicy(bad);
  } catch (const netsweep::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  // an unreadable stored document falls back to the configured policy
  {
    auto tx = h.repo->Begin();
    auto ok = h.repo->PutSetting(*tx, RetentionManager::kPolicySettingKey, "{not json");
    assert(ok);
    tx->Commit();
  }
  assert(manager.GetPolicy().history_days == 14);
}

void TestPolicyJson() {
  RetentionPolicy policy;
  policy.latency_days = 5;
  auto json           = netsweep::retention::ToJson(policy);
  assert(json.find("\"latency_days\":5") != std::string::npos);
  assert(netsweep::retention::FromJson(json).latency_days == 5);

  auto partial = netsweep::retention::FromJson(R"({"history_days": 1})");
  assert(partial.history_days == 1);
  assert(partial.offline_days == 7);

  bool threw = false;
  try {
    netsweep::retention::FromJson(R"({"history_days": 1, "colour": "red"})");
  } catch (const netsweep::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestFailuresSurfaceAsRetentionErrors() {
  Harness          h;
  RetentionManager manager(h.repo, h.clock, RetentionPolicy{});
  h.AddHistory("10.0.0.1", h.DaysAgo(40), 2);

  h.repo->FailWrites(netsweep::db::ErrorCode::IOError);
  bool threw = false;
  try {
    manager.PurgeHistory(30);
  } catch (const netsweep::util::RetentionError&) {
    threw = true;
  }
  assert(threw);
  assert(h.repo->FailedWrites() == 1);

  // conflicts are retried before giving up
  h.repo->FailWrites(netsweep::db::ErrorCode::Busy);
  threw = false;
  try {
    manager.PurgeHistory(30);
  } catch (const netsweep::util::RetentionError&) {
    threw = true;
  }
  assert(threw);
  assert(h.repo->FailedWrites() == 1 + 3);

  h.repo->Heal();
  assert(h.Counts().history == 2);
  assert(manager.PurgeHistory(30) == 2);
}

void TestStorageStats() {
  Harness          h;
  RetentionManager manager(h.repo, h.clock, RetentionPolicy{});

  h.AddDevice("10.0.0.1", DeviceStatus::kOnline, h.DaysAgo(3));
  h.AddHistory("10.0.0.1", h.DaysAgo(2), 4);
  h.AddLatency("10.0.0.1", h.DaysAgo(1));

  auto stats = manager.GetStorageStats();
  assert(stats.devices == 1);
  assert(stats.history == 4);
  assert(stats.latency == 1);
  assert(stats.oldest_first_seen_ms == std::optional<uint64_t>(h.DaysAgo(3)));
  assert(stats.oldest_history_ms == std::optional<uint64_t>(h.DaysAgo(2)));
  assert(stats.estimated_bytes == 200 + 4 * 100 + 64);
}

} // namespace

int main() {
  TestPurgeDevicesByAge();
  TestOfflinePurgeKeepsOnlineDevices();
  TestHistoryAndLatencyPurges();
  TestExecutePurgeUsesPolicyAndCompacts();
  TestPolicyPersistence();
  TestPolicyJson();
  TestFailuresSurfaceAsRetentionErrors();
  TestStorageStats();

  std::cout << "netsweep_retention_manager: pass\n";
  return 0;
}
