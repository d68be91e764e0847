#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/reconcile/state_reconciler.hpp"
#include "tests/fakes.hpp"

namespace {

using netsweep::model::DeviceStatus;
using netsweep::reconcile::StateReconciler;
using netsweep::scan::Observation;
using netsweep::scan::ProbeFailure;
using netsweep::scan::ProbeResult;
using netsweep::scan::SettleKind;
using netsweep::testing::FakeClock;

Observation Online(const std::string& ip, double latency_ms) {
  Observation o;
  o.ip    = ip;
  o.probe = ProbeResult::Alive(latency_ms);
  return o;
}

Observation Offline(const std::string& ip) {
  Observation o;
  o.ip    = ip;
  o.probe = ProbeResult::Failed(ProbeFailure::kUnreachable);
  return o;
}

netsweep::db::model::DeviceRecord Load(netsweep::db::Repository& repo, const std::string& ip) {
  auto tx     = repo.Begin();
  auto device = repo.GetDevice(*tx, ip);
  tx->Commit();
  assert(device.has_value());
  return *device;
}

std::vector<netsweep::db::model::HistoryRecord> History(netsweep::db::Repository& repo, const std::string& ip) {
  auto tx   = repo.Begin();
  auto rows = repo.ListDeviceHistory(*tx, ip, 100);
  tx->Commit();
  return rows;
}

void TestUnknownSilentAddressWritesNothing() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  auto outcome = reconciler.Reconcile(Offline("192.168.1.50"));
  assert(outcome.kind == SettleKind::kSkipped);

  auto tx = repo->Begin();
  assert(!repo->GetDevice(*tx, "192.168.1.50").has_value());
  assert(repo->ListDeviceHistory(*tx, "192.168.1.50", 10).empty());
  tx->Commit();
}

void TestCreateStampsIdentityAndProvenance() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  auto observation     = Online("192.168.1.10", 3.2);
  observation.mac      = "aa:bb:cc:00:11:22";
  observation.hostname = "nas.lan";

  auto outcome = reconciler.Reconcile(observation);
  assert(outcome.kind == SettleKind::kCreated);
  assert(outcome.status == DeviceStatus::kOnline);

  auto device = Load(*repo, "192.168.1.10");
  assert(device.first_seen_ms == clock->NowMs());
  assert(device.last_seen_ms == clock->NowMs());
  assert(device.scan_count == 1);
  assert(device.mac == std::optional<std::string>("aa:bb:cc:00:11:22"));
  assert(device.hostname_source == std::optional<std::string>(netsweep::reconcile::kScannerSource));
  assert(!device.vendor.has_value() && !device.vendor_source.has_value());
  assert(device.ping_latency_ms == std::optional<double>(3.2));
  assert(device.extra_info == "{}");

  auto history = History(*repo, "192.168.1.10");
  assert(history.size() == 1);
  assert(history[0].status == DeviceStatus::kOnline);
}

void TestLastSeenMovesOnlyOnTransitions() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  const std::string ip = "10.0.0.5";
  const auto        t0 = clock->NowMs();
  reconciler.Reconcile(Online(ip, 1.0));

  // online -> online: stays at T0
  clock->Advance(std::chrono::minutes(5));
  reconciler.Reconcile(Online(ip, 2.0));
  assert(Load(*repo, ip).last_seen_ms == t0);

  // online -> offline: moves to T2
  clock->Advance(std::chrono::minutes(5));
  const auto t2 = clock->NowMs();
  reconciler.Reconcile(Offline(ip));
  auto offline = Load(*repo, ip);
  assert(offline.last_seen_ms == t2);
  assert(offline.status == DeviceStatus::kOffline);
  assert(!offline.ping_latency_ms.has_value());

  // offline -> offline: stays
  clock->Advance(std::chrono::minutes(5));
  reconciler.Reconcile(Offline(ip));
  assert(Load(*repo, ip).last_seen_ms == t2);

  // offline -> online: moves
  clock->Advance(std::chrono::minutes(5));
  const auto t4 = clock->NowMs();
  reconciler.Reconcile(Online(ip, 4.0));
  auto back = Load(*repo, ip);
  assert(back.last_seen_ms == t4);
  assert(back.first_seen_ms == t0);
  assert(back.scan_count == 5);
  assert(History(*repo, ip).size() == 5);
}

void TestQuickPassesKeepIdentityFields() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  auto first     = Online("192.168.1.20", 1.5);
  first.mac      = "b8:27:eb:01:02:03";
  first.hostname = "pi.lan";
  first.vendor   = "Raspberry Pi Foundation";
  reconciler.Reconcile(first);

  // quick-mode observations carry no identity, even when the host is down
  clock->Advance(std::chrono::minutes(1));
  reconciler.Reconcile(Offline("192.168.1.20"));
  clock->Advance(std::chrono::minutes(1));
  reconciler.Reconcile(Offline("192.168.1.20"));

  auto device = Load(*repo, "192.168.1.20");
  assert(device.mac == std::optional<std::string>("b8:27:eb:01:02:03"));
  assert(device.hostname == std::optional<std::string>("pi.lan"));
  assert(device.vendor == std::optional<std::string>("Raspberry Pi Foundation"));
  assert(device.scan_count == 3);

  auto history = History(*repo, "192.168.1.20");
  assert(history.size() == 3);
  assert(history[0].status == DeviceStatus::kOffline);
  assert(history[1].status == DeviceStatus::kOffline);
  assert(history[2].status == DeviceStatus::kOnline);
}

void TestNewerIdentityReplacesOlder() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  auto first     = Online("192.168.1.30", 1.0);
  first.hostname = "old-name";
  reconciler.Reconcile(first);

  auto second     = Online("192.168.1.30", 1.0);
  second.hostname = "new-name";
  second.vendor   = "Sonos";
  reconciler.Reconcile(second);

  auto device = Load(*repo, "192.168.1.30");
  assert(device.hostname == std::optional<std::string>("new-name"));
  assert(device.vendor_source == std::optional<std::string>(netsweep::reconcile::kScannerSource));
}

void TestConcurrentReconcilesOfOneAddressAreSerialized() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  reconciler.Reconcile(Online("192.168.1.40", 1.0));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&reconciler] {
      for (int j = 0; j < 5; ++j) reconciler.Reconcile(Online("192.168.1.40", 2.0));
    });
  }
  for (auto& t : threads) t.join();

  assert(Load(*repo, "192.168.1.40").scan_count == 41);
  assert(History(*repo, "192.168.1.40").size() == 41);
  assert(reconciler.TrackedAddresses() == 0);
}

// Two reconcilers share nothing in-process; only the repository lock orders them.
void TestSeparateReconcilersOnOneStoreAreSerialized() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler scheduled(repo, clock);
  StateReconciler manual(repo, clock);

  scheduled.Reconcile(Online("192.168.1.45", 1.0));

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&scheduled] {
      for (int j = 0; j < 5; ++j) scheduled.Reconcile(Online("192.168.1.45", 2.0));
    });
    threads.emplace_back([&manual] {
      for (int j = 0; j < 5; ++j) manual.Reconcile(Offline("192.168.1.45"));
    });
  }
  for (auto& t : threads) t.join();

  assert(Load(*repo, "192.168.1.45").scan_count == 41);
  assert(History(*repo, "192.168.1.45").size() == 41);
}

void TestAddressMutexesAreDroppedAfterUse() {
  auto repo  = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto clock = std::make_shared<FakeClock>();
  StateReconciler reconciler(repo, clock);

  for (int host = 1; host <= 50; ++host) {
    reconciler.Reconcile(Online("10.1.1." + std::to_string(host), 1.0));
    reconciler.Reconcile(Offline("10.1.2." + std::to_string(host)));
  }
  assert(reconciler.TrackedAddresses() == 0);
}

} // namespace

int main() {
  TestUnknownSilentAddressWritesNothing();
  TestCreateStampsIdentityAndProvenance();
  TestLastSeenMovesOnlyOnTransitions();
  TestQuickPassesKeepIdentityFields();
  TestNewerIdentityReplacesOlder();
  TestConcurrentReconcilesOfOneAddressAreSerialized();
  TestSeparateReconcilersOnOneStoreAreSerialized();
  TestAddressMutexesAreDroppedAfterUse();

  std::cout << "netsweep_state_reconciler: pass\n";
  return 0;
}
