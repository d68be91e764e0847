#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/network_scanner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/reconcile/state_reconciler.hpp"
#include "internal/scan/batch_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "tests/fakes.hpp"

namespace {

using netsweep::core::NetworkScanner;
using netsweep::model::DeviceStatus;
using netsweep::model::ScanMode;
using netsweep::scan::BatchOptions;
using netsweep::scan::BatchScheduler;
using netsweep::scan::Observation;
using netsweep::scan::ProbeFailure;
using netsweep::scan::ProbeResult;
using netsweep::scan::SettleKind;
using netsweep::scan::SettleOutcome;
using namespace netsweep::testing;

struct Harness {
  std::shared_ptr<FakeClock>                              clock    = std::make_shared<FakeClock>();
  std::shared_ptr<netsweep::db::memory::MemoryRepository> memory   = std::make_shared<netsweep::db::memory::MemoryRepository>();
  std::shared_ptr<FaultyRepository>                       repo     = std::make_shared<FaultyRepository>(memory);
  std::shared_ptr<ScriptedProber>                         prober   = std::make_shared<ScriptedProber>();
  std::shared_ptr<ScriptedEnricher>                       enricher = std::make_shared<ScriptedEnricher>();
  std::shared_ptr<netsweep::reconcile::StateReconciler>   reconciler =
      std::make_shared<netsweep::reconcile::StateReconciler>(repo, clock);

  NetworkScanner Scanner(std::size_t concurrency = 4) {
    BatchOptions options;
    options.concurrency       = concurrency;
    options.inter_batch_delay = std::chrono::milliseconds(100);
    return NetworkScanner(prober, enricher, reconciler, repo, options, clock);
  }

  std::optional<netsweep::db::model::DeviceRecord> Device(const std::string& ip) {
    auto tx     = repo->Begin();
    auto device = repo->GetDevice(*tx, ip);
    tx->Commit();
    return device;
  }
};

void TestBatchesAreSeparatedByDelayOnly() {
  auto           clock = std::make_shared<FakeClock>();
  BatchScheduler scheduler({3, std::chrono::milliseconds(250)}, clock);

  std::vector<std::string> addresses;
  for (int i = 1; i <= 7; ++i) addresses.push_back("10.0.0." + std::to_string(i));

  std::atomic<int> worked{0};
  int              settled = 0;
  auto             summary = scheduler.Run(
      addresses,
      [&](const std::string& ip) {
        ++worked;
        return Observation{ip, ProbeResult::Alive(1.0), {}, {}, {}};
      },
      [&](const Observation&) {
        ++settled;
        return SettleOutcome{SettleKind::kCreated, DeviceStatus::kOnline};
      });

  assert(worked == 7);
  assert(settled == 7);
  assert(summary.scanned == 7 && summary.found == 7 && summary.online == 7);
  // three groups, two gaps
  assert(clock->Sleeps() == 2);
}

void TestFailingWorkSettlesAsUnreachableAndSettleFailuresAreCounted() {
  auto           clock = std::make_shared<FakeClock>();
  BatchScheduler scheduler({2, std::chrono::milliseconds(0)}, clock);

  auto summary = scheduler.Run(
      {"10.0.0.1", "10.0.0.2", "10.0.0.3"},
      [](const std::string& ip) -> Observation {
        if (ip == "10.0.0.2") throw std::runtime_error("probe crashed");
        return Observation{ip, ProbeResult::Alive(1.0), {}, {}, {}};
      },
      [](const Observation& o) -> SettleOutcome {
        if (o.ip == "10.0.0.3") throw std::runtime_error("db down");
        if (!o.probe.success) return SettleOutcome{SettleKind::kUpdated, DeviceStatus::kOffline};
        return SettleOutcome{SettleKind::kUpdated, DeviceStatus::kOnline};
      });

  assert(summary.updated == 2);
  assert(summary.online == 1);
  assert(summary.offline == 1);
  assert(summary.persistence_failures == 1);
  assert(clock->Sleeps() == 0);
}

void TestFullScanEnrichesOnlyAnsweringHosts() {
  Harness h;
  h.prober->Alive("192.168.1.1", 0.8);
  h.prober->Alive("192.168.1.7", 12.5);
  h.enricher->Set("192.168.1.1", {std::string("3c:84:6a:01:02:03"), std::string("router.lan"), std::string("TP-Link")});

  auto scanner = h.Scanner();
  auto summary = scanner.ScanRange("192.168.1.1-10", ScanMode::kFull);

  assert(summary.scanned == 10);
  assert(summary.found == 2);
  assert(summary.updated == 0);
  assert(summary.online == 2);
  assert(h.prober->Probes() == 10);
  assert(h.enricher->Calls() == 2);

  auto router = h.Device("192.168.1.1");
  assert(router && router->hostname == std::optional<std::string>("router.lan"));
  assert(router->vendor == std::optional<std::string>("TP-Link"));

  auto bare = h.Device("192.168.1.7");
  assert(bare && !bare->mac.has_value() && !bare->hostname.has_value());
  assert(!h.Device("192.168.1.2").has_value());
}

void TestQuickScanNeverEnriches() {
  Harness h;
  h.prober->Alive("192.168.1.1", 0.8);

  auto scanner = h.Scanner();
  auto summary = scanner.ScanRange("192.168.1.1", ScanMode::kQuick);
  assert(summary.found == 1);
  assert(h.enricher->Calls() == 0);
}

void TestBadRangeIsRejectedBeforeProbing() {
  Harness h;
  auto    scanner = h.Scanner();

  bool threw = false;
  try {
    scanner.ScanRange("8.8.8.0/24", ScanMode::kQuick);
  } catch (const netsweep::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(h.prober->Probes() == 0);
}

void TestRefreshProbesKnownAddressesInQuickMode() {
  Harness h;
  h.prober->Alive("192.168.1.1", 0.8);
  h.prober->Alive("192.168.1.2", 0.9);

  auto scanner = h.Scanner();
  assert(scanner.RefreshKnown().scanned == 0);

  scanner.ScanRange("192.168.1.1-2", ScanMode::kFull);
  const int enrich_calls = h.enricher->Calls();

  h.prober->Down("192.168.1.2");
  auto summary = scanner.RefreshKnown();
  assert(summary.scanned == 2);
  assert(summary.updated == 2);
  assert(summary.online == 1 && summary.offline == 1);
  assert(h.enricher->Calls() == enrich_calls);
  assert(h.Device("192.168.1.2")->status == DeviceStatus::kOffline);
}

void TestScanAddressValidatesPrivateSpace() {
  Harness h;
  h.prober->Alive("10.1.2.3", 2.0);
  auto scanner = h.Scanner();

  auto outcome = scanner.ScanAddress("10.1.2.3", ScanMode::kQuick);
  assert(outcome.kind == SettleKind::kCreated);
  assert(h.Device("10.1.2.3").has_value());

  assert(scanner.ScanAddress("10.1.2.4", ScanMode::kQuick).kind == SettleKind::kSkipped);

  bool threw = false;
  try {
    scanner.ScanAddress("1.1.1.1", ScanMode::kQuick);
  } catch (const netsweep::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    scanner.ScanAddress("10.1.2", ScanMode::kQuick);
  } catch (const netsweep::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestScanFailsOnlyWhenEveryWriteFails() {
  Harness h;
  h.prober->Alive("192.168.1.1", 0.8);
  h.prober->Alive("192.168.1.2", 0.8);
  auto scanner = h.Scanner();

  h.repo->FailWrites(netsweep::db::ErrorCode::IOError);
  bool threw = false;
  try {
    scanner.ScanRange("192.168.1.1-2", ScanMode::kQuick);
  } catch (const netsweep::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);

  // nothing answered, nothing attempted: not a failure
  h.prober->Down("192.168.1.1");
  h.prober->Down("192.168.1.2");
  assert(scanner.ScanRange("192.168.1.1-2", ScanMode::kQuick).persistence_failures == 0);

  h.repo->Heal();
  h.prober->Alive("192.168.1.1", 0.8);
  auto summary = scanner.ScanRange("192.168.1.1-2", ScanMode::kQuick);
  assert(summary.found == 1);
}

} // namespace

int main() {
  TestBatchesAreSeparatedByDelayOnly();
  TestFailingWorkSettlesAsUnreachableAndSettleFailuresAreCounted();
  TestFullScanEnrichesOnlyAnsweringHosts();
  TestQuickScanNeverEnriches();
  TestBadRangeIsRejectedBeforeProbing();
  TestRefreshProbesKnownAddressesInQuickMode();
  TestScanAddressValidatesPrivateSpace();
  TestScanFailsOnlyWhenEveryWriteFails();

  std::cout << "netsweep_network_scanner: pass\n";
  return 0;
}
