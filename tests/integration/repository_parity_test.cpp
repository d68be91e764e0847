#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/reconcile/state_reconciler.hpp"
#include "tests/fakes.hpp"

namespace {

using netsweep::db::DeviceFilter;
using netsweep::db::ErrorCode;
using netsweep::db::NativeOrder;
using netsweep::db::NativeSortField;
using netsweep::db::Pagination;
using netsweep::db::Repository;
using netsweep::db::SortOrder;
using netsweep::db::memory::MemoryRepository;
using netsweep::db::model::DeviceRecord;
using netsweep::db::model::HistoryRecord;
using netsweep::db::model::LatencyRecord;
using netsweep::db::model::MonitoringToggleRecord;
using netsweep::model::DeviceStatus;

constexpr uint64_t kBase = 1'700'000'000'000ull;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
  // a second handle on the same store, as another process would open it
  std::function<std::shared_ptr<Repository>(const std::shared_ptr<Repository>&)> open_peer;
};

DeviceRecord MakeDevice(const std::string& ip, DeviceStatus status, uint64_t last_seen_ms, std::optional<double> latency = std::nullopt) {
  DeviceRecord d;
  d.ip              = ip;
  d.status          = status;
  d.ping_latency_ms = latency;
  d.first_seen_ms   = last_seen_ms;
  d.last_seen_ms    = last_seen_ms;
  d.scan_count      = 1;
  return d;
}

std::vector<std::string> Ips(const std::vector<DeviceRecord>& devices) {
  std::vector<std::string> out;
  for (const auto& d : devices) out.push_back(d.ip);
  return out;
}

// Shared databases (postgres) keep rows from earlier runs.
void Reset(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.DeleteDevicesLastSeenBefore(*tx, std::nullopt, std::nullopt));
  assert(repo.DeleteHistoryBefore(*tx, std::nullopt));
  assert(repo.DeleteLatencyBefore(*tx, std::nullopt));
  assert(repo.ReplaceVendors(*tx, {}));
  tx->Commit();
}

void VerifyDeviceLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  auto device            = MakeDevice("192.168.50.1", DeviceStatus::kOnline, kBase, 1.25);
  device.mac             = "aa:bb:cc:dd:ee:ff";
  device.hostname        = "router.lan";
  device.hostname_source = "scanner";
  device.extra_info      = R"({"openPorts":[{"port":443,"service":"nginx"}]})";
  assert(repo.InsertDevice(*tx, device));

  auto duplicate = repo.InsertDevice(*tx, device);
  assert(!duplicate && duplicate.code == ErrorCode::AlreadyExists);

  auto read = repo.GetDevice(*tx, "192.168.50.1");
  assert(read.has_value());
  assert(read->mac == device.mac);
  assert(read->hostname_source == std::optional<std::string>("scanner"));
  assert(!read->vendor.has_value());
  assert(read->ping_latency_ms == std::optional<double>(1.25));
  // jsonb may reformat the document
  assert(read->extra_info.find("nginx") != std::string::npos);

  read->status          = DeviceStatus::kOffline;
  read->ping_latency_ms = std::nullopt;
  read->scan_count      = 2;
  assert(repo.UpdateDevice(*tx, *read));

  auto updated = repo.GetDevice(*tx, "192.168.50.1");
  assert(updated->status == DeviceStatus::kOffline);
  assert(!updated->ping_latency_ms.has_value());
  assert(updated->scan_count == 2);

  auto missing = repo.UpdateDevice(*tx, MakeDevice("192.168.50.99", DeviceStatus::kOnline, kBase));
  assert(!missing && missing.code == ErrorCode::NotFound);

  auto removed = repo.DeleteDevice(*tx, "192.168.50.1");
  assert(removed && removed.affected == 1);
  auto absent = repo.DeleteDevice(*tx, "192.168.50.1");
  assert(absent && absent.affected == 0);
  assert(!repo.GetDevice(*tx, "192.168.50.1").has_value());

  tx->Commit();
}

void VerifyListing(Repository& repo) {
  {
    auto tx = repo.Begin();
    auto a  = MakeDevice("10.9.0.1", DeviceStatus::kOnline, kBase + 3000, 9.0);
    auto b  = MakeDevice("10.9.0.2", DeviceStatus::kOnline, kBase + 1000, 2.0);
    auto c  = MakeDevice("10.9.0.3", DeviceStatus::kOffline, kBase + 2000);
    auto d  = MakeDevice("172.16.0.4", DeviceStatus::kUnknown, kBase + 4000);
    a.hostname   = "Printer";
    c.extra_info = R"({"openPorts":[{"port":22,"service":"OpenSSH"}],"tag":"rack-7"})";
    for (const auto& device : {a, b, c, d}) assert(repo.InsertDevice(*tx, device));
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto all = repo.ListDevices(*tx, {}, NativeOrder{NativeSortField::kLastSeen, SortOrder::kDesc}, std::nullopt);
  assert((Ips(all) == std::vector<std::string>{"172.16.0.4", "10.9.0.1", "10.9.0.3", "10.9.0.2"}));

  auto latency_asc = repo.ListDevices(*tx, {}, NativeOrder{NativeSortField::kPingLatency, SortOrder::kAsc}, std::nullopt);
  assert((Ips(latency_asc) == std::vector<std::string>{"10.9.0.2", "10.9.0.1", "10.9.0.3", "172.16.0.4"}));
  auto latency_desc = repo.ListDevices(*tx, {}, NativeOrder{NativeSortField::kPingLatency, SortOrder::kDesc}, std::nullopt);
  assert((Ips(latency_desc) == std::vector<std::string>{"10.9.0.1", "10.9.0.2", "10.9.0.3", "172.16.0.4"}));

  auto page = repo.ListDevices(*tx, {}, NativeOrder{NativeSortField::kLastSeen, SortOrder::kAsc}, Pagination{2, 1});
  assert((Ips(page) == std::vector<std::string>{"10.9.0.3", "10.9.0.1"}));

  DeviceFilter online;
  online.status = DeviceStatus::kOnline;
  assert(repo.CountDevices(*tx, online) == 2);

  DeviceFilter prefix;
  prefix.ip_prefix = "10.9.";
  assert(repo.CountDevices(*tx, prefix) == 3);

  DeviceFilter search;
  search.search = "openssh";
  assert((Ips(repo.ListDevices(*tx, search, std::nullopt, std::nullopt)) == std::vector<std::string>{"10.9.0.3"}));
  search.search = "RACK-7";
  assert(repo.CountDevices(*tx, search) == 1);
  search.search = "printer";
  assert(repo.CountDevices(*tx, search) == 1);
  // keys are not searched
  search.search = "openPorts";
  assert(repo.CountDevices(*tx, search) == 0);

  DeviceFilter window;
  window.last_seen_since_ms = kBase + 1500;
  window.last_seen_until_ms = kBase + 3000;
  assert(repo.CountDevices(*tx, window) == 2);

  auto counts = repo.CountByStatus(*tx);
  assert(counts.total == 4 && counts.online == 2 && counts.offline == 1 && counts.unknown == 1);
  assert(counts.max_last_seen_ms == std::optional<uint64_t>(kBase + 4000));

  auto ips = repo.ListDeviceIps(*tx);
  assert(ips.size() == 4);

  tx->Commit();

  auto purge = repo.Begin();
  auto stale = repo.DeleteDevicesLastSeenBefore(*purge, kBase + 2500, DeviceStatus::kOffline);
  assert(stale && stale.affected == 1);
  auto old = repo.DeleteDevicesLastSeenBefore(*purge, kBase + 2500, std::nullopt);
  assert(old && old.affected == 1);
  auto rest = repo.DeleteDevicesLastSeenBefore(*purge, std::nullopt, std::nullopt);
  assert(rest && rest.affected == 2);
  purge->Commit();
}

void VerifyHistory(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.AppendHistory(*tx, {"10.8.0.1", DeviceStatus::kOnline, 1.0, kBase + 100}));
  assert(repo.AppendHistory(*tx, {"10.8.0.2", DeviceStatus::kOffline, std::nullopt, kBase + 200}));
  assert(repo.AppendHistory(*tx, {"10.8.0.1", DeviceStatus::kOffline, std::nullopt, kBase + 300}));
  assert(repo.AppendHistory(*tx, {"10.8.0.1", DeviceStatus::kOnline, 2.0, kBase + 400}));
  tx->Commit();

  tx         = repo.Begin();
  auto since = repo.ListHistorySince(*tx, kBase + 150);
  assert(since.size() == 3);
  assert(since.front().seen_at_ms == kBase + 200 && since.back().seen_at_ms == kBase + 400);

  auto device = repo.ListDeviceHistory(*tx, "10.8.0.1", 2);
  assert(device.size() == 2);
  assert(device[0].seen_at_ms == kBase + 400 && device[0].ping_latency_ms == std::optional<double>(2.0));
  assert(device[1].status == DeviceStatus::kOffline && !device[1].ping_latency_ms.has_value());

  auto deleted = repo.DeleteHistoryBefore(*tx, kBase + 250);
  assert(deleted && deleted.affected == 2);
  auto everything = repo.DeleteHistoryBefore(*tx, std::nullopt);
  assert(everything && everything.affected == 2);
  tx->Commit();
}

void VerifyLatencyAndMonitoring(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpsertMonitoring(*tx, MonitoringToggleRecord{"10.7.0.1", true, kBase}));
  assert(repo.UpsertMonitoring(*tx, MonitoringToggleRecord{"10.7.0.1", false, kBase + 1}));
  assert(repo.UpsertMonitoring(*tx, MonitoringToggleRecord{"10.7.0.2", true, kBase + 2}));

  assert(repo.AppendLatency(*tx, LatencyRecord{"10.7.0.1", 3.5, false, kBase + 10}));
  assert(repo.AppendLatency(*tx, LatencyRecord{"10.7.0.1", std::nullopt, true, kBase + 20}));
  assert(repo.AppendLatency(*tx, LatencyRecord{"10.7.0.2", 1.0, false, kBase + 30}));
  tx->Commit();

  tx          = repo.Begin();
  auto toggle = repo.GetMonitoring(*tx, "10.7.0.1");
  assert(toggle && !toggle->enabled && toggle->updated_at_ms == kBase + 1);
  assert(!repo.GetMonitoring(*tx, "10.7.0.3").has_value());

  bool found_enabled = false;
  for (const auto& t : repo.ListMonitoring(*tx)) {
    if (t.ip == "10.7.0.2") found_enabled = t.enabled;
  }
  assert(found_enabled);

  auto samples = repo.ListLatencySince(*tx, "10.7.0.1", kBase);
  assert(samples.size() == 2);
  assert(samples[0].latency_ms == std::optional<double>(3.5));
  assert(samples[1].packet_loss && !samples[1].latency_ms.has_value());
  assert(repo.ListLatencySince(*tx, "10.7.0.1", kBase + 15).size() == 1);

  auto purged = repo.DeleteLatencyBefore(*tx, kBase + 25);
  assert(purged && purged.affected == 2);
  tx->Commit();
}

void VerifyVendorsAndSettings(Repository& repo) {
  auto tx       = repo.Begin();
  auto replaced = repo.ReplaceVendors(*tx, {{"b8:27:eb", "Raspberry Pi Foundation"}, {"00:50:56", "VMware"}});
  assert(replaced && replaced.affected == 2);
  assert(repo.LookupVendor(*tx, "b8:27:eb") == std::optional<std::string>("Raspberry Pi Foundation"));

  replaced = repo.ReplaceVendors(*tx, {{"00:50:56", "VMware, Inc."}});
  assert(replaced && replaced.affected == 1);
  assert(!repo.LookupVendor(*tx, "b8:27:eb").has_value());

  assert(repo.PutSetting(*tx, "retention_policy", R"({"history_days":3})"));
  assert(repo.PutSetting(*tx, "retention_policy", R"({"history_days":4})"));
  assert(repo.GetSetting(*tx, "retention_policy") == std::optional<std::string>(R"({"history_days":4})"));
  assert(!repo.GetSetting(*tx, "nope").has_value());
  tx->Commit();

  tx = repo.Begin();
  assert(repo.InsertDevice(*tx, MakeDevice("10.6.0.1", DeviceStatus::kOnline, kBase + 50)));
  assert(repo.AppendHistory(*tx, {"10.6.0.1", DeviceStatus::kOnline, 1.0, kBase + 60}));
  auto storage = repo.CountStorage(*tx);
  assert(storage.devices == 1 && storage.history == 1 && storage.vendors == 1);
  assert(storage.oldest_first_seen_ms == std::optional<uint64_t>(kBase + 50));
  assert(storage.oldest_history_ms == std::optional<uint64_t>(kBase + 60));
  tx->Commit();

  assert(repo.Compact());
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertDevice(*tx, MakeDevice("10.5.0.1", DeviceStatus::kOnline, kBase)));
    tx->Rollback();
  }
  {
    // destructor without commit
    auto tx = repo.Begin();
    assert(repo.AppendHistory(*tx, {"10.5.0.1", DeviceStatus::kOnline, 1.0, kBase}));
  }

  auto tx = repo.Begin();
  assert(!repo.GetDevice(*tx, "10.5.0.1").has_value());
  assert(repo.ListDeviceHistory(*tx, "10.5.0.1", 10).empty());
  tx->Commit();
}

void VerifyIsolation(Repository& repo, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  auto writer = repo.Begin();
  assert(repo.InsertDevice(*writer, MakeDevice("10.4.0.1", DeviceStatus::kOnline, kBase)));

  auto reader = repo.Begin();
  assert(!repo.GetDevice(*reader, "10.4.0.1").has_value());
  reader->Commit();

  writer->Commit();

  auto after = repo.Begin();
  assert(repo.GetDevice(*after, "10.4.0.1").has_value());
  after->Commit();
}

// Each handle gets its own reconciler, so only the store orders the writers.
void VerifyCrossHandleReconcile(BackendFactory& backend, const std::shared_ptr<Repository>& repo) {
  auto peer  = backend.open_peer(repo);
  auto clock = std::make_shared<netsweep::testing::FakeClock>();

  netsweep::reconcile::StateReconciler scheduled(repo, clock);
  netsweep::reconcile::StateReconciler manual(peer, clock);

  auto online  = netsweep::scan::Observation{};
  online.ip    = "10.5.0.1";
  online.probe = netsweep::scan::ProbeResult::Alive(1.0);

  auto offline  = netsweep::scan::Observation{};
  offline.ip    = "10.5.0.1";
  offline.probe = netsweep::scan::ProbeResult::Failed(netsweep::scan::ProbeFailure::kUnreachable);

  scheduled.Reconcile(online);

  std::thread refresh([&] {
    for (int i = 0; i < 10; ++i) scheduled.Reconcile(online);
  });
  std::thread manual_scan([&] {
    for (int i = 0; i < 10; ++i) manual.Reconcile(offline);
  });
  refresh.join();
  manual_scan.join();

  auto tx = repo->Begin();
  auto d  = repo->GetDevice(*tx, "10.5.0.1");
  assert(d.has_value());
  assert(d->scan_count == 21);
  assert(repo->ListDeviceHistory(*tx, "10.5.0.1", 100).size() == 21);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  Reset(*repo);
  {
    auto tx       = repo->Begin();
    auto device   = MakeDevice("10.3.0.1", DeviceStatus::kOnline, kBase, 0.5);
    device.vendor = "Sonos";
    assert(repo->InsertDevice(*tx, device));
    assert(repo->AppendHistory(*tx, {"10.3.0.1", DeviceStatus::kOnline, 0.5, kBase}));
    assert(repo->PutSetting(*tx, "durable", "yes"));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto d  = repo->GetDevice(*tx, "10.3.0.1");
  assert(d.has_value());
  assert(d->vendor == std::optional<std::string>("Sonos"));
  assert(repo->ListDeviceHistory(*tx, "10.3.0.1", 10).size() == 1);
  assert(repo->GetSetting(*tx, "durable") == std::optional<std::string>("yes"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() -> std::shared_ptr<Repository> { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
      .open_peer                      = [](const std::shared_ptr<Repository>& repo) { return repo; },
  };
}

#if NETSWEEP_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("netsweep_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    netsweep::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return netsweep::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
      .open_peer                      = [make_repo](const std::shared_ptr<Repository>&) { return make_repo(); },
  };
}
#endif

#if NETSWEEP_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("NETSWEEP_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("NETSWEEP_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    netsweep::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    return netsweep::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
      .open_peer                      = [make_repo](const std::shared_ptr<Repository>&) { return make_repo(); },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  Reset(*repo);

  VerifyDeviceLifecycle(*repo);
  VerifyListing(*repo);
  VerifyHistory(*repo);
  VerifyLatencyAndMonitoring(*repo);
  VerifyVendorsAndSettings(*repo);
  Reset(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyIsolation(*repo, backend.supports_parallel_transactions);
  Reset(*repo);
  VerifyCrossHandleReconcile(backend, repo);
  Reset(*repo);
  repo.reset();

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if NETSWEEP_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if NETSWEEP_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "netsweep_integration_repository_parity: pass\n";
  return 0;
}
