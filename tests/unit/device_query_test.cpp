#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/query/device_query.hpp"
#include "internal/query/device_sort.hpp"

namespace {

using netsweep::db::SortOrder;
using netsweep::db::model::DeviceRecord;
using netsweep::model::DeviceStatus;
using namespace netsweep::query;

DeviceRecord Device(const std::string& ip, std::optional<std::string> hostname = std::nullopt, uint64_t last_seen_ms = 1000) {
  DeviceRecord d;
  d.ip            = ip;
  d.hostname      = std::move(hostname);
  d.status        = DeviceStatus::kOnline;
  d.first_seen_ms = 1;
  d.last_seen_ms  = last_seen_ms;
  d.scan_count    = 1;
  return d;
}

std::shared_ptr<netsweep::db::memory::MemoryRepository> Seed(const std::vector<DeviceRecord>& devices) {
  auto repo = std::make_shared<netsweep::db::memory::MemoryRepository>();
  auto tx   = repo->Begin();
  for (const auto& d : devices) {
    auto inserted = repo->InsertDevice(*tx, d);
    assert(inserted);
  }
  tx->Commit();
  return repo;
}

std::vector<std::string> Ips(const std::vector<DeviceRecord>& devices) {
  std::vector<std::string> out;
  for (const auto& d : devices) out.push_back(d.ip);
  return out;
}

void TestIpOrderIsNumeric() {
  assert(CompareIpv4("192.168.1.9", "192.168.1.10") < 0);
  assert(CompareIpv4("10.0.0.1", "9.255.255.255") > 0);
  assert(CompareIpv4("not-an-ip", "10.0.0.1") > 0);
  assert(CompareIpv4("192.168.1.1", "192.168.1.1") == 0);

  std::vector<DeviceRecord> devices = {Device("192.168.1.100"), Device("192.168.1.9"), Device("192.168.1.20")};
  SortDevices(devices, DerivedSortField::kIp, SortOrder::kAsc);
  assert((Ips(devices) == std::vector<std::string>{"192.168.1.9", "192.168.1.20", "192.168.1.100"}));

  SortDevices(devices, DerivedSortField::kIp, SortOrder::kDesc);
  assert((Ips(devices) == std::vector<std::string>{"192.168.1.100", "192.168.1.20", "192.168.1.9"}));
}

void TestEmptyValuesSortLastInBothDirections() {
  assert(IsEmptySortValue(std::nullopt));
  assert(IsEmptySortValue(std::string("   ")));
  assert(IsEmptySortValue(std::string("--")));
  assert(!IsEmptySortValue(std::string("a")));

  std::vector<DeviceRecord> devices = {Device("10.0.0.1", std::nullopt), Device("10.0.0.2", std::string("beta")),
                                       Device("10.0.0.3", std::string("--")), Device("10.0.0.4", std::string("Alpha")),
                                       Device("10.0.0.5", std::string("gamma"))};

  auto asc = devices;
  SortDevices(asc, DerivedSortField::kHostname, SortOrder::kAsc);
  assert((Ips(asc) == std::vector<std::string>{"10.0.0.4", "10.0.0.2", "10.0.0.5", "10.0.0.1", "10.0.0.3"}));

  auto desc = devices;
  SortDevices(desc, DerivedSortField::kHostname, SortOrder::kDesc);
  assert((Ips(desc) == std::vector<std::string>{"10.0.0.5", "10.0.0.2", "10.0.0.4", "10.0.0.1", "10.0.0.3"}));
}

void TestDerivedSortPaginatesAfterSorting() {
  std::vector<DeviceRecord> devices;
  // storage order (ip text) differs from numeric order
  for (int i = 1; i <= 10; ++i) devices.push_back(Device("192.168.1." + std::to_string(i * 11)));
  DeviceQueryEngine engine(Seed(devices));

  DeviceQuery query;
  query.sort   = SortField::kIp;
  query.order  = SortOrder::kAsc;
  query.limit  = 2;
  query.offset = 2;

  auto page = engine.Find(query);
  assert(page.total == 10);
  assert((Ips(page.devices) == std::vector<std::string>{"192.168.1.33", "192.168.1.44"}));

  query.offset = 9;
  page         = engine.Find(query);
  assert((Ips(page.devices) == std::vector<std::string>{"192.168.1.110"}));

  query.offset = 20;
  assert(engine.Find(query).devices.empty());
}

void TestNativeSortAndFilters() {
  auto a            = Device("10.0.0.1", std::string("printer"), 3000);
  a.ping_latency_ms = 9.0;
  auto b            = Device("10.0.0.2", std::string("nas"), 1000);
  b.ping_latency_ms = 2.0;
  auto c            = Device("10.0.0.3", std::nullopt, 2000);
  c.status          = DeviceStatus::kOffline;
  c.extra_info      = R"({"openPorts":[{"port":22,"service":"OpenSSH"}]})";
  DeviceQueryEngine engine(Seed({a, b, c}));

  // default: last seen, newest first
  assert((Ips(engine.Find({}).devices) == std::vector<std::string>{"10.0.0.1", "10.0.0.3", "10.0.0.2"}));

  DeviceQuery by_latency;
  by_latency.sort  = SortField::kPingLatency;
  by_latency.order = SortOrder::kAsc;
  assert((Ips(engine.Find(by_latency).devices) == std::vector<std::string>{"10.0.0.2", "10.0.0.1", "10.0.0.3"}));
  by_latency.order = SortOrder::kDesc;
  assert((Ips(engine.Find(by_latency).devices) == std::vector<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"}));

  DeviceQuery offline;
  offline.filter.status = DeviceStatus::kOffline;
  auto offline_page     = engine.Find(offline);
  assert(offline_page.total == 1 && offline_page.devices[0].ip == "10.0.0.3");

  DeviceQuery search;
  search.filter.search = "openssh";
  assert((Ips(engine.Find(search).devices) == std::vector<std::string>{"10.0.0.3"}));
  search.filter.search = "PRINT";
  assert((Ips(engine.Find(search).devices) == std::vector<std::string>{"10.0.0.1"}));

  netsweep::db::DeviceFilter window;
  window.last_seen_since_ms = 1500;
  window.last_seen_until_ms = 2500;
  assert(engine.Count(window) == 1);

  DeviceQuery paged;
  paged.limit = 1;
  auto first  = engine.Find(paged);
  assert(first.total == 3 && first.devices.size() == 1);
}

void TestSortFieldNames() {
  assert(ParseSortField("lastSeen") == SortField::kLastSeen);
  assert(ParseSortField("last_seen") == SortField::kLastSeen);
  assert(ParseSortField("vendor") == SortField::kVendor);
  assert(!ParseSortField("color").has_value());
  assert(ToString(SortField::kScanCount) == "scan_count");
}

} // namespace

int main() {
  TestIpOrderIsNumeric();
  TestEmptyValuesSortLastInBothDirections();
  TestDerivedSortPaginatesAfterSorting();
  TestNativeSortAndFilters();
  TestSortFieldNames();

  std::cout << "netsweep_device_query: pass\n";
  return 0;
}
