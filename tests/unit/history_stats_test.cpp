#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/query/history_stats.hpp"

namespace {

using netsweep::db::model::HistoryRecord;
using netsweep::db::model::LatencyRecord;
using netsweep::model::DeviceStatus;
using namespace netsweep::query;

constexpr uint64_t kT0     = 1'700'000'000'000ull; // 2023-11-14 22:13:20 UTC
constexpr uint64_t kMinute = 60'000ull;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestBucketsCountDistinctAddresses() {
  std::vector<HistoryRecord> rows = {
      {"10.0.0.1", DeviceStatus::kOnline, 1.0, kT0},
      {"10.0.0.1", DeviceStatus::kOnline, 1.0, kT0 + kMinute},
      {"10.0.0.2", DeviceStatus::kOffline, std::nullopt, kT0 + 2 * kMinute},
      // next slot: 22:15
      {"10.0.0.1", DeviceStatus::kOffline, std::nullopt, kT0 + 5 * kMinute},
  };

  auto buckets = BucketHistory(rows);
  assert(buckets.size() == 2);
  assert(buckets[0].label == "2023-11-14 22:00");
  assert(buckets[0].start_ms == 1'699'999'200'000ull);
  assert(buckets[0].total == 2);
  assert(buckets[0].online == 1);
  assert(buckets[0].offline == 1);
  assert(buckets[1].label == "2023-11-14 22:15");
  assert(buckets[1].total == 1 && buckets[1].offline == 1);
}

void TestOnlyNewestBucketsAreKept() {
  std::vector<HistoryRecord> rows;
  for (uint64_t i = 0; i < 60; ++i) rows.push_back({"10.0.0.1", DeviceStatus::kOnline, 1.0, kT0 + i * kBucketWidthMs});

  auto buckets = BucketHistory(rows);
  assert(buckets.size() == kMaxBuckets);
  assert(buckets.back().start_ms > buckets.front().start_ms);
  assert(buckets.front().start_ms == (kT0 + 12 * kBucketWidthMs) - (kT0 + 12 * kBucketWidthMs) % kBucketWidthMs);

  assert(BucketHistory({}).empty());
}

void TestLatencySummary() {
  const uint64_t now = kT0 + 48 * 60 * kMinute;

  std::vector<LatencyRecord> samples = {
      {"10.0.0.1", 100.0, false, now - 30 * 60 * kMinute}, // older than 24 h
      {"10.0.0.1", 10.0, false, now - 5 * 60 * kMinute},
      {"10.0.0.1", 30.0, false, now - 10 * kMinute},
      {"10.0.0.1", std::nullopt, true, now - 5 * kMinute},
      {"10.0.0.1", 20.0, false, now - kMinute},
  };

  auto stats = SummarizeLatency(samples, now);
  assert(stats.total_measurements == 4);
  assert(Near(stats.packet_loss_percent, 25.0));
  assert(stats.avg_last_hour_ms && Near(*stats.avg_last_hour_ms, 25.0));
  assert(stats.avg_24h_ms && Near(*stats.avg_24h_ms, 20.0));
  assert(stats.min_ms && Near(*stats.min_ms, 10.0));
  assert(stats.max_ms && Near(*stats.max_ms, 30.0));

  auto empty = SummarizeLatency({}, now);
  assert(empty.total_measurements == 0);
  assert(!empty.avg_24h_ms && !empty.min_ms);
  assert(Near(empty.packet_loss_percent, 0.0));
}

} // namespace

int main() {
  TestBucketsCountDistinctAddresses();
  TestOnlyNewestBucketsAreKept();
  TestLatencySummary();

  std::cout << "netsweep_history_stats: pass\n";
  return 0;
}
