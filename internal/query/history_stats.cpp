#include "history_stats.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/util/time.hpp"

namespace netsweep::query {

using netsweep::model::DeviceStatus;

namespace {

constexpr uint64_t kHourMs = 60ull * 60 * 1000;

struct BucketSets {
  std::set<std::string> all;
  std::set<std::string> online;
  std::set<std::string> offline;
};

std::optional<double> Average(const std::vector<double>& values) {
  if (values.empty()) return std::nullopt;
  double sum = 0.0;
  for (double v : values) sum += v;
  return sum / static_cast<double>(values.size());
}

} // namespace

std::vector<TimeBucket> BucketHistory(const std::vector<db::model::HistoryRecord>& rows, std::size_t max_buckets) {
  std::map<uint64_t, BucketSets> buckets;
  for (const auto& row : rows) {
    auto& sets = buckets[row.seen_at_ms - row.seen_at_ms % kBucketWidthMs];
    sets.all.insert(row.ip);
    if (row.status == DeviceStatus::kOnline) sets.online.insert(row.ip);
    if (row.status == DeviceStatus::kOffline) sets.offline.insert(row.ip);
  }

  std::vector<TimeBucket> out;
  out.reserve(buckets.size());
  for (const auto& [start_ms, sets] : buckets) {
    TimeBucket bucket;
    bucket.start_ms = start_ms;
    bucket.label    = util::FormatUtc(start_ms, "%Y-%m-%d %H:%M");
    bucket.total    = sets.all.size();
    bucket.online   = sets.online.size();
    bucket.offline  = sets.offline.size();
    out.push_back(std::move(bucket));
  }

  if (out.size() > max_buckets) {
    out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(max_buckets));
  }
  return out;
}

LatencyStatistics SummarizeLatency(const std::vector<db::model::LatencyRecord>& samples, uint64_t now_ms) {
  const uint64_t day_start  = now_ms > util::kMillisPerDay ? now_ms - util::kMillisPerDay : 0;
  const uint64_t hour_start = now_ms > kHourMs ? now_ms - kHourMs : 0;

  LatencyStatistics   stats;
  std::vector<double> last_hour;
  std::vector<double> last_day;
  uint64_t            lost = 0;

  for (const auto& sample : samples) {
    if (sample.measured_at_ms < day_start) continue;
    ++stats.total_measurements;
    if (sample.packet_loss) {
      ++lost;
      continue;
    }
    if (!sample.latency_ms) continue;

    const double latency = *sample.latency_ms;
    last_day.push_back(latency);
    if (sample.measured_at_ms >= hour_start) last_hour.push_back(latency);
  }

  stats.avg_last_hour_ms = Average(last_hour);
  stats.avg_24h_ms       = Average(last_day);
  if (!last_day.empty()) {
    const auto [lo, hi] = std::minmax_element(last_day.begin(), last_day.end());
    stats.min_ms        = *lo;
    stats.max_ms        = *hi;
  }
  if (stats.total_measurements > 0) {
    stats.packet_loss_percent = static_cast<double>(lost) * 100.0 / static_cast<double>(stats.total_measurements);
  }
  return stats;
}

} // namespace netsweep::query
