#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/history_record.hpp"
#include "internal/db/model/latency_record.hpp"

namespace netsweep::query {

inline constexpr uint64_t    kBucketWidthMs = 15ull * 60 * 1000;
inline constexpr std::size_t kMaxBuckets    = 48;

// Distinct addresses seen inside one 15-minute UTC slot.
struct TimeBucket {
  uint64_t    start_ms = 0;
  std::string label; // "YYYY-MM-DD HH:MM", UTC
  uint64_t    total   = 0;
  uint64_t    online  = 0;
  uint64_t    offline = 0;
};

// Ascending by start; only the newest max_buckets are kept.
std::vector<TimeBucket> BucketHistory(const std::vector<db::model::HistoryRecord>& rows, std::size_t max_buckets = kMaxBuckets);

struct LatencyStatistics {
  std::optional<double> avg_last_hour_ms;
  std::optional<double> avg_24h_ms;
  std::optional<double> min_ms;
  std::optional<double> max_ms;
  double                packet_loss_percent = 0.0;
  uint64_t              total_measurements  = 0;
};

/*
  Summary of the samples measured within 24 h of now_ms. Averages and
  extremes only use samples that carry a latency and no packet loss;
  loss percent is over every sample in the window.
*/
LatencyStatistics SummarizeLatency(const std::vector<db::model::LatencyRecord>& samples, uint64_t now_ms);

} // namespace netsweep::query
