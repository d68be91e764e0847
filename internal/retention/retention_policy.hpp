#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace netsweep::retention {

// Retention windows in days; 0 means "delete regardless of age".
struct RetentionPolicy {
  uint32_t                  history_days = 30;
  uint32_t                  scans_days   = 90;
  uint32_t                  offline_days = 7;
  uint32_t                  latency_days = 30;
  bool                      auto_purge   = true;
  std::chrono::milliseconds purge_interval{std::chrono::hours(24)};
};

// Fields absent from proto keep the value from fallback.
RetentionPolicy FromProto(const netsweep::runtime::config::RetentionPolicy& proto, const RetentionPolicy& fallback = {});

netsweep::runtime::config::RetentionPolicy ToProto(const RetentionPolicy& policy);

std::string ToJson(const RetentionPolicy& policy);

// Throws util::ValidationError on malformed JSON or unknown fields.
RetentionPolicy FromJson(const std::string& json, const RetentionPolicy& fallback = {});

} // namespace netsweep::retention
