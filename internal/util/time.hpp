#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace netsweep::util {

/*
  Time utilities.

  Everything that stamps a record reads time through Clock so tests can
  drive it explicitly.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;

  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class RealClock final : public Clock {
 public:
  TimePoint Now() const override;
  void      SleepFor(std::chrono::milliseconds duration) override;
};

std::shared_ptr<Clock> DefaultClock();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

constexpr uint64_t kMillisPerDay = 24ull * 60 * 60 * 1000;

// Absent or zero duration yields fallback.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);
google::protobuf::Duration ToProto(std::chrono::milliseconds d);

// UTC rendering, strftime format.
std::string FormatUtc(uint64_t unix_ms, const char* format = "%Y-%m-%dT%H:%M:%SZ");

} // namespace netsweep::util
