#include "time.hpp"

#include <ctime>
#include <thread>

namespace netsweep::util {

TimePoint RealClock::Now() const {
  return SystemClock::now();
}

void RealClock::SleepFor(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

std::shared_ptr<Clock> DefaultClock() {
  static auto clock = std::make_shared<RealClock>();
  return clock;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  return ms.count() > 0 ? ms : fallback;
}

google::protobuf::Duration ToProto(std::chrono::milliseconds d) {
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>(d);

  google::protobuf::Duration out;
  out.set_seconds(sec.count());
  out.set_nanos(static_cast<int32_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec).count()));
  return out;
}

std::string FormatUtc(uint64_t unix_ms, const char* format) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[64];
  const auto written = std::strftime(buffer, sizeof(buffer), format, &utc);
  return std::string(buffer, written);
}

} // namespace netsweep::util
