#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace netsweep::service {

/*
  Wraps one service operation in a span plus request count/latency
  metrics. Failures are recorded on the span, logged and rethrown.
  subject (an address or range) is attached when non-empty.
*/
template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view subject, Fn&& fn) {
  netsweep::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("netsweep.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    netsweep::observability::Metrics::Instance().RecordRequest(route, success);
    netsweep::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      finish(true);
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    NETSWEEP_LOG_ERROR("operation failed", {netsweep::observability::StringField("route", route), netsweep::observability::StringField("subject", subject),
                                            netsweep::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace netsweep::service
