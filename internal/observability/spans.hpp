#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace netsweep::runtime::config {
class RuntimeConfig;
}

namespace netsweep::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"netsweep"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{5000};
};

bool InitializeTracing(const netsweep::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const netsweep::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// RAII span; becomes the active span for its scope.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  route:   "ScanService.ScanRange", "InventoryService.ListDevices", ...
  outcome: probe "success"/"unreachable"/"timeout"/...,
           reconcile "created"/"updated"/"failed"
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordProbe(std::string_view outcome);
  void ObserveProbeLatencyMs(double latency_ms);
  void RecordReconcile(std::string_view outcome);
  void RecordPurgedRows(std::string_view table, std::uint64_t rows);
  void SetDeviceCount(std::string_view status, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const netsweep::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const netsweep::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordProbe(std::string_view) {
}

inline void Metrics::ObserveProbeLatencyMs(double) {
}

inline void Metrics::RecordReconcile(std::string_view) {
}

inline void Metrics::RecordPurgedRows(std::string_view, std::uint64_t) {
}

inline void Metrics::SetDeviceCount(std::string_view, std::uint64_t) {
}
#endif

} // namespace netsweep::observability
