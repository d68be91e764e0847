#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace netsweep::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> probe_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      probe_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconcile_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> purged_rows;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   device_gauge;

  std::mutex                                    device_count_mutex;
  std::unordered_map<std::string, std::int64_t> device_counts;
};

bool InitializeMetrics(const netsweep::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == netsweep::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.export_interval_ms();
  }

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  // timeout must stay below the interval
  reader_options.export_timeout_millis = std::chrono::milliseconds(otlp_config.export_interval_ms / 2);
  auto reader                          = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto res   = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("netsweep", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("netsweep.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("netsweep.request.latency_ms", "Service request latency in milliseconds", "ms");
  impl_->probe_count        = impl_->meter->CreateUInt64Counter("netsweep.probe.count", "Reachability probes by outcome", "1");
  impl_->probe_latency_ms   = impl_->meter->CreateDoubleHistogram("netsweep.probe.rtt_ms", "Round-trip time of successful probes", "ms");
  impl_->reconcile_count    = impl_->meter->CreateUInt64Counter("netsweep.reconcile.count", "Device reconciliations by outcome", "1");
  impl_->purged_rows        = impl_->meter->CreateUInt64Counter("netsweep.retention.purged_rows", "Rows removed by retention", "1");
  impl_->device_gauge       = impl_->meter->CreateInt64ObservableGauge("netsweep.devices", "Known devices by status", "1");
  impl_->device_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->device_count_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [status, count] : impl->device_counts) {
          const std::initializer_list<AttributePair> attributes = {{"status", status}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordProbe(std::string_view outcome) {
  if (!impl_ || !impl_->probe_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->probe_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveProbeLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->probe_latency_ms) {
    return;
  }

  RecordWithAttributes(impl_->probe_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordReconcile(std::string_view outcome) {
  if (!impl_ || !impl_->reconcile_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->reconcile_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordPurgedRows(std::string_view table, std::uint64_t rows) {
  if (!impl_ || !impl_->purged_rows || rows == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"table", std::string(table)}};
  AddWithAttributes(impl_->purged_rows, rows, attributes);
}

void Metrics::SetDeviceCount(std::string_view status, std::uint64_t count) {
  if (!impl_ || !impl_->device_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->device_count_mutex);
  impl_->device_counts[std::string(status)] = static_cast<std::int64_t>(count);
}

} // namespace netsweep::observability

#endif
