#include "internal/observability/spans.hpp"

#ifdef NSI_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace nsi::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr std::chrono::milliseconds kDefaultCollectionInterval{1000};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config, "metrics");

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> anomaly_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      emit_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   pending_gauge;

  std::atomic<std::int64_t> pending_operations{0};
};

bool InitializeMetrics(const nsi::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto& metric_config             = observability.metrics();
  reader_options.export_interval_millis = metric_config.collection_interval_ms() > 0
                                              ? std::chrono::milliseconds(metric_config.collection_interval_ms())
                                              : kDefaultCollectionInterval;
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
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
  impl_->meter  = provider->GetMeter("nsi-requester", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("nsi.request.count", "RPCs served", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("nsi.request.latency_ms", "RPC latency", "ms");
  impl_->transition_count   = impl_->meter->CreateUInt64Counter("nsi.transition.count", "Applied connection state transitions", "1");
  impl_->anomaly_count      = impl_->meter->CreateUInt64Counter("nsi.anomaly.count", "Recorded anomalies", "1");
  impl_->emit_duration_ms   = impl_->meter->CreateDoubleHistogram("nsi.emit.duration_ms", "Time to hand a request to the transport", "ms");
  impl_->pending_gauge      = impl_->meter->CreateInt64ObservableGauge("nsi.pending.operations", "Outstanding provider requests", "1");
  impl_->pending_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->pending_operations.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) return;

  const std::string                          label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", label}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) return;

  const std::string                          label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", label}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordTransition(std::string_view event) {
  if (!impl_ || !impl_->transition_count) return;

  const std::string                          label(event);
  const std::initializer_list<AttributePair> attributes = {{"event", label}};
  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordAnomaly(std::string_view kind) {
  if (!impl_ || !impl_->anomaly_count) return;

  const std::string                          label(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", label}};
  AddWithAttributes(impl_->anomaly_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveEmitDurationMs(std::string_view operation, double duration_ms) {
  if (!impl_ || !impl_->emit_duration_ms) return;

  const std::string                          label(operation);
  const std::initializer_list<AttributePair> attributes = {{"operation", label}};
  RecordWithAttributes(impl_->emit_duration_ms, duration_ms, attributes);
}

void Metrics::SetPendingOperations(std::int64_t count) {
  if (!impl_) return;
  impl_->pending_operations.store(count);
}

} // namespace nsi::observability

#endif
