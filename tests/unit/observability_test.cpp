#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/otlp.hpp"
#include "internal/observability/spans.hpp"

namespace {

void ClearOtlpEnvironment() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestObservabilitySectionParses() {
  auto config = nsi::config::ConfigLoader::LoadFromYamlString(R"(observability:
  tracing_enabled: false
  metrics_enabled: false
  otlp_endpoint: "collector:4317"
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 2000
  tracing:
    processor: PROCESSOR_SIMPLE
)");

  const auto& observability = config.observability();
  assert(observability.otlp_endpoint() == "collector:4317");
  assert(observability.transport() == nsi::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(observability.metrics().collection_interval_ms() == 2000);
  assert(observability.tracing().processor() == nsi::runtime::config::ObservabilityConfig::TracingConfig::PROCESSOR_SIMPLE);

  const auto otlp = nsi::observability::ToOtlpConfig(config);
  assert(otlp.endpoint == "collector:4317");
  assert(otlp.transport == nsi::observability::OtlpTransport::kHttpProtobuf);
  assert(otlp.service_name == "nsi-requester");
}

void TestExplicitEndpointWins() {
  ClearOtlpEnvironment();
  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://env:4318", 1);

  nsi::observability::OtlpConfig config;
  config.endpoint = "collector:4317";
  assert(nsi::observability::ResolveEndpoint(config, "traces") == "collector:4317");

  ClearOtlpEnvironment();
}

void TestEnvironmentEndpointPrecedence() {
  ClearOtlpEnvironment();
  nsi::observability::OtlpConfig config;

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "shared:4317", 1);
  assert(nsi::observability::ResolveEndpoint(config, "traces") == "shared:4317");
  assert(nsi::observability::ResolveEndpoint(config, "metrics") == "shared:4317");

  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics-only:4317", 1);
  assert(nsi::observability::ResolveEndpoint(config, "metrics") == "metrics-only:4317");
  assert(nsi::observability::ResolveEndpoint(config, "traces") == "shared:4317");

  ClearOtlpEnvironment();
}

void TestCollectorDefaults() {
  ClearOtlpEnvironment();

  nsi::observability::OtlpConfig grpc_config;
  assert(nsi::observability::ResolveEndpoint(grpc_config, "traces") == "localhost:4317");

  nsi::observability::OtlpConfig http_config;
  http_config.transport = nsi::observability::OtlpTransport::kHttpProtobuf;
  assert(nsi::observability::ResolveEndpoint(http_config, "traces") == "http://localhost:4318/v1/traces");
  assert(nsi::observability::ResolveEndpoint(http_config, "metrics") == "http://localhost:4318/v1/metrics");
}

void TestDisabledExportersDoNotInitialize() {
  nsi::runtime::config::RuntimeConfig config;
  assert(!nsi::observability::InitializeTracing(config));
  assert(!nsi::observability::InitializeMetrics(config));
  nsi::observability::ShutdownMetrics();
  nsi::observability::ShutdownTracing();
}

void TestInstrumentsAreUsableWithoutExporters() {
  {
    nsi::observability::SpanScope span("rpc.Reserve");
    span.SetAttribute("nsi.connection_id", "conn-1");
    span.SetAttribute("nsi.version", static_cast<std::int64_t>(3));
    span.AddEvent("emitted");
    span.RecordException("provider unreachable");
  }

  auto& metrics = nsi::observability::Metrics::Instance();
  assert(&metrics == &nsi::observability::Metrics::Instance());
  metrics.RecordRequest("Reserve", true);
  metrics.ObserveRequestLatencyMs("Reserve", 1.5);
  metrics.RecordTransition("ConfirmReceived(Reserve)");
  metrics.RecordAnomaly("UnknownCorrelation");
  metrics.ObserveEmitDurationMs("Reserve", 0.2);
  metrics.SetPendingOperations(2);
  metrics.SetPendingOperations(0);
}

} // namespace

int main() {
  TestObservabilitySectionParses();
  TestExplicitEndpointWins();
  TestEnvironmentEndpointPrecedence();
  TestCollectorDefaults();
  TestDisabledExportersDoNotInitialize();
  TestInstrumentsAreUsableWithoutExporters();

  std::cout << "nsi_requester_unit_observability: pass\n";
  return 0;
}
