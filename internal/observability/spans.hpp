#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace nsi::runtime::config {
class RuntimeConfig;
}

namespace nsi::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"nsi-requester"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const nsi::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const nsi::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef NSI_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

    nsi.request.count          RPCs by route and outcome
    nsi.request.latency_ms     RPC latency by route
    nsi.transition.count       applied state transitions by event
    nsi.anomaly.count          anomaly records by kind
    nsi.emit.duration_ms       time to hand a request to the transport
    nsi.pending.operations     outstanding provider requests
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordTransition(std::string_view event);
  void RecordAnomaly(std::string_view kind);
  void ObserveEmitDurationMs(std::string_view operation, double duration_ms);
  void SetPendingOperations(std::int64_t count);

 private:
  Metrics();
#ifdef NSI_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef NSI_ENABLE_OTEL
inline bool InitializeTracing(const nsi::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const nsi::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordTransition(std::string_view) {
}

inline void Metrics::RecordAnomaly(std::string_view) {
}

inline void Metrics::ObserveEmitDurationMs(std::string_view, double) {
}

inline void Metrics::SetPendingOperations(std::int64_t) {
}
#endif

} // namespace nsi::observability
