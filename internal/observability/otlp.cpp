#include "otlp.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace nsi::observability {

OtlpConfig ToOtlpConfig(const nsi::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == nsi::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                         : OtlpTransport::kGrpc;
  return otlp;
}

std::string ResolveEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string upper(signal);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  const auto per_signal = "OTEL_EXPORTER_OTLP_" + upper + "_ENDPOINT";
  if (const char* endpoint = std::getenv(per_signal.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
}

} // namespace nsi::observability
