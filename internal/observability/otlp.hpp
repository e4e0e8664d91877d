#pragma once

#include <string>
#include <string_view>

#include "spans.hpp"

namespace nsi::observability {

OtlpConfig ToOtlpConfig(const nsi::runtime::config::RuntimeConfig& config);

// signal is "traces" or "metrics". Precedence: explicit endpoint,
// OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, OTEL_EXPORTER_OTLP_ENDPOINT, collector default.
std::string ResolveEndpoint(const OtlpConfig& config, std::string_view signal);

} // namespace nsi::observability
