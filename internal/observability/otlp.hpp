#pragma once

#include "internal/observability/spans.hpp"

#ifndef FETCHBOX_VERSION
#define FETCHBOX_VERSION "0.0.0"
#endif

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace fetchbox::observability::otlp_detail {

enum class Signal {
  kTraces,
  kMetrics,
};

// Explicit endpoint, then the per-signal OTEL_EXPORTER_OTLP_* variable, then the collector default.
std::string ResolveEndpoint(const OtlpConfig& config, Signal signal);

opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config);

} // namespace fetchbox::observability::otlp_detail

#endif
