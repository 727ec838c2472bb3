#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace fetchbox::observability {

OtlpConfig OtlpConfig::FromRuntime(const fetchbox::runtime::config::RuntimeConfig& config, std::string_view instance_id) {
  const auto& observability = config.observability();

  OtlpConfig out;
  out.service_version = FETCHBOX_VERSION;
  out.instance_id     = std::string(instance_id);
  out.endpoint        = observability.otlp_endpoint();
  out.transport =
      observability.transport() == fetchbox::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.trace_sample_ratio() > 0.0) {
    out.sample_ratio = observability.trace_sample_ratio() < 1.0 ? observability.trace_sample_ratio() : 1.0;
  }

  if (observability.metrics().collection_interval_ms() > 0) {
    out.metrics_interval = std::chrono::milliseconds(observability.metrics().collection_interval_ms());
  }
  out.metrics_timeout = std::chrono::milliseconds(observability.metrics().export_timeout_ms());
  return out;
}

#ifdef ENABLE_OTEL
namespace otlp_detail {

std::string ResolveEndpoint(const OtlpConfig& config, Signal signal) {
  if (!config.endpoint.empty()) return config.endpoint;

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env)) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;

  if (config.transport == OtlpTransport::kGrpc) return "localhost:4317";
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  if (!config.service_version.empty()) attrs.SetAttribute("service.version", config.service_version);
  if (!config.instance_id.empty()) attrs.SetAttribute("service.instance.id", config.instance_id);
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace otlp_detail
#endif

} // namespace fetchbox::observability
