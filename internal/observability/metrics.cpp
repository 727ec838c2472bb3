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

#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace fetchbox::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::mutex                                 g_provider_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = otlp_detail::ResolveEndpoint(config, otlp_detail::Signal::kMetrics);
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

// AddMetricReader took a shared_ptr before opentelemetry-cpp 1.10.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes attributes) {
  if (!instrument) return;
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes attributes) {
  if (!instrument) return;
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> admin_requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      admin_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      download_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> endpoint_fallbacks;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth;

  std::mutex                          depth_mutex;
  std::map<std::string, std::int64_t> depth_by_status;

  static void ObserveQueueDepth(metrics_api::ObserverResult result, void* state) {
    auto* impl = static_cast<Impl*>(state);
    auto  observer =
        opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

    std::lock_guard<std::mutex> lock(impl->depth_mutex);
    for (const auto& [status, entries] : impl->depth_by_status) {
      observer->Observe(entries, Attributes{{"status", status}});
    }
  }
};

bool InitializeMetrics(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = config.metrics_interval;
  if (config.metrics_timeout.count() > 0) {
    reader_options.export_timeout_millis = config.metrics_timeout;
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), reader_options);

  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                              otlp_detail::BuildResource(config));
  AttachReader(provider, std::move(reader));

  std::lock_guard<std::mutex> lock(g_provider_mutex);
  g_provider = std::move(provider);
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const fetchbox::runtime::config::RuntimeConfig& config, std::string_view instance_id) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(OtlpConfig::FromRuntime(config, instance_id));
}

void ShutdownMetrics() {
  std::lock_guard<std::mutex> lock(g_provider_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is global on first use, so
// InitializeMetrics must run before the first Instance() call.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("fetchbox", FETCHBOX_VERSION);

  impl_->admin_requests       = impl_->meter->CreateUInt64Counter("fetchbox.admin.requests", "Admin RPCs by route and result", "1");
  impl_->admin_latency_ms     = impl_->meter->CreateDoubleHistogram("fetchbox.admin.latency_ms", "Admin RPC latency", "ms");
  impl_->task_outcomes        = impl_->meter->CreateUInt64Counter("fetchbox.task.outcomes", "Lease cycles by outcome", "1");
  impl_->download_duration_ms = impl_->meter->CreateDoubleHistogram("fetchbox.download.duration_ms", "Transfer time per attempt", "ms");
  impl_->endpoint_fallbacks   = impl_->meter->CreateUInt64Counter("fetchbox.proxy.fallbacks", "Endpoints abandoned for the next tier", "1");
  impl_->queue_depth          = impl_->meter->CreateInt64ObservableGauge("fetchbox.queue.depth", "Queue entries by status", "1");
  impl_->queue_depth->AddCallback(&Impl::ObserveQueueDepth, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string route_value(route);
  Add(impl_->admin_requests, std::uint64_t{1}, Attributes{{"route", route_value}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string route_value(route);
  Record(impl_->admin_latency_ms, latency_ms, Attributes{{"route", route_value}});
}

void Metrics::RecordTaskOutcome(std::string_view outcome, std::string_view failure_code) {
  const std::string outcome_value(outcome);
  const std::string code_value(failure_code);
  Add(impl_->task_outcomes, std::uint64_t{1}, Attributes{{"outcome", outcome_value}, {"failure_code", code_value}});
}

void Metrics::ObserveDownloadDurationMs(double duration_ms) {
  Record(impl_->download_duration_ms, duration_ms, Attributes{});
}

void Metrics::RecordEndpointFallback(std::string_view failure_code) {
  const std::string code_value(failure_code);
  Add(impl_->endpoint_fallbacks, std::uint64_t{1}, Attributes{{"failure_code", code_value}});
}

void Metrics::SetQueueDepth(std::string_view status, std::uint64_t entries) {
  std::lock_guard<std::mutex> lock(impl_->depth_mutex);
  impl_->depth_by_status[std::string(status)] = static_cast<std::int64_t>(entries);
}

} // namespace fetchbox::observability

#endif
