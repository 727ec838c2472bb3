#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fetchbox::runtime::config {
class RuntimeConfig;
}

namespace fetchbox::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"fetchbox"};
  std::string   service_version{};
  std::string   instance_id{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  double        sample_ratio{1.0};

  std::chrono::milliseconds metrics_interval{1000};
  std::chrono::milliseconds metrics_timeout{0};

  static OtlpConfig FromRuntime(const fetchbox::runtime::config::RuntimeConfig& config, std::string_view instance_id);
};

// Both return false when the signal is disabled in config or the build has no OTLP support.
bool InitializeTracing(const OtlpConfig& config);
bool InitializeMetrics(const OtlpConfig& config);
bool InitializeTracing(const fetchbox::runtime::config::RuntimeConfig& config, std::string_view instance_id);
bool InitializeMetrics(const fetchbox::runtime::config::RuntimeConfig& config, std::string_view instance_id);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span made current for its lifetime. A no-op when no tracer
  provider is installed.
*/
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

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordTaskOutcome(std::string_view outcome, std::string_view failure_code);
  void ObserveDownloadDurationMs(double duration_ms);
  // One endpoint abandoned for the next one within a single attempt.
  void RecordEndpointFallback(std::string_view failure_code);
  void SetQueueDepth(std::string_view status, std::uint64_t entries);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const fetchbox::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}

inline bool InitializeMetrics(const fetchbox::runtime::config::RuntimeConfig&, std::string_view) {
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

inline void Metrics::RecordTaskOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveDownloadDurationMs(double) {
}

inline void Metrics::RecordEndpointFallback(std::string_view) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace fetchbox::observability
