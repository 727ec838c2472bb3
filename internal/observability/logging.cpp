#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace fetchbox::observability {
namespace {

constexpr const char* kLoggerName     = "fetchbox";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
constexpr uint64_t    kDefaultFileSize = 64ull * 1024 * 1024;
constexpr uint32_t    kDefaultFiles    = 5;

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& fallback) {
  if (const char* value = std::getenv(name)) return value;
  return fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level '" + name + "'");
  }
  return level;
}

bool ResolveTraceContextEnabled(const fetchbox::runtime::config::LoggingConfig& logging) {
  if (const char* include_trace = std::getenv("FETCHBOX_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return logging.include_trace_context();
}

// Values with spaces, quotes or '=' are quoted so a line stays key=value parseable.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out += value;
    return;
  }

  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField UIntField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const fetchbox::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file = EnvOr("FETCHBOX_LOG_FILE", logging.file());
  if (!file.empty()) {
    const auto max_bytes = logging.max_file_bytes() > 0 ? logging.max_file_bytes() : kDefaultFileSize;
    const auto max_files = logging.max_files() > 0 ? logging.max_files() : kDefaultFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, max_bytes, max_files));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("FETCHBOX_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(ParseLevel(EnvOr("FETCHBOX_LOG_LEVEL", logging.level().empty() ? "info" : logging.level())));
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = ResolveTraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace fetchbox::observability
