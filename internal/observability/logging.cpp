#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace stageflow::observability {
namespace {

constexpr const char* kLoggerName     = "stageflow";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

thread_local std::vector<LogField> t_context;

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value && *value ? std::string(value) : fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to "off".
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("unknown log level '" + name + "'");
  }
  return level;
}

bool ParseFlag(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

void AppendField(std::string& line, const LogField& field) {
  line += ' ';
  line += field.key;
  line += '=';
  if (field.value.find_first_of(" \t\n=\"") == std::string::npos) {
    line += field.value;
    return;
  }
  line += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c == '\n' ? ' ' : c;
  }
  line += '"';
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& line, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    line += kHex[(data[i] >> 4) & 0x0F];
    line += kHex[data[i] & 0x0F];
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  line += " trace_id=";
  AppendHex(line, trace_bytes, sizeof(trace_bytes));
  line += " span_id=";
  AppendHex(line, span_bytes, sizeof(span_bytes));
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const stageflow::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  const auto level   = ParseLevel(EnvOr("STAGEFLOW_LOG_LEVEL", logging.level().empty() ? "info" : logging.level()));
  const auto pattern = EnvOr("STAGEFLOW_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern());
  const auto trace   = EnvOr("STAGEFLOW_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "false");

  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context.store(ParseFlag(trace), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

LogContext::LogContext(std::initializer_list<LogField> fields) : depth_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

LogContext::~LogContext() {
  t_context.resize(depth_);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) AppendField(line, field);
  for (const auto& field : t_context) AppendField(line, field);
  AppendTraceContext(line);

  logger->log(level, "{}", line);
}

} // namespace stageflow::observability
