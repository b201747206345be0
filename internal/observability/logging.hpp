#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace stageflow::runtime::config {
class RuntimeConfig;
}

namespace stageflow::observability {

// One key=value pair on a structured log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Installs the "stageflow" logger as the spdlog default. The level,
// pattern and trace-context switch can be overridden with
// STAGEFLOW_LOG_LEVEL, STAGEFLOW_LOG_PATTERN and
// STAGEFLOW_LOG_INCLUDE_TRACE_CONTEXT. Throws std::runtime_error on an
// unknown level name.
void InitializeLogging(const stageflow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Fields appended to every line this thread logs while the context is
  alive. Run loops push run_id, stage workers add stage_id and attempt,
  so call sites do not repeat them. Contexts nest and must be destroyed
  in reverse order.
*/
class LogContext {
 public:
  LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

 private:
  std::size_t depth_;
};

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace stageflow::observability

#define STAGEFLOW_LOG_DEBUG(message, ...) ::stageflow::observability::LogDebug((message), ##__VA_ARGS__)
#define STAGEFLOW_LOG_INFO(message, ...) ::stageflow::observability::LogInfo((message), ##__VA_ARGS__)
#define STAGEFLOW_LOG_WARN(message, ...) ::stageflow::observability::LogWarn((message), ##__VA_ARGS__)
#define STAGEFLOW_LOG_ERROR(message, ...) ::stageflow::observability::LogError((message), ##__VA_ARGS__)
