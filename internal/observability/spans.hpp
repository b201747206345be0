#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace stageflow::runtime::config {
class RuntimeConfig;
}

namespace stageflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the tracer and meter providers.
struct OtlpConfig {
  std::string               service_name{"stageflow"};
  std::string               isolation_scope{};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  bool                      batch_spans{true};
  std::chrono::milliseconds metric_interval{1000};
  std::chrono::milliseconds metric_timeout{0};
};

OtlpConfig ToOtlpConfig(const stageflow::runtime::config::RuntimeConfig& config);

// Explicit endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
// `signal` is "traces" or "metrics".
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);

bool InitializeTracing(const OtlpConfig& config);
bool InitializeMetrics(const OtlpConfig& config);
bool InitializeTracing(const stageflow::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const stageflow::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  // stageflow.run_id, stageflow.stage_id and stageflow.attempt.
  void SetStage(std::string_view run_id, std::string_view stage_id, std::int64_t attempt);
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

  void RecordCacheLookup(std::string_view tier, bool hit);
  void RecordCacheEviction();
  void RecordStageOutcome(std::string_view kind, std::string_view outcome);
  void ObserveStageDurationMs(std::string_view kind, double duration_ms);
  void RecordRunOutcome(std::string_view status);
  void RecordRequest(std::string_view route, bool ok);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

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

inline bool InitializeTracing(const stageflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const stageflow::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetStage(std::string_view, std::string_view, std::int64_t) {
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

inline void Metrics::RecordCacheLookup(std::string_view, bool) {
}

inline void Metrics::RecordCacheEviction() {
}

inline void Metrics::RecordStageOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::RecordRunOutcome(std::string_view) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
#endif

} // namespace stageflow::observability
