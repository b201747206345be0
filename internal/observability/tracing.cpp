#include "internal/observability/spans.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace stageflow::observability {

OtlpConfig ToOtlpConfig(const stageflow::runtime::config::RuntimeConfig& config) {
  using stageflow::runtime::config::ObservabilityConfig;

  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.isolation_scope = config.orchestrator().isolation_scope();
  otlp.endpoint        = observability.otlp_endpoint();
  otlp.transport = observability.transport() == stageflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                : OtlpTransport::kGrpc;
  otlp.batch_spans =
      observability.tracing().processor() != ObservabilityConfig::TracingConfig::TRACE_PROCESSOR_SIMPLE;

  const auto& metrics = observability.metrics();
  if (metrics.collection_interval_ms() > 0) {
    otlp.metric_interval = std::chrono::milliseconds(metrics.collection_interval_ms());
  }
  // The reader rejects a timeout longer than its interval.
  if (metrics.export_timeout_ms() > 0) {
    otlp.metric_timeout = std::min(std::chrono::milliseconds(metrics.export_timeout_ms()), otlp.metric_interval);
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) return config.endpoint;

  std::string per_signal = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) per_signal += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  per_signal += "_ENDPOINT";

  for (const char* name : {per_signal.c_str(), "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    const char* value = std::getenv(name);
    if (value && *value) return value;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) return "http://localhost:4318/v1/" + std::string(signal);
  return "localhost:4317";
}

} // namespace stageflow::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

namespace stageflow::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "stageflow";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "traces");

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const OtlpConfig& config) {
  if (!config.batch_spans) return sdktrace::SimpleSpanProcessorFactory::Create(MakeExporter(config));
  return sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  resource::ResourceAttributes attributes = {{"service.name", config.service_name},
                                             {"service.version", std::string(kInstrumentationVersion)}};
  if (!config.isolation_scope.empty()) attributes.SetAttribute("stageflow.isolation_scope", opentelemetry::nostd::string_view(config.isolation_scope));

  auto provider  = sdktrace::TracerProviderFactory::Create(MakeProcessor(config), resource::Resource::Create(attributes));
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const stageflow::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }
  return InitializeTracing(ToOtlpConfig(config));
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetStage(std::string_view run_id, std::string_view stage_id, std::int64_t attempt) {
  SetAttribute("stageflow.run_id", run_id);
  SetAttribute("stageflow.stage_id", stage_id);
  SetAttribute("stageflow.attempt", attempt);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace stageflow::observability

#endif
