#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define STAGEFLOW_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define STAGEFLOW_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace stageflow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  if (!config.isolation_scope.empty()) attrs.SetAttribute("stageflow.isolation_scope", opentelemetry::nostd::string_view(config.isolation_scope));
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "metrics");

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

bool InstallProvider(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = config.metric_interval;
  if (config.metric_timeout.count() > 0) reader_options.export_timeout_millis = config.metric_timeout;

#ifdef STAGEFLOW_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(config), reader_options);
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BuildResource(config));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_evictions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> stage_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> run_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallProvider(config);
}

bool InitializeMetrics(const stageflow::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InstallProvider(ToOtlpConfig(config));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("stageflow", "0.1.0");

  impl_->cache_lookups     = impl_->meter->CreateUInt64Counter("stageflow.cache.lookups", "Response cache lookups by tier and outcome", "1");
  impl_->cache_evictions   = impl_->meter->CreateUInt64Counter("stageflow.cache.evictions", "Memory tier LRU evictions", "1");
  impl_->stage_outcomes    = impl_->meter->CreateUInt64Counter("stageflow.stage.outcomes", "Stage attempt outcomes", "1");
  impl_->stage_duration_ms = impl_->meter->CreateDoubleHistogram("stageflow.stage.duration_ms", "Stage attempt duration in milliseconds", "ms");
  impl_->run_outcomes      = impl_->meter->CreateUInt64Counter("stageflow.run.outcomes", "Terminal run outcomes", "1");
  impl_->requests          = impl_->meter->CreateUInt64Counter("stageflow.requests", "Control surface requests", "1");
  impl_->request_latency_ms =
      impl_->meter->CreateDoubleHistogram("stageflow.request.latency_ms", "Control surface request latency in milliseconds", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordCacheLookup(std::string_view tier, bool hit) {
  if (!impl_ || !impl_->cache_lookups) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"tier", std::string(tier)}, {"hit", hit}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordCacheEviction() {
  if (!impl_ || !impl_->cache_evictions) {
    return;
  }

  AddWithAttributes(impl_->cache_evictions, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordStageOutcome(std::string_view kind, std::string_view outcome) {
  if (!impl_ || !impl_->stage_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->stage_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveStageDurationMs(std::string_view kind, double duration_ms) {
  if (!impl_ || !impl_->stage_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  RecordWithAttributes(impl_->stage_duration_ms, duration_ms, attributes);
}

void Metrics::RecordRunOutcome(std::string_view status) {
  if (!impl_ || !impl_->run_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->run_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRequest(std::string_view route, bool ok) {
  if (!impl_ || !impl_->requests) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"ok", ok}};
  AddWithAttributes(impl_->requests, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

} // namespace stageflow::observability

#endif
