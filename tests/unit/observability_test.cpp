#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

using stageflow::observability::IntField;
using stageflow::observability::LogContext;
using stageflow::observability::OtlpConfig;
using stageflow::observability::OtlpTransport;
using stageflow::observability::StringField;

// Routes the default logger into a string for the duration of a test.
class CapturedLog {
 public:
  CapturedLog() {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
    sink->set_pattern("%v");
    previous_ = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>("stageflow-test", sink);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }

  ~CapturedLog() {
    spdlog::set_default_logger(previous_);
  }

  std::string Text() const {
    return out_.str();
  }

 private:
  std::ostringstream              out_;
  std::shared_ptr<spdlog::logger> previous_;
};

void TestFieldsAreQuotedWhenNeeded() {
  CapturedLog log;
  STAGEFLOW_LOG_INFO("Stage failed", {StringField("stage_id", "draft"), StringField("error", "model said \"no\"")});
  assert(log.Text() == "Stage failed stage_id=draft error=\"model said \\\"no\\\"\"\n");
}

void TestContextNestsAndUnwinds() {
  CapturedLog log;
  {
    LogContext run({StringField("run_id", "r-1")});
    STAGEFLOW_LOG_INFO("Run started");
    {
      LogContext stage({StringField("stage_id", "outline"), IntField("attempt", 2)});
      STAGEFLOW_LOG_WARN("Retrying", {IntField("backoff_ms", 40)});
    }
    STAGEFLOW_LOG_INFO("Run finished");
  }
  STAGEFLOW_LOG_INFO("Idle");

  assert(log.Text() ==
         "Run started run_id=r-1\n"
         "Retrying backoff_ms=40 run_id=r-1 stage_id=outline attempt=2\n"
         "Run finished run_id=r-1\n"
         "Idle\n");
}

void TestLevelFiltering() {
  CapturedLog log;
  spdlog::default_logger()->set_level(spdlog::level::warn);
  STAGEFLOW_LOG_DEBUG("hidden");
  STAGEFLOW_LOG_INFO("hidden too");
  STAGEFLOW_LOG_ERROR("shown");
  assert(log.Text() == "shown\n");
}

void TestUnknownLevelIsRejected() {
  unsetenv("STAGEFLOW_LOG_LEVEL");
  auto config = stageflow::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("loud");

  bool threw = false;
  try {
    stageflow::observability::InitializeLogging(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  config.mutable_logging()->set_level("debug");
  stageflow::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  // The environment wins over the file.
  setenv("STAGEFLOW_LOG_LEVEL", "error", 1);
  stageflow::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::err);
  unsetenv("STAGEFLOW_LOG_LEVEL");
}

void TestOtlpConfigFromRuntimeConfig() {
  auto config = stageflow::config::ConfigLoader::Defaults();
  config.mutable_orchestrator()->set_isolation_scope("tenant-a");
  auto* observability = config.mutable_observability();
  observability->set_transport(stageflow::runtime::config::OTLP_TRANSPORT_HTTP);
  observability->mutable_tracing()->set_processor(
      stageflow::runtime::config::ObservabilityConfig::TracingConfig::TRACE_PROCESSOR_SIMPLE);
  observability->mutable_metrics()->set_collection_interval_ms(2000);
  observability->mutable_metrics()->set_export_timeout_ms(5000);

  const OtlpConfig otlp = stageflow::observability::ToOtlpConfig(config);
  assert(otlp.transport == OtlpTransport::kHttpProtobuf);
  assert(!otlp.batch_spans);
  assert(otlp.isolation_scope == "tenant-a");
  assert(otlp.metric_interval.count() == 2000);
  // Clamped to the interval.
  assert(otlp.metric_timeout.count() == 2000);

  const OtlpConfig defaults = stageflow::observability::ToOtlpConfig(stageflow::config::ConfigLoader::Defaults());
  assert(defaults.transport == OtlpTransport::kGrpc);
  assert(defaults.batch_spans);
  assert(defaults.metric_timeout.count() == 0);
}

void TestEndpointResolution() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");

  OtlpConfig config;
  config.transport = OtlpTransport::kHttpProtobuf;
  assert(stageflow::observability::ResolveOtlpEndpoint(config, "traces") == "http://localhost:4318/v1/traces");
  assert(stageflow::observability::ResolveOtlpEndpoint(config, "metrics") == "http://localhost:4318/v1/metrics");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "http://metrics:4318/v1/metrics", 1);
  assert(stageflow::observability::ResolveOtlpEndpoint(config, "traces") == "http://collector:4318");
  assert(stageflow::observability::ResolveOtlpEndpoint(config, "metrics") == "http://metrics:4318/v1/metrics");

  config.endpoint = "http://explicit:4318";
  assert(stageflow::observability::ResolveOtlpEndpoint(config, "metrics") == "http://explicit:4318");

  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");

  OtlpConfig grpc;
  assert(stageflow::observability::ResolveOtlpEndpoint(grpc, "traces") == "localhost:4317");
}

} // namespace

int main() {
  TestFieldsAreQuotedWhenNeeded();
  TestContextNestsAndUnwinds();
  TestLevelFiltering();
  TestUnknownLevelIsRejected();
  TestOtlpConfigFromRuntimeConfig();
  TestEndpointResolution();

  std::cout << "stageflow_unit_observability: pass\n";
  return 0;
}
