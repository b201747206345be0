#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace stageflow::service {

// Span, request metrics and an error log line around one control call.
// Errors are rethrown unchanged.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view run_id, Fn&& fn) {
  stageflow::observability::SpanScope span(route);
  if (!run_id.empty()) {
    span.SetAttribute("stageflow.run_id", run_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool ok) {
    stageflow::observability::Metrics::Instance().RecordRequest(route, ok);
    stageflow::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    STAGEFLOW_LOG_ERROR("Request failed", {stageflow::observability::StringField("route", route),
                                           stageflow::observability::StringField("run_id", run_id),
                                           stageflow::observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace stageflow::service
