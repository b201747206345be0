#include "internal/state/run_state_util.hpp"

namespace stageflow::state {

const StageExecution* FindStage(const RunState& state, std::string_view stage_id) {
  for (const auto& stage : state.stages()) {
    if (stage.stage_id() == stage_id) return &stage;
  }
  return nullptr;
}

StageExecution* MutableStage(RunState& state, std::string_view stage_id) {
  for (auto& stage : *state.mutable_stages()) {
    if (stage.stage_id() == stage_id) return &stage;
  }
  return nullptr;
}

const StageTopology* FindTopology(const RunState& state, std::string_view stage_id) {
  for (const auto& topology : state.topology()) {
    if (topology.stage_id() == stage_id) return &topology;
  }
  return nullptr;
}

stageflow::core::v1::TokenUsage TotalTokens(const RunState& state) {
  stageflow::core::v1::TokenUsage total;
  for (const auto& [model, usage] : state.tokens_by_model()) {
    total.set_prompt_tokens(total.prompt_tokens() + usage.prompt_tokens());
    total.set_completion_tokens(total.completion_tokens() + usage.completion_tokens());
  }
  return total;
}

bool IsTerminal(RunStatus status) {
  return status == stageflow::core::v1::RUN_STATUS_COMPLETED || status == stageflow::core::v1::RUN_STATUS_FAILED ||
         status == stageflow::core::v1::RUN_STATUS_CANCELLED;
}

bool IsTerminal(const StageExecution& stage) {
  switch (stage.status()) {
    case stageflow::core::v1::STAGE_STATUS_COMPLETED:
    case stageflow::core::v1::STAGE_STATUS_SKIPPED:
    case stageflow::core::v1::STAGE_STATUS_CANCELLED:
      return true;
    case stageflow::core::v1::STAGE_STATUS_FAILED:
      return !stage.retry_pending();
    default:
      return false;
  }
}

bool IsInFlight(const StageExecution& stage) {
  if (stage.status() == stageflow::core::v1::STAGE_STATUS_RUNNING) return !stage.awaiting_feedback();
  return stage.status() == stageflow::core::v1::STAGE_STATUS_FAILED && stage.retry_pending();
}

std::string_view RunStatusName(RunStatus status) {
  switch (status) {
    case stageflow::core::v1::RUN_STATUS_PENDING:
      return "pending";
    case stageflow::core::v1::RUN_STATUS_RUNNING:
      return "running";
    case stageflow::core::v1::RUN_STATUS_PAUSED:
      return "paused";
    case stageflow::core::v1::RUN_STATUS_COMPLETED:
      return "completed";
    case stageflow::core::v1::RUN_STATUS_FAILED:
      return "failed";
    case stageflow::core::v1::RUN_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

std::string_view StageStatusName(StageStatus status) {
  switch (status) {
    case stageflow::core::v1::STAGE_STATUS_WAITING:
      return "waiting";
    case stageflow::core::v1::STAGE_STATUS_RUNNING:
      return "running";
    case stageflow::core::v1::STAGE_STATUS_COMPLETED:
      return "completed";
    case stageflow::core::v1::STAGE_STATUS_FAILED:
      return "failed";
    case stageflow::core::v1::STAGE_STATUS_SKIPPED:
      return "skipped";
    case stageflow::core::v1::STAGE_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

} // namespace stageflow::state
