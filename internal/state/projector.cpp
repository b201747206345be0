#include "internal/state/projector.hpp"

#include "internal/resolver/dependency_resolver.hpp"
#include "internal/state/run_state_util.hpp"

namespace stageflow::state {

using stageflow::core::v1::RunState;
using stageflow::core::v1::StageExecution;
using stageflow::events::v1::Event;

namespace core_v1 = stageflow::core::v1;

namespace {

void AddError(StageExecution& stage, uint32_t attempt, const std::string& message, const google::protobuf::Timestamp& at) {
  auto* error = stage.add_errors();
  error->set_stage_id(stage.stage_id());
  error->set_attempt(attempt);
  error->set_message(message);
  *error->mutable_at() = at;
}

void AddTokens(RunState& state, const std::string& model, const core_v1::TokenUsage& tokens) {
  if (tokens.prompt_tokens() == 0 && tokens.completion_tokens() == 0) return;
  auto& total = (*state.mutable_tokens_by_model())[model];
  total.set_prompt_tokens(total.prompt_tokens() + tokens.prompt_tokens());
  total.set_completion_tokens(total.completion_tokens() + tokens.completion_tokens());
}

void PropagateSkips(RunState& state, const google::protobuf::Timestamp& at) {
  for (;;) {
    auto blocked = resolver::DependencyResolver::BlockedStages(state);
    if (blocked.empty()) return;
    for (const auto& id : blocked) {
      auto* stage = MutableStage(state, id);
      stage->set_status(core_v1::STAGE_STATUS_SKIPPED);
      stage->set_skip_reason(core_v1::SKIP_REASON_DEPENDENCY_FAILED);
      *stage->mutable_completed_at() = at;
    }
  }
}

void ApplyRunCreated(RunState& state, const Event& event) {
  const auto& created = event.run_created();
  state.set_run_id(event.run_id());
  state.set_template_id(created.template_id());
  state.set_template_version(created.template_version());
  *state.mutable_inputs()   = created.inputs();
  *state.mutable_topology() = created.topology();
  state.set_isolation_scope(created.isolation_scope());
  state.set_status(core_v1::RUN_STATUS_PENDING);
  *state.mutable_created_at() = event.recorded_at();

  state.clear_stages();
  for (const auto& topology : created.topology()) {
    auto* stage = state.add_stages();
    stage->set_stage_id(topology.stage_id());
    stage->set_status(core_v1::STAGE_STATUS_WAITING);
  }
}

// Stage-level events. Ignored for unknown or already terminal stages.
void ApplyStageEvent(RunState& state, const Event& event) {
  const auto& at = event.recorded_at();

  switch (event.payload_case()) {
    case Event::kStageStarted: {
      auto* stage = MutableStage(state, event.stage_started().stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_attempt(event.stage_started().attempt());
      stage->set_status(core_v1::STAGE_STATUS_RUNNING);
      stage->set_retry_pending(false);
      stage->set_awaiting_feedback(false);
      stage->clear_candidates();
      *stage->mutable_started_at() = at;
      return;
    }
    case Event::kStageCompleted: {
      const auto& done  = event.stage_completed();
      auto*       stage = MutableStage(state, done.stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_attempt(done.attempt());
      stage->set_status(core_v1::STAGE_STATUS_COMPLETED);
      stage->set_retry_pending(false);
      stage->set_awaiting_feedback(false);
      stage->set_output(done.output());
      stage->set_source(done.source());
      stage->set_model(done.model());
      *stage->mutable_tokens() = done.tokens();
      stage->set_cache_key(done.cache_key());
      *stage->mutable_completed_at() = at;
      AddTokens(state, done.model(), done.spent_tokens());
      return;
    }
    case Event::kStageFailed: {
      const auto& failed = event.stage_failed();
      auto*       stage  = MutableStage(state, failed.stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_attempt(failed.attempt());
      stage->set_status(failed.cancelled() ? core_v1::STAGE_STATUS_CANCELLED : core_v1::STAGE_STATUS_FAILED);
      stage->set_retry_pending(false);
      stage->set_awaiting_feedback(false);
      AddError(*stage, failed.attempt(), failed.error(), at);
      *stage->mutable_completed_at() = at;
      PropagateSkips(state, at);
      return;
    }
    case Event::kStageRetried: {
      const auto& retried = event.stage_retried();
      auto*       stage   = MutableStage(state, retried.stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_attempt(retried.failed_attempt());
      stage->set_status(core_v1::STAGE_STATUS_FAILED);
      stage->set_retry_pending(true);
      stage->set_awaiting_feedback(false);
      AddError(*stage, retried.failed_attempt(), retried.error(), at);
      return;
    }
    case Event::kStageAwaitingFeedback: {
      const auto& awaiting = event.stage_awaiting_feedback();
      auto*       stage    = MutableStage(state, awaiting.stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_awaiting_feedback(true);
      *stage->mutable_candidates() = awaiting.candidates();
      stage->set_cache_key(awaiting.cache_key());
      stage->set_model(awaiting.model());
      AddTokens(state, awaiting.model(), awaiting.spent_tokens());
      return;
    }
    case Event::kStageSkipped: {
      auto* stage = MutableStage(state, event.stage_skipped().stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_status(core_v1::STAGE_STATUS_SKIPPED);
      stage->set_skip_reason(core_v1::SKIP_REASON_EXPLICIT);
      stage->set_retry_pending(false);
      stage->set_awaiting_feedback(false);
      *stage->mutable_completed_at() = at;
      PropagateSkips(state, at);
      return;
    }
    case Event::kUserFeedbackRecorded: {
      auto* stage = MutableStage(state, event.user_feedback_recorded().stage_id());
      if (!stage || IsTerminal(*stage)) return;
      stage->set_feedback(event.user_feedback_recorded().selection());
      return;
    }
    default:
      return;
  }
}

void ApplyRunCancelled(RunState& state, const Event& event) {
  const auto& cancelled = event.run_cancelled();
  state.set_status(core_v1::RUN_STATUS_CANCELLED);
  *state.mutable_in_flight_at_cancel() = cancelled.in_flight_stage_ids();
  if (!cancelled.reason().empty()) state.set_failure_reason(cancelled.reason());
  *state.mutable_completed_at() = event.recorded_at();

  for (auto& stage : *state.mutable_stages()) {
    if (stage.status() == core_v1::STAGE_STATUS_RUNNING || IsInFlight(stage)) {
      stage.set_status(core_v1::STAGE_STATUS_CANCELLED);
      stage.set_retry_pending(false);
      stage.set_awaiting_feedback(false);
      *stage.mutable_completed_at() = event.recorded_at();
    }
  }
}

} // namespace

void Projector::Apply(RunState& state, const Event& event) {
  if (event.has_state_snapshot()) {
    state = event.state_snapshot().state();
    state.set_sequence(event.sequence());
    return;
  }

  state.set_sequence(event.sequence());

  if (event.has_run_created()) {
    ApplyRunCreated(state, event);
    return;
  }

  // Terminal runs absorb everything else.
  if (IsTerminal(state.status())) return;

  switch (event.payload_case()) {
    case Event::kRunStarted:
      state.set_status(core_v1::RUN_STATUS_RUNNING);
      if (!state.has_started_at()) *state.mutable_started_at() = event.recorded_at();
      return;
    case Event::kRunPaused:
      if (state.status() == core_v1::RUN_STATUS_RUNNING) state.set_status(core_v1::RUN_STATUS_PAUSED);
      return;
    case Event::kRunResumed:
      if (state.status() == core_v1::RUN_STATUS_PAUSED) state.set_status(core_v1::RUN_STATUS_RUNNING);
      return;
    case Event::kRunCompleted:
      state.set_status(core_v1::RUN_STATUS_COMPLETED);
      *state.mutable_completed_at() = event.recorded_at();
      return;
    case Event::kRunFailed:
      state.set_status(core_v1::RUN_STATUS_FAILED);
      state.set_failure_reason(event.run_failed().reason());
      *state.mutable_failure_chain() = event.run_failed().chain();
      *state.mutable_completed_at()  = event.recorded_at();
      return;
    case Event::kRunCancelled:
      ApplyRunCancelled(state, event);
      return;
    default:
      ApplyStageEvent(state, event);
      return;
  }
}

RunState Projector::Replay(const std::vector<Event>& events) {
  RunState state;
  Replay(state, events);
  return state;
}

void Projector::Replay(RunState& state, const std::vector<Event>& events) {
  for (const auto& event : events) Apply(state, event);
}

} // namespace stageflow::state
