#include "internal/core/run_orchestrator.hpp"

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/run_state_util.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::core {

using stageflow::core::v1::RetryPolicy;
using stageflow::core::v1::RunState;
using stageflow::core::v1::StageDefinition;
using stageflow::events::v1::Event;
using stageflow::observability::BoolField;
using stageflow::observability::IntField;
using stageflow::observability::StringField;

namespace core_v1 = stageflow::core::v1;

namespace {

std::string_view KindName(core_v1::StageKind kind) {
  switch (kind) {
    case core_v1::STAGE_KIND_GENERATE:
      return "generate";
    case core_v1::STAGE_KIND_USER_INPUT:
      return "user_input";
    case core_v1::STAGE_KIND_TRANSFORM:
      return "transform";
    default:
      return "unspecified";
  }
}

Event StageStartedEvent(const std::string& stage_id, uint32_t attempt) {
  Event event;
  auto* started = event.mutable_stage_started();
  started->set_stage_id(stage_id);
  started->set_attempt(attempt);
  return event;
}

Event StageFailedEvent(const std::string& stage_id, uint32_t attempt, const std::string& error, bool cancelled) {
  Event event;
  auto* failed = event.mutable_stage_failed();
  failed->set_stage_id(stage_id);
  failed->set_attempt(attempt);
  failed->set_error(error);
  failed->set_cancelled(cancelled);
  return event;
}

Event StageCompletedEvent(const std::string& stage_id, uint32_t attempt, const stage::StageOutcome& outcome, uint64_t duration_ms) {
  Event event;
  auto* done = event.mutable_stage_completed();
  done->set_stage_id(stage_id);
  done->set_attempt(attempt);
  done->set_output(outcome.output);
  done->set_source(outcome.source);
  done->set_model(outcome.model);
  *done->mutable_tokens()       = outcome.tokens;
  *done->mutable_spent_tokens() = outcome.spent_tokens;
  done->set_cache_key(outcome.cache_key);
  done->set_duration_ms(duration_ms);
  return event;
}

Event StageRetriedEvent(const std::string& stage_id, uint32_t failed_attempt, const std::string& error, uint64_t backoff_ms) {
  Event event;
  auto* retried = event.mutable_stage_retried();
  retried->set_stage_id(stage_id);
  retried->set_failed_attempt(failed_attempt);
  retried->set_next_attempt(failed_attempt + 1);
  retried->set_error(error);
  retried->set_backoff_ms(backoff_ms);
  return event;
}

// Runs one attempt on a worker thread. Touches nothing owned by the
// orchestrator, so it may outlive it.
void RunAttempt(const std::shared_ptr<Mailbox>& mailbox, const std::shared_ptr<stage::HandlerSet>& handlers,
                flight::AttemptLease& lease, const stage::StageContext& context) {
  const auto& definition = *context.definition;

  AttemptFinished finished;
  finished.stage_id = definition.id();
  finished.attempt  = context.attempt;

  observability::LogContext log_context(
      {StringField("run_id", context.state.run_id()), StringField("stage_id", definition.id()), IntField("attempt", context.attempt)});

  observability::SpanScope span("stageflow.stage.attempt");
  span.SetStage(context.state.run_id(), definition.id(), context.attempt);
  span.SetAttribute("stageflow.stage.kind", KindName(definition.kind()));

  const auto started = std::chrono::steady_clock::now();
  try {
    finished.outcome = handlers->For(definition.kind()).Execute(context);
  } catch (const util::Cancelled& e) {
    finished.cancelled = true;
    finished.error     = e.what();
  } catch (const util::StageExecutionError& e) {
    finished.error     = e.what();
    finished.retryable = e.retryable();
  } catch (const std::exception& e) {
    finished.error     = e.what();
    finished.retryable = true;
  }
  finished.duration_ms =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());

  if (!finished.outcome) span.RecordException(finished.error);

  lease.Release();
  if (!mailbox->Post(std::move(finished))) {
    STAGEFLOW_LOG_DEBUG("Attempt result dropped, run loop has stopped");
  }
}

} // namespace

RunOrchestrator::RunOrchestrator(std::shared_ptr<const pipeline::CompiledTemplate> compiled, RunState initial, RunDependencies deps,
                                 OrchestratorOptions options)
    : run_id_(initial.run_id()),
      compiled_(std::move(compiled)),
      deps_(std::move(deps)),
      options_(std::move(options)),
      resolver_(options_.max_concurrent_stages),
      mailbox_(std::make_shared<Mailbox>()),
      state_(std::move(initial)),
      rng_(std::random_device{}()) {
  view_ = state_;
}

RunOrchestrator::~RunOrchestrator() {
  Stop();
}

void RunOrchestrator::Start() {
  if (loop_.joinable()) return;
  loop_ = std::thread(&RunOrchestrator::Loop, this);
}

// ------------------------------------------------------------
// Control surface
// ------------------------------------------------------------

void RunOrchestrator::Request(ControlRequest request) {
  auto done   = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!mailbox_->Post(ControlMessage{std::move(request), done})) {
    throw util::InvalidState("run " + run_id_ + " is no longer active");
  }
  future.get();
}

void RunOrchestrator::SupplyFeedback(const std::string& stage_id, const std::string& selection) {
  Request(FeedbackRequest{stage_id, selection});
}

void RunOrchestrator::Cancel(const std::string& reason) {
  Request(CancelRequest{reason});
}

void RunOrchestrator::Pause(const std::string& reason) {
  Request(PauseRequest{reason});
}

void RunOrchestrator::Resume() {
  Request(ResumeRequest{});
}

void RunOrchestrator::Skip(const std::string& stage_id) {
  Request(SkipRequest{stage_id});
}

void RunOrchestrator::Stop() {
  if (!loop_.joinable()) return;

  auto done   = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (mailbox_->Post(ControlMessage{StopRequest{}, done})) future.wait();
  loop_.join();
}

RunState RunOrchestrator::State() const {
  std::lock_guard lock(view_mutex_);
  RunState        state = view_;
  if (!fatal_.empty()) {
    state.set_status(core_v1::RUN_STATUS_FAILED);
    state.set_failure_reason("event sink failure: " + fatal_);
  }
  return state;
}

bool RunOrchestrator::Done() const {
  std::lock_guard lock(view_mutex_);
  return done_;
}

bool RunOrchestrator::WaitUntilDone(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(view_mutex_);
  return done_cv_.wait_for(lock, timeout, [&] { return done_; });
}

// ------------------------------------------------------------
// Loop
// ------------------------------------------------------------

void RunOrchestrator::Loop() {
  observability::LogContext log_context({StringField("run_id", run_id_)});
  try {
    Bootstrap();

    while (!stopping_) {
      Tick();
      if (state::IsTerminal(state_.status())) break;

      std::optional<Mailbox::Deadline> deadline;
      if (state_.status() == core_v1::RUN_STATUS_RUNNING) {
        for (const auto& [_, timer] : retries_) {
          if (!deadline || timer.due < *deadline) deadline = timer.due;
        }
      }

      if (auto message = mailbox_->PopUntil(deadline)) Handle(std::move(*message));
    }

    DrainWorkers(SteadyClock::now() + options_.cancel_timeout);
  } catch (const std::exception& e) {
    STAGEFLOW_LOG_ERROR("Run stopped on event log failure", {StringField("error", e.what())});
    {
      std::lock_guard lock(view_mutex_);
      fatal_ = e.what();
    }
    cancel_.Cancel();
  }

  Conclude();
}

void RunOrchestrator::Bootstrap() {
  if (state::IsTerminal(state_.status())) return;

  if (state_.status() == core_v1::RUN_STATUS_PENDING) {
    Event started;
    started.mutable_run_started();
    Record({std::move(started)});
    STAGEFLOW_LOG_INFO("Run started", {StringField("template_id", state_.template_id()),
                                       StringField("template_version", state_.template_version())});
  }

  // Attempts interrupted by a restart or a branch point run again.
  const auto     now      = SteadyClock::now();
  const RunState recovered = state_;
  for (const auto& stage : recovered.stages()) {
    if (stage.status() == core_v1::STAGE_STATUS_RUNNING && !stage.awaiting_feedback()) {
      Record({StageRetriedEvent(stage.stage_id(), stage.attempt(), "interrupted", 0)});
      retries_[stage.stage_id()] = RetryTimer{stage.attempt() + 1, now};
      STAGEFLOW_LOG_WARN("Restarting interrupted stage",
                         {StringField("stage_id", stage.stage_id()), IntField("attempt", stage.attempt())});
    } else if (stage.status() == core_v1::STAGE_STATUS_FAILED && stage.retry_pending()) {
      retries_[stage.stage_id()] = RetryTimer{stage.attempt() + 1, now};
    }
  }
}

void RunOrchestrator::Tick() {
  if (state::IsTerminal(state_.status()) || cancelling_) return;

  if (RequiredStageFailed()) {
    if (!workers_.empty()) return;

    std::vector<Event> batch;
    for (const auto& [stage_id, timer] : retries_) {
      batch.push_back(StageFailedEvent(stage_id, timer.next_attempt - 1, "abandoned after a required stage failed", false));
    }
    retries_.clear();

    Event failed;
    auto* payload = failed.mutable_run_failed();
    for (const auto& stage : state_.stages()) {
      if (stage.status() != core_v1::STAGE_STATUS_FAILED && stage.status() != core_v1::STAGE_STATUS_CANCELLED) continue;
      const auto* topology = state::FindTopology(state_, stage.stage_id());
      if (topology && topology->optional()) continue;
      if (payload->reason().empty()) {
        std::string last = "unknown error";
        if (stage.errors_size() > 0) last = stage.errors(stage.errors_size() - 1).message();
        payload->set_reason("stage " + stage.stage_id() + " failed after " + std::to_string(stage.attempt()) + " attempt(s): " + last);
      }
    }
    // Full error history of every failed stage, declaration order.
    for (const auto& stage : state_.stages()) {
      if (stage.status() != core_v1::STAGE_STATUS_FAILED) continue;
      for (const auto& error : stage.errors()) *payload->add_chain() = error;
    }
    batch.push_back(std::move(failed));
    Record(std::move(batch));
    return;
  }

  if (state_.status() != core_v1::RUN_STATUS_RUNNING) return;

  const auto now = SteadyClock::now();
  for (auto it = retries_.begin(); it != retries_.end();) {
    if (it->second.due > now) {
      ++it;
      continue;
    }
    const auto stage_id = it->first;
    const auto attempt  = it->second.next_attempt;
    it                  = retries_.erase(it);
    StartAttempt(stage_id, attempt);
  }

  const auto resolution = resolver_.Resolve(state_);
  for (const auto& stage_id : resolution.runnable) {
    const auto* stage = state::FindStage(state_, stage_id);
    StartAttempt(stage_id, stage->attempt() + 1);
  }

  if (!resolution.runnable.empty() || !retries_.empty() || !workers_.empty()) return;

  if (resolution.exhausted) {
    Event completed;
    completed.mutable_run_completed();
    Record({std::move(completed)});
  } else if (resolution.stuck) {
    const util::DependencyUnsatisfiable error("waiting stages can never become eligible");
    Event                               failed;
    failed.mutable_run_failed()->set_reason(error.what());
    Record({std::move(failed)});
  }
}

void RunOrchestrator::StartAttempt(const std::string& stage_id, uint32_t attempt) {
  const auto& definition = Definition(stage_id);

  flight::AttemptLease lease;
  try {
    lease = deps_.attempts->Acquire(run_id_, stage_id, attempt);
  } catch (const util::AttemptConflict& e) {
    STAGEFLOW_LOG_ERROR("Attempt already taken", {StringField("error", e.what())});
    Record({StageFailedEvent(stage_id, attempt, e.what(), false)});
    return;
  }

  Record({StageStartedEvent(stage_id, attempt)});

  ReapWorker(stage_id);

  stage::StageContext context;
  context.pipeline   = &compiled_->definition;
  context.definition = &definition;
  context.state      = state_;
  context.attempt    = attempt;
  context.cancel     = cancel_.Token();
  context.on_chunk   = [bus = deps_.bus, run_id = run_id_, stage_id, attempt](std::string_view text) {
    RunUpdate update;
    auto*     chunk = update.mutable_chunk();
    chunk->set_stage_id(stage_id);
    chunk->set_attempt(attempt);
    chunk->set_text(std::string(text));
    bus->Publish(run_id, update);
  };

  workers_[stage_id] = std::thread([mailbox = mailbox_, handlers = deps_.handlers, compiled = compiled_, attempts = deps_.attempts,
                                    lease = std::move(lease), context = std::move(context)]() mutable {
    RunAttempt(mailbox, handlers, lease, context);
  });
}

void RunOrchestrator::ReapWorker(const std::string& stage_id) {
  auto it = workers_.find(stage_id);
  if (it == workers_.end()) return;
  if (it->second.joinable()) it->second.join();
  workers_.erase(it);
}

// ------------------------------------------------------------
// Messages
// ------------------------------------------------------------

void RunOrchestrator::Handle(RunMessage message) {
  if (auto* finished = std::get_if<AttemptFinished>(&message)) {
    HandleAttempt(std::move(*finished));
    return;
  }
  HandleControl(std::move(std::get<ControlMessage>(message)));
}

void RunOrchestrator::HandleAttempt(AttemptFinished finished) {
  ReapWorker(finished.stage_id);
  if (stopping_) return;

  if (state::IsTerminal(state_.status())) {
    RecordLate(finished);
    return;
  }

  const auto& definition = Definition(finished.stage_id);
  const auto  kind       = KindName(definition.kind());
  auto&       metrics    = observability::Metrics::Instance();

  if (finished.outcome) {
    const auto& outcome = *finished.outcome;
    if (outcome.awaiting_feedback) {
      Event event;
      auto* awaiting = event.mutable_stage_awaiting_feedback();
      awaiting->set_stage_id(finished.stage_id);
      awaiting->set_attempt(finished.attempt);
      for (const auto& candidate : outcome.candidates) awaiting->add_candidates(candidate);
      awaiting->set_cache_key(outcome.cache_key);
      awaiting->set_model(outcome.model);
      *awaiting->mutable_spent_tokens() = outcome.spent_tokens;
      Record({std::move(event)});
      metrics.RecordStageOutcome(kind, "awaiting_feedback");
      return;
    }

    Record({StageCompletedEvent(finished.stage_id, finished.attempt, outcome, finished.duration_ms)});
    metrics.RecordStageOutcome(kind, outcome.source == core_v1::COMPLETION_SOURCE_CACHE ? "cached" : "completed");
    metrics.ObserveStageDurationMs(kind, static_cast<double>(finished.duration_ms));
    STAGEFLOW_LOG_INFO("Stage completed", {StringField("stage_id", finished.stage_id),
                                           IntField("attempt", finished.attempt),
                                           StringField("source", outcome.source == core_v1::COMPLETION_SOURCE_CACHE ? "cache" : "fresh"),
                                           IntField("duration_ms", static_cast<int64_t>(finished.duration_ms))});
    return;
  }

  if (finished.cancelled) {
    Record({StageFailedEvent(finished.stage_id, finished.attempt, finished.error, true)});
    metrics.RecordStageOutcome(kind, "cancelled");
    return;
  }

  const auto policy = RetryFor(definition);
  if (finished.retryable && finished.attempt < policy.max_attempts()) {
    const auto backoff = Backoff(policy, finished.attempt);
    Record({StageRetriedEvent(finished.stage_id, finished.attempt, finished.error, static_cast<uint64_t>(backoff.count()))});
    retries_[finished.stage_id] = RetryTimer{finished.attempt + 1, SteadyClock::now() + backoff};
    metrics.RecordStageOutcome(kind, "retried");
    STAGEFLOW_LOG_WARN("Stage attempt failed, retrying",
                       {StringField("stage_id", finished.stage_id), IntField("attempt", finished.attempt),
                        IntField("backoff_ms", static_cast<int64_t>(backoff.count())), StringField("error", finished.error)});
    return;
  }

  Record({StageFailedEvent(finished.stage_id, finished.attempt, finished.error, false)});
  metrics.RecordStageOutcome(kind, "failed");
  STAGEFLOW_LOG_ERROR("Stage failed", {StringField("stage_id", finished.stage_id),
                                       IntField("attempt", finished.attempt), BoolField("optional", definition.optional()),
                                       StringField("error", finished.error)});
}

void RunOrchestrator::RecordLate(const AttemptFinished& finished) {
  if (finished.outcome && !finished.outcome->awaiting_feedback) {
    Record({StageCompletedEvent(finished.stage_id, finished.attempt, *finished.outcome, finished.duration_ms)});
  } else {
    const auto error = finished.error.empty() ? std::string("cancelled") : finished.error;
    Record({StageFailedEvent(finished.stage_id, finished.attempt, error, true)});
  }
}

void RunOrchestrator::HandleControl(ControlMessage message) {
  try {
    const auto& request = message.request;
    if (stopping_ && !std::holds_alternative<StopRequest>(request)) {
      throw util::InvalidState("run " + run_id_ + " is shutting down");
    }
    if (auto* feedback = std::get_if<FeedbackRequest>(&request)) {
      OnFeedback(*feedback);
    } else if (auto* cancel = std::get_if<CancelRequest>(&request)) {
      OnCancel(*cancel);
    } else if (auto* pause = std::get_if<PauseRequest>(&request)) {
      OnPause(*pause);
    } else if (std::holds_alternative<ResumeRequest>(request)) {
      OnResume();
    } else if (auto* skip = std::get_if<SkipRequest>(&request)) {
      OnSkip(*skip);
    } else {
      stopping_ = true;
      cancel_.Cancel();
    }
    message.done->set_value();
  } catch (const util::EventSinkError&) {
    message.done->set_exception(std::current_exception());
    throw;
  } catch (const std::exception&) {
    message.done->set_exception(std::current_exception());
  }
}

void RunOrchestrator::OnFeedback(const FeedbackRequest& request) {
  if (state::IsTerminal(state_.status())) {
    throw util::InvalidState("run " + run_id_ + " is " + std::string(state::RunStatusName(state_.status())));
  }
  const auto* stage = state::FindStage(state_, request.stage_id);
  if (!stage) throw util::NotFound("stage " + request.stage_id + " in run " + run_id_);
  if (!stage->awaiting_feedback()) throw util::InvalidState("stage " + request.stage_id + " is not awaiting feedback");

  const auto& definition = Definition(request.stage_id);
  const auto  output     = deps_.handlers->For(definition.kind()).ResolveFeedback(*stage, request.selection);

  Event recorded;
  recorded.mutable_user_feedback_recorded()->set_stage_id(request.stage_id);
  recorded.mutable_user_feedback_recorded()->set_selection(request.selection);

  stage::StageOutcome outcome;
  outcome.output    = output;
  outcome.source    = core_v1::COMPLETION_SOURCE_USER;
  outcome.model     = stage->model();
  outcome.cache_key = stage->cache_key();

  Record({std::move(recorded), StageCompletedEvent(request.stage_id, stage->attempt(), outcome, 0)});
  STAGEFLOW_LOG_INFO("Feedback recorded", {StringField("stage_id", request.stage_id)});
}

void RunOrchestrator::OnCancel(const CancelRequest& request) {
  if (state::IsTerminal(state_.status())) return;

  cancelling_ = true;
  cancel_.Cancel();
  retries_.clear();

  std::vector<std::string> in_flight;
  for (const auto& stage : state_.stages()) {
    if (stage.status() == core_v1::STAGE_STATUS_RUNNING || state::IsInFlight(stage)) in_flight.push_back(stage.stage_id());
  }

  const auto deadline = SteadyClock::now() + options_.cancel_timeout;
  while (!workers_.empty()) {
    auto message = mailbox_->PopUntil(deadline);
    if (!message) break;

    if (auto* finished = std::get_if<AttemptFinished>(&*message)) {
      ReapWorker(finished->stage_id);
      if (finished->outcome && !finished->outcome->awaiting_feedback) {
        Record({StageCompletedEvent(finished->stage_id, finished->attempt, *finished->outcome, finished->duration_ms)});
      } else {
        Record({StageFailedEvent(finished->stage_id, finished->attempt, "cancelled", true)});
      }
      continue;
    }

    auto& control = std::get<ControlMessage>(*message);
    if (std::holds_alternative<CancelRequest>(control.request)) {
      control.done->set_value();
    } else if (std::holds_alternative<StopRequest>(control.request)) {
      stopping_ = true;
      control.done->set_value();
    } else {
      control.done->set_exception(std::make_exception_ptr(util::InvalidState("run " + run_id_ + " is being cancelled")));
    }
  }

  if (!workers_.empty()) {
    STAGEFLOW_LOG_WARN("Cancellation timed out waiting for in-flight stages",
                       {IntField("unacknowledged", static_cast<int64_t>(workers_.size()))});
  }

  Event cancelled;
  auto* payload = cancelled.mutable_run_cancelled();
  for (const auto& id : in_flight) payload->add_in_flight_stage_ids(id);
  payload->set_reason(request.reason);
  Record({std::move(cancelled)});
}

void RunOrchestrator::OnPause(const PauseRequest& request) {
  if (state::IsTerminal(state_.status())) {
    throw util::InvalidState("run " + run_id_ + " is " + std::string(state::RunStatusName(state_.status())));
  }
  if (state_.status() == core_v1::RUN_STATUS_PAUSED) return;

  Event paused;
  paused.mutable_run_paused()->set_reason(request.reason);
  Record({std::move(paused)});
  STAGEFLOW_LOG_INFO("Run paused");
}

void RunOrchestrator::OnResume() {
  if (state::IsTerminal(state_.status())) {
    throw util::InvalidState("run " + run_id_ + " is " + std::string(state::RunStatusName(state_.status())));
  }
  if (state_.status() != core_v1::RUN_STATUS_PAUSED) return;

  Event resumed;
  resumed.mutable_run_resumed();
  Record({std::move(resumed)});
  STAGEFLOW_LOG_INFO("Run resumed");
}

void RunOrchestrator::OnSkip(const SkipRequest& request) {
  if (state::IsTerminal(state_.status())) {
    throw util::InvalidState("run " + run_id_ + " is " + std::string(state::RunStatusName(state_.status())));
  }
  const auto* stage = state::FindStage(state_, request.stage_id);
  if (!stage) throw util::NotFound("stage " + request.stage_id + " in run " + run_id_);

  const bool skippable = stage->status() == core_v1::STAGE_STATUS_WAITING || stage->awaiting_feedback() ||
                         (stage->status() == core_v1::STAGE_STATUS_FAILED && stage->retry_pending());
  if (!skippable) {
    throw util::InvalidState("stage " + request.stage_id + " is " + std::string(state::StageStatusName(stage->status())));
  }

  retries_.erase(request.stage_id);

  Event skipped;
  skipped.mutable_stage_skipped()->set_stage_id(request.stage_id);
  skipped.mutable_stage_skipped()->set_reason("skipped on request");
  Record({std::move(skipped)});
}

// ------------------------------------------------------------
// Shutdown
// ------------------------------------------------------------

void RunOrchestrator::DrainWorkers(SteadyClock::time_point deadline) {
  while (!workers_.empty()) {
    auto message = mailbox_->PopUntil(deadline);
    if (!message) return;
    Handle(std::move(*message));
  }
}

void RunOrchestrator::Conclude() {
  retries_.clear();

  for (auto& message : mailbox_->Close()) {
    if (auto* control = std::get_if<ControlMessage>(&message)) {
      if (std::holds_alternative<StopRequest>(control->request) || std::holds_alternative<CancelRequest>(control->request)) {
        control->done->set_value();
      } else {
        control->done->set_exception(std::make_exception_ptr(util::InvalidState("run " + run_id_ + " is no longer active")));
      }
    } else {
      ReapWorker(std::get<AttemptFinished>(message).stage_id);
    }
  }

  for (auto& [stage_id, worker] : workers_) {
    if (!worker.joinable()) continue;
    STAGEFLOW_LOG_WARN("Abandoning unresponsive stage attempt", {StringField("stage_id", stage_id)});
    worker.detach();
  }
  workers_.clear();
  deps_.attempts->ForgetRun(run_id_);

  if (state::IsTerminal(state_.status())) {
    observability::Metrics::Instance().RecordRunOutcome(state::RunStatusName(state_.status()));
    STAGEFLOW_LOG_INFO("Run finished", {StringField("status", state::RunStatusName(state_.status())),
                                        IntField("sequence", static_cast<int64_t>(state_.sequence()))});
  }

  {
    std::lock_guard lock(view_mutex_);
    done_ = true;
  }
  done_cv_.notify_all();
  deps_.bus->CloseRun(run_id_);
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

void RunOrchestrator::Record(std::vector<Event> batch) {
  auto written = deps_.store->Append(state_, std::move(batch));

  for (const auto& event : written) {
    // Snapshots are replay bookkeeping; subscribers see run facts only.
    if (event.has_state_snapshot()) continue;
    RunUpdate update;
    *update.mutable_event() = event;
    deps_.bus->Publish(run_id_, update);
  }

  {
    std::lock_guard lock(view_mutex_);
    view_ = state_;
  }

  if (state::IsTerminal(state_.status())) deps_.bus->CloseRun(run_id_);
}

const StageDefinition& RunOrchestrator::Definition(const std::string& stage_id) const {
  for (const auto& stage : compiled_->definition.stages()) {
    if (stage.id() == stage_id) return stage;
  }
  throw util::NotFound("stage " + stage_id + " in template " + compiled_->definition.id());
}

RetryPolicy RunOrchestrator::RetryFor(const StageDefinition& definition) const {
  RetryPolicy policy = definition.retry_policy();
  const auto& base   = options_.default_retry;
  if (policy.max_attempts() == 0) policy.set_max_attempts(base.max_attempts() ? base.max_attempts() : 1);
  if (policy.initial_backoff_ms() == 0) policy.set_initial_backoff_ms(base.initial_backoff_ms());
  if (policy.max_backoff_ms() == 0) policy.set_max_backoff_ms(base.max_backoff_ms());
  if (policy.backoff_multiplier() <= 0) policy.set_backoff_multiplier(base.backoff_multiplier() > 0 ? base.backoff_multiplier() : 1.0);
  if (!definition.has_retry_policy()) policy.set_jitter(base.jitter());
  return policy;
}

std::chrono::milliseconds RunOrchestrator::Backoff(const RetryPolicy& policy, uint32_t failed_attempt) {
  double delay = static_cast<double>(policy.initial_backoff_ms()) * std::pow(policy.backoff_multiplier(), failed_attempt - 1.0);
  if (policy.max_backoff_ms() > 0) delay = std::min(delay, static_cast<double>(policy.max_backoff_ms()));
  if (policy.jitter()) {
    std::uniform_real_distribution<double> factor(0.5, 1.5);
    delay *= factor(rng_);
  }
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool RunOrchestrator::RequiredStageFailed() const {
  for (const auto& stage : state_.stages()) {
    const bool failed = (stage.status() == core_v1::STAGE_STATUS_FAILED && !stage.retry_pending()) ||
                        stage.status() == core_v1::STAGE_STATUS_CANCELLED;
    if (!failed) continue;
    const auto* topology = state::FindTopology(state_, stage.stage_id());
    if (!topology || !topology->optional()) return true;
  }
  return false;
}

} // namespace stageflow::core
