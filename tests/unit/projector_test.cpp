#include "internal/state/projector.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/state/run_state_util.hpp"

namespace {

using stageflow::core::v1::RunState;
using stageflow::events::v1::Event;
using stageflow::state::FindStage;
using stageflow::state::Projector;

namespace core_v1 = stageflow::core::v1;

class EventLog {
 public:
  Event& Next() {
    events_.emplace_back();
    auto& event = events_.back();
    event.set_run_id("run-1");
    event.set_sequence(events_.size());
    event.mutable_recorded_at()->set_seconds(1700000000 + static_cast<int64_t>(events_.size()));
    return event;
  }

  void Created(std::initializer_list<std::pair<const char*, std::vector<std::string>>> stages) {
    auto* created = Next().mutable_run_created();
    created->set_template_id("tpl");
    created->set_template_version("1");
    (*created->mutable_inputs())["topic"] = "rust";
    for (const auto& [id, deps] : stages) {
      auto* topology = created->add_topology();
      topology->set_stage_id(id);
      for (const auto& dep : deps) topology->add_depends_on(dep);
    }
  }

  void Started(const std::string& id, uint32_t attempt) {
    auto* started = Next().mutable_stage_started();
    started->set_stage_id(id);
    started->set_attempt(attempt);
  }

  void Completed(const std::string& id, uint32_t attempt, const std::string& output) {
    auto* done = Next().mutable_stage_completed();
    done->set_stage_id(id);
    done->set_attempt(attempt);
    done->set_output(output);
    done->set_source(core_v1::COMPLETION_SOURCE_FRESH);
  }

  void Generated(const std::string& id, core_v1::CompletionSource source, const std::string& model, uint64_t prompt,
                 uint64_t completion) {
    auto* done = Next().mutable_stage_completed();
    done->set_stage_id(id);
    done->set_attempt(1);
    done->set_output(id + " text");
    done->set_source(source);
    done->set_model(model);
    done->mutable_tokens()->set_prompt_tokens(prompt);
    done->mutable_tokens()->set_completion_tokens(completion);
    if (source == core_v1::COMPLETION_SOURCE_FRESH) *done->mutable_spent_tokens() = done->tokens();
  }

  void Failed(const std::string& id, uint32_t attempt, const std::string& error) {
    auto* failed = Next().mutable_stage_failed();
    failed->set_stage_id(id);
    failed->set_attempt(attempt);
    failed->set_error(error);
  }

  void Cancelled(const std::string& id, uint32_t attempt) {
    auto* failed = Next().mutable_stage_failed();
    failed->set_stage_id(id);
    failed->set_attempt(attempt);
    failed->set_error("cancelled");
    failed->set_cancelled(true);
  }

  const std::vector<Event>& events() const {
    return events_;
  }

 private:
  std::vector<Event> events_;
};

void TestHappyPath() {
  EventLog log;
  log.Created({{"a", {}}, {"b", {"a"}}});
  log.Next().mutable_run_started();
  log.Started("a", 1);
  log.Completed("a", 1, "alpha");
  log.Started("b", 1);
  log.Completed("b", 1, "beta");
  log.Next().mutable_run_completed();

  const auto state = Projector::Replay(log.events());
  assert(state.run_id() == "run-1");
  assert(state.status() == core_v1::RUN_STATUS_COMPLETED);
  assert(state.sequence() == 7);
  assert(state.inputs().at("topic") == "rust");
  assert(state.created_at().seconds() == 1700000001);
  assert(state.started_at().seconds() == 1700000002);
  assert(state.completed_at().seconds() == 1700000007);

  const auto* a = FindStage(state, "a");
  assert(a->status() == core_v1::STAGE_STATUS_COMPLETED);
  assert(a->output() == "alpha");
  assert(a->started_at().seconds() == 1700000003);
  assert(FindStage(state, "b")->output() == "beta");
}

void TestRetryThenFailureSkipsDependentsTransitively() {
  EventLog log;
  log.Created({{"a", {}}, {"b", {"a"}}, {"c", {"b"}}, {"d", {}}});
  log.Next().mutable_run_started();
  log.Started("a", 1);

  auto* retried = log.Next().mutable_stage_retried();
  retried->set_stage_id("a");
  retried->set_failed_attempt(1);
  retried->set_next_attempt(2);
  retried->set_error("timeout");

  auto mid = Projector::Replay(log.events());
  const auto* pending = FindStage(mid, "a");
  assert(pending->status() == core_v1::STAGE_STATUS_FAILED);
  assert(pending->retry_pending());
  assert(stageflow::state::IsInFlight(*pending));
  assert(FindStage(mid, "b")->status() == core_v1::STAGE_STATUS_WAITING);

  log.Started("a", 2);
  log.Failed("a", 2, "timeout again");

  const auto state = Projector::Replay(log.events());
  const auto* a    = FindStage(state, "a");
  assert(a->status() == core_v1::STAGE_STATUS_FAILED);
  assert(!a->retry_pending());
  assert(a->attempt() == 2);
  assert(a->errors_size() == 2);
  assert(a->errors(0).message() == "timeout");
  assert(a->errors(1).attempt() == 2);

  assert(FindStage(state, "b")->status() == core_v1::STAGE_STATUS_SKIPPED);
  assert(FindStage(state, "b")->skip_reason() == core_v1::SKIP_REASON_DEPENDENCY_FAILED);
  assert(FindStage(state, "c")->status() == core_v1::STAGE_STATUS_SKIPPED);
  assert(FindStage(state, "d")->status() == core_v1::STAGE_STATUS_WAITING);
}

void TestTerminalRunAbsorbsLateStageEvents() {
  EventLog log;
  log.Created({{"a", {}}, {"b", {}}});
  log.Next().mutable_run_started();
  log.Started("a", 1);
  log.Started("b", 1);

  auto* cancelled = log.Next().mutable_run_cancelled();
  cancelled->add_in_flight_stage_ids("a");
  cancelled->add_in_flight_stage_ids("b");
  cancelled->set_reason("user asked");

  log.Completed("a", 1, "too late");

  const auto state = Projector::Replay(log.events());
  assert(state.status() == core_v1::RUN_STATUS_CANCELLED);
  assert(state.failure_reason() == "user asked");
  assert(state.in_flight_at_cancel_size() == 2);
  assert(state.sequence() == 6);
  assert(FindStage(state, "a")->status() == core_v1::STAGE_STATUS_CANCELLED);
  assert(FindStage(state, "a")->output().empty());
}

void TestCancellationLeavesDependentsWaiting() {
  // The in-flight stage acknowledged the cancel.
  EventLog acknowledged;
  acknowledged.Created({{"slow", {}}, {"after", {"slow"}}});
  acknowledged.Next().mutable_run_started();
  acknowledged.Started("slow", 1);
  acknowledged.Cancelled("slow", 1);
  acknowledged.Next().mutable_run_cancelled()->add_in_flight_stage_ids("slow");

  // The cancel timed out before the stage answered.
  EventLog timed_out;
  timed_out.Created({{"slow", {}}, {"after", {"slow"}}});
  timed_out.Next().mutable_run_started();
  timed_out.Started("slow", 1);
  timed_out.Next().mutable_run_cancelled()->add_in_flight_stage_ids("slow");

  for (const auto* log : {&acknowledged, &timed_out}) {
    const auto state = Projector::Replay(log->events());
    assert(state.status() == core_v1::RUN_STATUS_CANCELLED);
    assert(FindStage(state, "slow")->status() == core_v1::STAGE_STATUS_CANCELLED);
    assert(FindStage(state, "after")->status() == core_v1::STAGE_STATUS_WAITING);
    assert(FindStage(state, "after")->skip_reason() == core_v1::SKIP_REASON_UNSPECIFIED);
  }
}

void TestFreshGenerationsAccumulateTokensPerModel() {
  EventLog log;
  log.Created({{"a", {}}, {"b", {}}, {"c", {}}, {"d", {}}, {"e", {}}});
  log.Next().mutable_run_started();
  log.Started("a", 1);
  log.Generated("a", core_v1::COMPLETION_SOURCE_FRESH, "small", 10, 40);
  log.Started("b", 1);
  log.Generated("b", core_v1::COMPLETION_SOURCE_FRESH, "large", 7, 3);
  log.Started("c", 1);
  log.Generated("c", core_v1::COMPLETION_SOURCE_FRESH, "small", 5, 5);
  // A cache hit reports the original usage but spends nothing.
  log.Started("d", 1);
  log.Generated("d", core_v1::COMPLETION_SOURCE_CACHE, "small", 100, 100);
  // Candidates cost tokens when produced, not when one is picked.
  log.Started("e", 1);
  auto* awaiting = log.Next().mutable_stage_awaiting_feedback();
  awaiting->set_stage_id("e");
  awaiting->set_attempt(1);
  awaiting->set_model("large");
  awaiting->add_candidates("one");
  awaiting->add_candidates("two");
  awaiting->mutable_spent_tokens()->set_prompt_tokens(2);
  awaiting->mutable_spent_tokens()->set_completion_tokens(8);
  log.Generated("e", core_v1::COMPLETION_SOURCE_USER, "large", 0, 0);
  log.Next().mutable_run_completed();
  // Late duplicate after the run ended.
  log.Generated("a", core_v1::COMPLETION_SOURCE_FRESH, "small", 1000, 1000);

  const auto state = Projector::Replay(log.events());
  assert(state.tokens_by_model_size() == 2);
  assert(state.tokens_by_model().at("small").prompt_tokens() == 15);
  assert(state.tokens_by_model().at("small").completion_tokens() == 45);
  assert(state.tokens_by_model().at("large").prompt_tokens() == 9);
  assert(state.tokens_by_model().at("large").completion_tokens() == 11);

  const auto total = stageflow::state::TotalTokens(state);
  assert(total.prompt_tokens() == 24);
  assert(total.completion_tokens() == 56);

  // Stage-level usage is still recorded for the cache hit.
  assert(FindStage(state, "d")->tokens().prompt_tokens() == 100);
}

void TestPauseResumeAndFeedback() {
  EventLog log;
  log.Created({{"pick", {}}});
  log.Next().mutable_run_started();
  log.Next().mutable_run_paused()->set_reason("lunch");

  auto paused = Projector::Replay(log.events());
  assert(paused.status() == core_v1::RUN_STATUS_PAUSED);

  log.Next().mutable_run_resumed();
  log.Started("pick", 1);

  auto* awaiting = log.Next().mutable_stage_awaiting_feedback();
  awaiting->set_stage_id("pick");
  awaiting->set_attempt(1);
  awaiting->add_candidates("one");
  awaiting->add_candidates("two");

  auto waiting = Projector::Replay(log.events());
  assert(waiting.status() == core_v1::RUN_STATUS_RUNNING);
  assert(FindStage(waiting, "pick")->awaiting_feedback());
  assert(!stageflow::state::IsInFlight(*FindStage(waiting, "pick")));

  auto* feedback = log.Next().mutable_user_feedback_recorded();
  feedback->set_stage_id("pick");
  feedback->set_selection("2");
  log.Completed("pick", 1, "two");

  const auto state = Projector::Replay(log.events());
  const auto* pick = FindStage(state, "pick");
  assert(pick->status() == core_v1::STAGE_STATUS_COMPLETED);
  assert(pick->feedback() == "2");
  assert(pick->output() == "two");
  assert(!pick->awaiting_feedback());
}

void TestSnapshotReplacesFoldedState() {
  EventLog log;
  log.Created({{"a", {}}});
  log.Next().mutable_run_started();
  log.Started("a", 1);

  auto partial = Projector::Replay(log.events());

  Event snapshot;
  snapshot.set_run_id("run-1");
  snapshot.set_sequence(4);
  *snapshot.mutable_state_snapshot()->mutable_state() = partial;

  RunState from_snapshot;
  Projector::Apply(from_snapshot, snapshot);
  assert(from_snapshot.sequence() == 4);
  partial.set_sequence(4);
  assert(google::protobuf::util::MessageDifferencer::Equals(from_snapshot, partial));
}

void TestReplayIsDeterministic() {
  EventLog log;
  log.Created({{"a", {}}, {"b", {"a"}}});
  log.Next().mutable_run_started();
  log.Started("a", 1);
  log.Failed("a", 1, "boom");
  log.Next().mutable_run_failed()->set_reason("stage a failed");

  const auto first  = Projector::Replay(log.events());
  const auto second = Projector::Replay(log.events());
  assert(google::protobuf::util::MessageDifferencer::Equals(first, second));
  assert(first.status() == core_v1::RUN_STATUS_FAILED);
  assert(first.failure_reason() == "stage a failed");
}

} // namespace

int main() {
  TestHappyPath();
  TestRetryThenFailureSkipsDependentsTransitively();
  TestTerminalRunAbsorbsLateStageEvents();
  TestCancellationLeavesDependentsWaiting();
  TestFreshGenerationsAccumulateTokensPerModel();
  TestPauseResumeAndFeedback();
  TestSnapshotReplacesFoldedState();
  TestReplayIsDeterministic();

  std::cout << "stageflow_unit_projector: pass\n";
  return 0;
}
