#include "internal/resolver/dependency_resolver.hpp"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>

namespace {

using stageflow::core::v1::RunState;
using stageflow::core::v1::StageExecution;
using stageflow::resolver::DependencyResolver;

namespace core_v1 = stageflow::core::v1;

StageExecution& AddStage(RunState& state, const std::string& id, std::initializer_list<const char*> deps, bool optional = false) {
  auto* topology = state.add_topology();
  topology->set_stage_id(id);
  for (const auto* dep : deps) topology->add_depends_on(dep);
  topology->set_optional(optional);

  auto* stage = state.add_stages();
  stage->set_stage_id(id);
  stage->set_status(core_v1::STAGE_STATUS_WAITING);
  return *stage;
}

void TestIndependentStagesRespectConcurrencyLimit() {
  RunState state;
  AddStage(state, "a", {});
  AddStage(state, "b", {});
  AddStage(state, "c", {});

  const auto resolution = DependencyResolver(2).Resolve(state);
  assert((resolution.runnable == std::vector<std::string>{"a", "b"}));
  assert(!resolution.exhausted);
  assert(!resolution.stuck);

  state.mutable_stages(0)->set_status(core_v1::STAGE_STATUS_RUNNING);
  const auto next = DependencyResolver(2).Resolve(state);
  assert(next.in_flight == 1);
  assert((next.runnable == std::vector<std::string>{"b"}));
}

void TestDependentsWaitForCompletion() {
  RunState state;
  auto&    a = AddStage(state, "a", {});
  AddStage(state, "b", {"a"});

  assert((DependencyResolver(4).Resolve(state).runnable == std::vector<std::string>{"a"}));

  a.set_status(core_v1::STAGE_STATUS_COMPLETED);
  assert((DependencyResolver(4).Resolve(state).runnable == std::vector<std::string>{"b"}));
}

void TestPendingRetryCountsAsInFlight() {
  RunState state;
  auto&    a = AddStage(state, "a", {});
  AddStage(state, "b", {"a"});
  a.set_status(core_v1::STAGE_STATUS_FAILED);
  a.set_retry_pending(true);

  const auto resolution = DependencyResolver(1).Resolve(state);
  assert(resolution.in_flight == 1);
  assert(resolution.runnable.empty());
  assert(!resolution.stuck);
  assert(DependencyResolver::BlockedStages(state).empty());
}

void TestRequiredFailureBlocksAndOptionalFailureDoesNot() {
  RunState state;
  auto&    a = AddStage(state, "a", {});
  auto&    o = AddStage(state, "o", {}, true);
  AddStage(state, "b", {"a"});
  AddStage(state, "c", {"o"});

  a.set_status(core_v1::STAGE_STATUS_FAILED);
  o.set_status(core_v1::STAGE_STATUS_FAILED);

  assert((DependencyResolver::BlockedStages(state) == std::vector<std::string>{"b"}));
  assert((DependencyResolver(4).Resolve(state).runnable == std::vector<std::string>{"c"}));
}

void TestExplicitSkipSatisfiesDependents() {
  RunState state;
  auto&    a = AddStage(state, "a", {});
  auto&    b = AddStage(state, "b", {"a"});
  AddStage(state, "c", {"b"});

  a.set_status(core_v1::STAGE_STATUS_SKIPPED);
  a.set_skip_reason(core_v1::SKIP_REASON_EXPLICIT);
  assert((DependencyResolver(4).Resolve(state).runnable == std::vector<std::string>{"b"}));

  b.set_status(core_v1::STAGE_STATUS_SKIPPED);
  b.set_skip_reason(core_v1::SKIP_REASON_DEPENDENCY_FAILED);
  assert((DependencyResolver::BlockedStages(state) == std::vector<std::string>{"c"}));
}

void TestAwaitingFeedbackHoldsTheRunOpen() {
  RunState state;
  auto&    a = AddStage(state, "a", {});
  AddStage(state, "b", {"a"});
  a.set_status(core_v1::STAGE_STATUS_RUNNING);
  a.set_awaiting_feedback(true);

  const auto resolution = DependencyResolver(1).Resolve(state);
  assert(resolution.awaiting == 1);
  assert(resolution.in_flight == 0);
  assert(resolution.runnable.empty());
  assert(!resolution.exhausted);
  assert(!resolution.stuck);
}

void TestExhaustedAndStuck() {
  RunState done;
  AddStage(done, "a", {}).set_status(core_v1::STAGE_STATUS_COMPLETED);
  AddStage(done, "b", {"a"}).set_status(core_v1::STAGE_STATUS_SKIPPED);
  assert(DependencyResolver(2).Resolve(done).exhausted);

  // A waiting stage whose dependency never settles.
  RunState stuck;
  AddStage(stuck, "a", {}).set_status(core_v1::STAGE_STATUS_CANCELLED);
  AddStage(stuck, "b", {"a"});
  const auto resolution = DependencyResolver(2).Resolve(stuck);
  assert(resolution.stuck);
  assert(!resolution.exhausted);
  assert(DependencyResolver::BlockedStages(stuck).empty());
}

} // namespace

int main() {
  TestIndependentStagesRespectConcurrencyLimit();
  TestDependentsWaitForCompletion();
  TestPendingRetryCountsAsInFlight();
  TestRequiredFailureBlocksAndOptionalFailureDoesNot();
  TestExplicitSkipSatisfiesDependents();
  TestAwaitingFeedbackHoldsTheRunOpen();
  TestExhaustedAndStuck();

  std::cout << "stageflow_unit_dependency_resolver: pass\n";
  return 0;
}
