#include "internal/resolver/dependency_resolver.hpp"

#include "internal/state/run_state_util.hpp"

namespace stageflow::resolver {

using stageflow::core::v1::RunState;
using stageflow::core::v1::StageExecution;

bool DependencySatisfied(const StageExecution& dep, bool optional) {
  if (dep.status() == stageflow::core::v1::STAGE_STATUS_COMPLETED) return true;
  if (dep.status() == stageflow::core::v1::STAGE_STATUS_SKIPPED &&
      dep.skip_reason() == stageflow::core::v1::SKIP_REASON_EXPLICIT) {
    return true;
  }
  return optional && state::IsTerminal(dep);
}

bool DependencyBlocks(const StageExecution& dep, bool optional) {
  return state::IsTerminal(dep) && !DependencySatisfied(dep, optional);
}

namespace {

template <typename Pred>
bool AllDeps(const RunState& state, const std::string& stage_id, Pred pred) {
  const auto* topology = state::FindTopology(state, stage_id);
  if (!topology) return true;
  for (const auto& dep_id : topology->depends_on()) {
    const auto* dep      = state::FindStage(state, dep_id);
    const auto* dep_topo = state::FindTopology(state, dep_id);
    if (!dep || !pred(*dep, dep_topo && dep_topo->optional())) return false;
  }
  return true;
}

} // namespace

DependencyResolver::DependencyResolver(std::size_t concurrency_limit) : limit_(concurrency_limit ? concurrency_limit : 1) {
}

Resolution DependencyResolver::Resolve(const RunState& state) const {
  Resolution               out;
  std::vector<std::string> eligible;
  bool                     waiting = false;

  for (const auto& stage : state.stages()) {
    if (stage.status() == stageflow::core::v1::STAGE_STATUS_WAITING) {
      waiting = true;
      if (AllDeps(state, stage.stage_id(), DependencySatisfied)) eligible.push_back(stage.stage_id());
    } else if (stage.awaiting_feedback() && stage.status() == stageflow::core::v1::STAGE_STATUS_RUNNING) {
      ++out.awaiting;
    } else if (state::IsInFlight(stage)) {
      ++out.in_flight;
    }
  }

  const std::size_t slots = limit_ > out.in_flight ? limit_ - out.in_flight : 0;
  for (std::size_t i = 0; i < eligible.size() && i < slots; ++i) out.runnable.push_back(eligible[i]);

  const bool active = out.in_flight > 0 || out.awaiting > 0;
  out.exhausted     = !waiting && !active;
  out.stuck         = waiting && eligible.empty() && !active;
  return out;
}

std::vector<std::string> DependencyResolver::BlockedStages(const RunState& state) {
  std::vector<std::string> out;
  for (const auto& stage : state.stages()) {
    if (stage.status() != stageflow::core::v1::STAGE_STATUS_WAITING) continue;
    // Cancellation leaves dependents waiting rather than failed.
    const bool clear = AllDeps(state, stage.stage_id(), [](const StageExecution& dep, bool optional) {
      return dep.status() == stageflow::core::v1::STAGE_STATUS_CANCELLED || !DependencyBlocks(dep, optional);
    });
    if (!clear) out.push_back(stage.stage_id());
  }
  return out;
}

} // namespace stageflow::resolver
