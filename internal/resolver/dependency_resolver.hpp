#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "stageflow/core/v1/run.pb.h"

namespace stageflow::resolver {

struct Resolution {
  // Waiting stages whose dependencies are satisfied, declaration order,
  // capped by the free concurrency slots.
  std::vector<std::string> runnable;

  std::size_t in_flight = 0;
  std::size_t awaiting  = 0;

  // Nothing waiting, running or awaiting feedback.
  bool exhausted = false;

  // Stages are waiting but none can ever start.
  bool stuck = false;
};

// A dependency lets its dependents proceed.
bool DependencySatisfied(const stageflow::core::v1::StageExecution& dep, bool optional);

// A dependency will never let its dependents proceed.
bool DependencyBlocks(const stageflow::core::v1::StageExecution& dep, bool optional);

/*
  Computes which stages of a run may start now. Works on the topology
  recorded in the run state, so it needs no template at runtime.
*/
class DependencyResolver {
 public:
  explicit DependencyResolver(std::size_t concurrency_limit);

  Resolution Resolve(const stageflow::core::v1::RunState& state) const;

  // Waiting stages with at least one failed or failure-skipped
  // required dependency. Cancelled dependencies do not count.
  static std::vector<std::string> BlockedStages(const stageflow::core::v1::RunState& state);

  std::size_t concurrency_limit() const {
    return limit_;
  }

 private:
  std::size_t limit_;
};

} // namespace stageflow::resolver
