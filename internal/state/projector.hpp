#pragma once

#include <vector>

#include "stageflow/core/v1/run.pb.h"
#include "stageflow/events/v1/event.pb.h"

namespace stageflow::state {

/*
  Pure fold of events into RunState.

  Fold functions read nothing but the state and the event: timestamps
  come from recorded_at, never from a clock. Replaying the same events
  always yields the same state.

  Once the run is terminal, stage events are ignored (late completions of
  aborted calls are recorded but change nothing). A required dependency
  that ends without success skips its waiting dependents, transitively.
*/
class Projector {
 public:
  static void Apply(stageflow::core::v1::RunState& state, const stageflow::events::v1::Event& event);

  static stageflow::core::v1::RunState Replay(const std::vector<stageflow::events::v1::Event>& events);

  static void Replay(stageflow::core::v1::RunState& state, const std::vector<stageflow::events::v1::Event>& events);
};

} // namespace stageflow::state
