#pragma once

#include <string>
#include <string_view>

#include "stageflow/core/v1/run.pb.h"

namespace stageflow::state {

using stageflow::core::v1::RunState;
using stageflow::core::v1::RunStatus;
using stageflow::core::v1::StageExecution;
using stageflow::core::v1::StageStatus;
using stageflow::core::v1::StageTopology;

const StageExecution* FindStage(const RunState& state, std::string_view stage_id);
StageExecution*       MutableStage(RunState& state, std::string_view stage_id);
const StageTopology*  FindTopology(const RunState& state, std::string_view stage_id);

bool IsTerminal(RunStatus status);
bool IsTerminal(const StageExecution& stage);

// Running, or failed with a retry scheduled. Awaiting feedback is not in flight.
bool IsInFlight(const StageExecution& stage);

// Sum of tokens_by_model.
stageflow::core::v1::TokenUsage TotalTokens(const RunState& state);

std::string_view RunStatusName(RunStatus status);
std::string_view StageStatusName(StageStatus status);

} // namespace stageflow::state
