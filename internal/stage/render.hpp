#pragma once

#include <string>

#include "internal/pipeline/prompt_template.hpp"
#include "stageflow/core/v1/pipeline.pb.h"
#include "stageflow/core/v1/run.pb.h"

namespace stageflow::stage {

// Inputs with declared defaults applied, completed outputs, and "" for
// stages that ended without output.
pipeline::RenderContext BuildRenderContext(const stageflow::core::v1::PipelineTemplate& pipeline,
                                           const stageflow::core::v1::RunState&         state);

// Throws StageExecutionError (not retryable) when rendering fails.
std::string RenderPrompt(const stageflow::core::v1::PipelineTemplate& pipeline, const stageflow::core::v1::StageDefinition& stage,
                         const stageflow::core::v1::RunState& state);

} // namespace stageflow::stage
