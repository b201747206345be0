#include "internal/stage/render.hpp"

#include "internal/state/run_state_util.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::stage {

pipeline::RenderContext BuildRenderContext(const stageflow::core::v1::PipelineTemplate& pipeline,
                                           const stageflow::core::v1::RunState&         state) {
  pipeline::RenderContext context;
  for (const auto& input : pipeline.inputs()) {
    if (!input.default_value().empty()) context.inputs[input.key()] = input.default_value();
  }
  for (const auto& [key, value] : state.inputs()) context.inputs[key] = value;

  for (const auto& stage : state.stages()) {
    if (stage.status() == stageflow::core::v1::STAGE_STATUS_COMPLETED) {
      context.stage_outputs[stage.stage_id()] = stage.output();
    } else if (state::IsTerminal(stage)) {
      context.stage_outputs[stage.stage_id()] = "";
    }
    if (!stage.feedback().empty() || state::IsTerminal(stage)) context.stage_feedback[stage.stage_id()] = stage.feedback();
  }
  return context;
}

std::string RenderPrompt(const stageflow::core::v1::PipelineTemplate& pipeline, const stageflow::core::v1::StageDefinition& stage,
                         const stageflow::core::v1::RunState& state) {
  try {
    return pipeline::PromptTemplate::Render(stage.prompt_template(), BuildRenderContext(pipeline, state));
  } catch (const util::ValidationError& e) {
    throw util::StageExecutionError(std::string("prompt rendering failed: ") + e.what(), false);
  }
}

} // namespace stageflow::stage
