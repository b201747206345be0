#include "internal/stage/transform_handler.hpp"

#include "internal/stage/render.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::stage {

StageOutcome TransformHandler::Execute(const StageContext& context) {
  context.cancel.ThrowIfCancelled("stage " + context.definition->id() + " cancelled");

  StageOutcome outcome;
  outcome.output = RenderPrompt(*context.pipeline, *context.definition, context.state);
  outcome.source = stageflow::core::v1::COMPLETION_SOURCE_TRANSFORM;
  if (context.on_chunk) context.on_chunk(outcome.output);
  return outcome;
}

std::string TransformHandler::ResolveFeedback(const stageflow::core::v1::StageExecution& execution, const std::string&) const {
  throw util::InvalidState("stage " + execution.stage_id() + " does not take feedback");
}

} // namespace stageflow::stage
