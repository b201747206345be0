#include "internal/stage/user_input_handler.hpp"

#include "internal/stage/render.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::stage {

StageOutcome UserInputHandler::Execute(const StageContext& context) {
  StageOutcome outcome;
  outcome.awaiting_feedback = true;
  outcome.source            = stageflow::core::v1::COMPLETION_SOURCE_USER;

  // The question, when there is one, is offered as the only candidate.
  if (!context.definition->prompt_template().empty()) {
    outcome.candidates.push_back(RenderPrompt(*context.pipeline, *context.definition, context.state));
  }
  return outcome;
}

std::string UserInputHandler::ResolveFeedback(const stageflow::core::v1::StageExecution& execution, const std::string& selection) const {
  if (selection.empty()) throw util::ValidationError("stage " + execution.stage_id() + " needs a non-empty answer");
  return selection;
}

} // namespace stageflow::stage
