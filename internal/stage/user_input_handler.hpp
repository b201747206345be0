#pragma once

#include "internal/stage/stage_handler.hpp"

namespace stageflow::stage {

// USER_INPUT stages ask the rendered prompt and wait for free text.
class UserInputHandler final : public StageHandler {
 public:
  StageOutcome Execute(const StageContext& context) override;

  std::string ResolveFeedback(const stageflow::core::v1::StageExecution& execution, const std::string& selection) const override;
};

} // namespace stageflow::stage
