#pragma once

#include "internal/stage/stage_handler.hpp"

namespace stageflow::stage {

// TRANSFORM stages: the rendered template is the output. No model call.
class TransformHandler final : public StageHandler {
 public:
  StageOutcome Execute(const StageContext& context) override;

  std::string ResolveFeedback(const stageflow::core::v1::StageExecution& execution, const std::string& selection) const override;
};

} // namespace stageflow::stage
