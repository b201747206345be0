#pragma once

#include <memory>

#include "internal/cache/response_cache.hpp"
#include "internal/generation/generation_client.hpp"
#include "internal/stage/stage_handler.hpp"

namespace stageflow::stage {

/*
  GENERATE stages.

  Each requested candidate is looked up in the response cache by its own
  key and generated only on a miss. A single candidate completes the
  stage; several candidates, or requires_selection, suspend the stage
  until the user picks one.
*/
class GenerateHandler final : public StageHandler {
 public:
  GenerateHandler(std::shared_ptr<generation::GenerationClient> client, std::shared_ptr<cache::ResponseCache> cache);

  StageOutcome Execute(const StageContext& context) override;

  // Accepts a 1-based candidate number or the exact candidate text.
  std::string ResolveFeedback(const stageflow::core::v1::StageExecution& execution, const std::string& selection) const override;

 private:
  std::shared_ptr<generation::GenerationClient> client_;
  std::shared_ptr<cache::ResponseCache>         cache_;
};

} // namespace stageflow::stage
