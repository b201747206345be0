#pragma once

#include <memory>

#include "internal/cache/response_cache.hpp"
#include "internal/generation/generation_client.hpp"
#include "internal/stage/stage_handler.hpp"

namespace stageflow::stage {

// One handler per stage kind, dispatched by kind.
class HandlerSet {
 public:
  HandlerSet(std::shared_ptr<generation::GenerationClient> client, std::shared_ptr<cache::ResponseCache> cache);

  // Throws InvalidState for an unspecified kind.
  StageHandler& For(stageflow::core::v1::StageKind kind) const;

 private:
  std::unique_ptr<StageHandler> generate_;
  std::unique_ptr<StageHandler> user_input_;
  std::unique_ptr<StageHandler> transform_;
};

} // namespace stageflow::stage
