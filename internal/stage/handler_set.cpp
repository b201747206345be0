#include "internal/stage/handler_set.hpp"

#include "internal/stage/generate_handler.hpp"
#include "internal/stage/transform_handler.hpp"
#include "internal/stage/user_input_handler.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::stage {

HandlerSet::HandlerSet(std::shared_ptr<generation::GenerationClient> client, std::shared_ptr<cache::ResponseCache> cache)
    : generate_(std::make_unique<GenerateHandler>(std::move(client), std::move(cache))),
      user_input_(std::make_unique<UserInputHandler>()),
      transform_(std::make_unique<TransformHandler>()) {
}

StageHandler& HandlerSet::For(stageflow::core::v1::StageKind kind) const {
  switch (kind) {
    case stageflow::core::v1::STAGE_KIND_GENERATE:
      return *generate_;
    case stageflow::core::v1::STAGE_KIND_USER_INPUT:
      return *user_input_;
    case stageflow::core::v1::STAGE_KIND_TRANSFORM:
      return *transform_;
    default:
      throw util::InvalidState("no handler for stage kind " + std::to_string(static_cast<int>(kind)));
  }
}

} // namespace stageflow::stage
