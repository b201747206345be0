#pragma once

#include <string>
#include <vector>

#include "internal/generation/generation_client.hpp"
#include "internal/util/cancellation.hpp"
#include "stageflow/core/v1/pipeline.pb.h"
#include "stageflow/core/v1/run.pb.h"

namespace stageflow::stage {

// Everything one attempt may read. The run state is a copy taken when
// the attempt was scheduled.
struct StageContext {
  const stageflow::core::v1::PipelineTemplate* pipeline = nullptr;
  const stageflow::core::v1::StageDefinition*  definition = nullptr;
  stageflow::core::v1::RunState                state;
  uint32_t                                     attempt = 1;
  util::CancellationToken                      cancel;
  generation::ChunkCallback                    on_chunk;
};

struct StageOutcome {
  bool awaiting_feedback = false;

  std::string                       output;
  stageflow::core::v1::CompletionSource source = stageflow::core::v1::COMPLETION_SOURCE_FRESH;
  std::string                       model;
  stageflow::core::v1::TokenUsage   tokens;
  std::string                       cache_key;

  // Usage of generation calls made by this attempt; cache hits add nothing.
  stageflow::core::v1::TokenUsage spent_tokens;

  // Alternatives offered to the user while awaiting feedback.
  std::vector<std::string> candidates;
};

/*
  Behaviour of one stage kind.

  Execute throws util::StageExecutionError when the attempt fails and
  util::Cancelled when it was aborted. ResolveFeedback turns a selection
  supplied by the user into the stage output and throws
  util::ValidationError when the selection is not acceptable.
*/
class StageHandler {
 public:
  virtual ~StageHandler() = default;

  virtual StageOutcome Execute(const StageContext& context) = 0;

  virtual std::string ResolveFeedback(const stageflow::core::v1::StageExecution& execution, const std::string& selection) const = 0;
};

} // namespace stageflow::stage
