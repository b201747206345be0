#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/cancellation.hpp"
#include "stageflow/core/v1/run.pb.h"

namespace stageflow::generation {

struct GenerationRequest {
  std::string              prompt;
  std::vector<std::string> models; // preference order
  uint32_t                 max_tokens  = 0;
  double                   temperature = 0.0;

  // Which of several alternatives requested for one stage, from 0.
  uint32_t candidate = 0;
};

struct GenerationResult {
  std::string                    text;
  std::string                    model;
  stageflow::core::v1::TokenUsage tokens;
};

using ChunkCallback = std::function<void(std::string_view chunk)>;

/*
  External text generation capability.

  Invoke streams zero or more chunks through `on_chunk` before returning
  the full result. It throws util::StageExecutionError on failure and
  util::Cancelled once the token is cancelled.
*/
class GenerationClient {
 public:
  virtual ~GenerationClient() = default;

  virtual GenerationResult Invoke(const GenerationRequest& request, const ChunkCallback& on_chunk,
                                  const util::CancellationToken& cancel) = 0;
};

} // namespace stageflow::generation
