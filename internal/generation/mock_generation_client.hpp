#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/generation/generation_client.hpp"

namespace stageflow::generation {

/*
  Deterministic in-process generation provider.

  The reply is derived from the model and the prompt only, so equal
  requests produce equal text. Behaviour can be scripted per prompt
  fragment: canned replies, a number of failures before success, or a
  hold that lasts until the call is cancelled.
*/
class MockGenerationClient final : public GenerationClient {
 public:
  MockGenerationClient(std::chrono::milliseconds chunk_delay = std::chrono::milliseconds(0), uint32_t chunk_words = 4);

  GenerationResult Invoke(const GenerationRequest& request, const ChunkCallback& on_chunk,
                          const util::CancellationToken& cancel) override;

  void SetReply(const std::string& prompt_fragment, const std::string& text);

  void FailTimes(const std::string& prompt_fragment, uint32_t times, bool retryable = true);

  // Calls whose prompt contains the fragment block until cancelled.
  void HoldUntilCancelled(const std::string& prompt_fragment);

  void SetModelUnavailable(const std::string& model);

  uint64_t Calls() const {
    return calls_.load();
  }

  // Counts only fragments that were scripted or tracked beforehand.
  void     Track(const std::string& prompt_fragment);
  uint64_t CallsFor(const std::string& prompt_fragment) const;

  // Calls that are currently inside Invoke.
  uint32_t Active() const {
    return active_.load();
  }

 private:
  struct Failure {
    uint32_t remaining = 0;
    bool     retryable = true;
  };

  static std::string DefaultReply(const std::string& model, const std::string& prompt);

  std::chrono::milliseconds chunk_delay_;
  uint32_t                  chunk_words_;

  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> replies_;
  std::map<std::string, Failure>     failures_;
  std::set<std::string>              holds_;
  std::set<std::string>              unavailable_;
  std::map<std::string, uint64_t>    prompts_;

  std::atomic<uint64_t> calls_{0};
  std::atomic<uint32_t> active_{0};
};

} // namespace stageflow::generation
