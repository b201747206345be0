#include "internal/generation/mock_generation_client.hpp"

#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace stageflow::generation {

namespace {

constexpr const char* kFallbackModel = "mock-model";

std::vector<std::string> Words(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream       in(text);
  std::string              word;
  while (in >> word) out.push_back(word);
  return out;
}

struct ActiveCall {
  explicit ActiveCall(std::atomic<uint32_t>& counter) : counter_(counter) {
    ++counter_;
  }
  ~ActiveCall() {
    --counter_;
  }

  std::atomic<uint32_t>& counter_;
};

} // namespace

MockGenerationClient::MockGenerationClient(std::chrono::milliseconds chunk_delay, uint32_t chunk_words)
    : chunk_delay_(chunk_delay), chunk_words_(chunk_words ? chunk_words : 1) {
}

std::string MockGenerationClient::DefaultReply(const std::string& model, const std::string& prompt) {
  auto words = Words(prompt);
  if (words.size() > 24) words.resize(24);

  std::string summary;
  for (const auto& word : words) {
    if (!summary.empty()) summary += ' ';
    summary += word;
  }
  return "[" + model + "] " + summary;
}

GenerationResult MockGenerationClient::Invoke(const GenerationRequest& request, const ChunkCallback& on_chunk,
                                              const util::CancellationToken& cancel) {
  ActiveCall active(active_);
  calls_++;

  std::string model;
  std::string text;
  bool        hold = false;
  {
    std::lock_guard lock(mutex_);

    for (auto& [fragment, count] : prompts_) {
      if (request.prompt.find(fragment) != std::string::npos) ++count;
    }

    for (const auto& candidate : request.models) {
      if (!unavailable_.count(candidate)) {
        model = candidate;
        break;
      }
    }
    if (model.empty()) {
      if (!request.models.empty()) throw util::StageExecutionError("no requested model is available");
      model = kFallbackModel;
    }

    for (auto& [fragment, failure] : failures_) {
      if (failure.remaining == 0 || request.prompt.find(fragment) == std::string::npos) continue;
      --failure.remaining;
      throw util::StageExecutionError("generation failed for '" + fragment + "'", failure.retryable);
    }

    for (const auto& fragment : holds_) {
      if (request.prompt.find(fragment) != std::string::npos) hold = true;
    }

    for (const auto& [fragment, reply] : replies_) {
      if (request.prompt.find(fragment) != std::string::npos) text = reply;
    }
  }

  if (hold) {
    while (!cancel.WaitFor(std::chrono::milliseconds(50))) {
    }
    throw util::Cancelled("generation aborted");
  }

  if (text.empty()) text = DefaultReply(model, request.prompt);
  if (request.candidate > 0) text += " (variant " + std::to_string(request.candidate + 1) + ")";

  auto        words = Words(text);
  std::string chunk;
  for (std::size_t i = 0; i < words.size(); ++i) {
    cancel.ThrowIfCancelled("generation aborted");
    if (!chunk.empty()) chunk += ' ';
    chunk += words[i];
    if ((i + 1) % chunk_words_ == 0 || i + 1 == words.size()) {
      if (on_chunk) on_chunk(chunk);
      chunk.clear();
      if (chunk_delay_.count() > 0 && cancel.WaitFor(chunk_delay_)) throw util::Cancelled("generation aborted");
    }
  }

  GenerationResult result;
  result.text  = text;
  result.model = model;
  result.tokens.set_prompt_tokens(Words(request.prompt).size());
  result.tokens.set_completion_tokens(words.size());
  return result;
}

void MockGenerationClient::SetReply(const std::string& prompt_fragment, const std::string& text) {
  std::lock_guard lock(mutex_);
  replies_[prompt_fragment] = text;
  prompts_.emplace(prompt_fragment, 0);
}

void MockGenerationClient::Track(const std::string& prompt_fragment) {
  std::lock_guard lock(mutex_);
  prompts_.emplace(prompt_fragment, 0);
}

void MockGenerationClient::FailTimes(const std::string& prompt_fragment, uint32_t times, bool retryable) {
  std::lock_guard lock(mutex_);
  failures_[prompt_fragment] = Failure{times, retryable};
  prompts_.emplace(prompt_fragment, 0);
}

void MockGenerationClient::HoldUntilCancelled(const std::string& prompt_fragment) {
  std::lock_guard lock(mutex_);
  holds_.insert(prompt_fragment);
  prompts_.emplace(prompt_fragment, 0);
}

void MockGenerationClient::SetModelUnavailable(const std::string& model) {
  std::lock_guard lock(mutex_);
  unavailable_.insert(model);
}

uint64_t MockGenerationClient::CallsFor(const std::string& prompt_fragment) const {
  std::lock_guard lock(mutex_);
  auto            it = prompts_.find(prompt_fragment);
  return it == prompts_.end() ? 0 : it->second;
}

} // namespace stageflow::generation
