#include "internal/stage/generate_handler.hpp"

#include <algorithm>
#include <cctype>

#include "internal/cache/cache_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stage/render.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::stage {

using stageflow::core::v1::StageExecution;
using stageflow::observability::IntField;
using stageflow::observability::StringField;

namespace {

std::vector<std::string> PreferredModels(const StageContext& context) {
  const auto& own = context.definition->model_preference().models();
  if (!own.empty()) return {own.begin(), own.end()};
  const auto& fallback = context.pipeline->default_models().models();
  return {fallback.begin(), fallback.end()};
}

uint32_t MaxTokens(const StageContext& context) {
  auto tokens = context.definition->model_preference().max_tokens();
  return tokens ? tokens : context.pipeline->default_models().max_tokens();
}

double Temperature(const StageContext& context) {
  auto temperature = context.definition->model_preference().temperature();
  return temperature > 0 ? temperature : context.pipeline->default_models().temperature();
}

bool IsNumber(const std::string& text) {
  return !text.empty() && text.size() < 10 &&
         std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

GenerateHandler::GenerateHandler(std::shared_ptr<generation::GenerationClient> client, std::shared_ptr<cache::ResponseCache> cache)
    : client_(std::move(client)), cache_(std::move(cache)) {
}

StageOutcome GenerateHandler::Execute(const StageContext& context) {
  const auto& definition = *context.definition;
  const auto  prompt     = RenderPrompt(*context.pipeline, definition, context.state);
  const auto  models     = PreferredModels(context);
  const auto  count      = std::max<uint32_t>(1, definition.candidate_count());

  cache::CacheKeyInput key_input;
  key_input.prompt          = prompt;
  key_input.model           = models.empty() ? std::string() : models.front();
  key_input.isolation_scope = context.state.isolation_scope();
  for (const auto& key : definition.context_keys()) {
    auto it = context.state.inputs().find(key);
    key_input.context[key] = it == context.state.inputs().end() ? std::string() : it->second;
  }

  StageOutcome outcome;
  bool         all_cached = true;

  for (uint32_t i = 0; i < count; ++i) {
    context.cancel.ThrowIfCancelled("stage " + definition.id() + " cancelled");

    if (count > 1) key_input.candidate = i;
    const auto key = cache::DeriveCacheKey(key_input);
    if (i == 0) outcome.cache_key = key;

    if (auto hit = cache_->Lookup(key)) {
      STAGEFLOW_LOG_DEBUG("Cache hit", {StringField("stage_id", definition.id()), StringField("key", key.substr(0, 12)),
                                        StringField("tier", hit->tier == cache::CacheTier::kMemory ? "memory" : "persistent")});
      outcome.candidates.push_back(hit->entry.text());
      outcome.model = hit->entry.model();
      outcome.tokens.set_prompt_tokens(outcome.tokens.prompt_tokens() + hit->entry.tokens().prompt_tokens());
      outcome.tokens.set_completion_tokens(outcome.tokens.completion_tokens() + hit->entry.tokens().completion_tokens());
      continue;
    }

    all_cached = false;

    generation::GenerationRequest request;
    request.prompt      = prompt;
    request.models      = models;
    request.max_tokens  = MaxTokens(context);
    request.temperature = Temperature(context);
    request.candidate   = i;

    auto result = client_->Invoke(request, context.on_chunk, context.cancel);

    cache::CacheEntry entry;
    entry.set_key(key);
    entry.set_isolation_scope(key_input.isolation_scope);
    entry.set_prompt(cache::NormalizePrompt(prompt));
    entry.set_model(result.model);
    entry.set_text(result.text);
    *entry.mutable_tokens() = result.tokens;
    cache_->Store(std::move(entry));

    outcome.candidates.push_back(result.text);
    outcome.model = result.model;
    outcome.tokens.set_prompt_tokens(outcome.tokens.prompt_tokens() + result.tokens.prompt_tokens());
    outcome.tokens.set_completion_tokens(outcome.tokens.completion_tokens() + result.tokens.completion_tokens());
    outcome.spent_tokens.set_prompt_tokens(outcome.spent_tokens.prompt_tokens() + result.tokens.prompt_tokens());
    outcome.spent_tokens.set_completion_tokens(outcome.spent_tokens.completion_tokens() + result.tokens.completion_tokens());
  }

  outcome.source = all_cached ? stageflow::core::v1::COMPLETION_SOURCE_CACHE : stageflow::core::v1::COMPLETION_SOURCE_FRESH;

  if (count > 1 || definition.requires_selection()) {
    outcome.awaiting_feedback = true;
    STAGEFLOW_LOG_INFO("Stage awaiting selection",
                       {StringField("stage_id", definition.id()), IntField("candidates", static_cast<int64_t>(count))});
    return outcome;
  }

  outcome.output = outcome.candidates.front();
  outcome.candidates.clear();
  return outcome;
}

std::string GenerateHandler::ResolveFeedback(const StageExecution& execution, const std::string& selection) const {
  if (execution.candidates().empty()) throw util::ValidationError("stage " + execution.stage_id() + " has no candidates");

  if (IsNumber(selection)) {
    const auto index = std::stoul(selection);
    if (index < 1 || index > static_cast<unsigned long>(execution.candidates_size())) {
      throw util::ValidationError("selection " + selection + " is out of range 1.." + std::to_string(execution.candidates_size()));
    }
    return execution.candidates(static_cast<int>(index - 1));
  }

  for (const auto& candidate : execution.candidates()) {
    if (candidate == selection) return candidate;
  }
  throw util::ValidationError("selection does not match any candidate of stage " + execution.stage_id());
}

} // namespace stageflow::stage
