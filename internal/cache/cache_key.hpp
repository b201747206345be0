#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace stageflow::cache {

struct CacheKeyInput {
  std::string                        prompt;
  std::string                        model;
  std::map<std::string, std::string> context;
  std::string                        isolation_scope;

  // Set for each sibling of a multi-candidate stage. Kept apart from
  // `context` so no user context key can collide with it.
  std::optional<uint32_t> candidate;
};

// CRLF to LF, then surrounding whitespace trimmed.
std::string NormalizePrompt(std::string_view prompt);

/*
  Hex SHA-256 over a length-prefixed encoding of

    "stageflow-cache-v2", normalized prompt, model,
    context pairs in key order, isolation scope, candidate index
    (empty when unset)

  Equal inputs give equal keys. Length prefixes keep field boundaries
  unambiguous.
*/
std::string DeriveCacheKey(const CacheKeyInput& input);

} // namespace stageflow::cache
