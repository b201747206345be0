#include "internal/cache/cache_key.hpp"

#include <cstdint>

#include "internal/util/sha256.hpp"

namespace stageflow::cache {

namespace {

constexpr std::string_view kFormatTag = "stageflow-cache-v2";

void Field(util::Sha256& hash, std::string_view value) {
  uint8_t  length[8];
  uint64_t size = value.size();
  for (int i = 7; i >= 0; --i) {
    length[i] = static_cast<uint8_t>(size & 0xFF);
    size >>= 8;
  }
  hash.Update(length, sizeof(length));
  hash.Update(value);
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string NormalizePrompt(std::string_view prompt) {
  std::string out;
  out.reserve(prompt.size());
  for (std::size_t i = 0; i < prompt.size(); ++i) {
    if (prompt[i] == '\r' && i + 1 < prompt.size() && prompt[i + 1] == '\n') continue;
    out.push_back(prompt[i]);
  }

  std::size_t begin = 0;
  std::size_t end   = out.size();
  while (begin < end && IsSpace(out[begin])) ++begin;
  while (end > begin && IsSpace(out[end - 1])) --end;
  return out.substr(begin, end - begin);
}

std::string DeriveCacheKey(const CacheKeyInput& input) {
  util::Sha256 hash;
  Field(hash, kFormatTag);
  Field(hash, NormalizePrompt(input.prompt));
  Field(hash, input.model);

  Field(hash, std::to_string(input.context.size()));
  for (const auto& [key, value] : input.context) {
    Field(hash, key);
    Field(hash, value);
  }

  Field(hash, input.isolation_scope);
  Field(hash, input.candidate ? std::to_string(*input.candidate) : std::string());

  auto digest = hash.Final();
  return util::HexEncode(digest.data(), digest.size());
}

} // namespace stageflow::cache
