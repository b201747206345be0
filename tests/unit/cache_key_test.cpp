#include "internal/cache/cache_key.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/sha256.hpp"

namespace {

using stageflow::cache::CacheKeyInput;
using stageflow::cache::DeriveCacheKey;
using stageflow::cache::NormalizePrompt;

CacheKeyInput BaseInput() {
  CacheKeyInput input;
  input.prompt          = "Write an outline about rust";
  input.model           = "model-a";
  input.context["tone"] = "formal";
  input.isolation_scope = "workspace-1";
  return input;
}

void TestSha256KnownVectors() {
  assert(stageflow::util::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(stageflow::util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  // Streaming across block boundaries.
  const std::string long_text(1000, 'a');
  stageflow::util::Sha256 hash;
  hash.Update(long_text.substr(0, 63));
  hash.Update(long_text.substr(63));
  const auto digest = hash.Final();
  assert(stageflow::util::HexEncode(digest.data(), digest.size()) == stageflow::util::Sha256Hex(long_text));
}

void TestNormalization() {
  assert(NormalizePrompt("  line one\r\nline two \n\t") == "line one\nline two");
  assert(NormalizePrompt("\r\n") == "");

  auto crlf   = BaseInput();
  crlf.prompt = "  Write an outline\r\nabout rust \n";
  auto lf     = BaseInput();
  lf.prompt   = "Write an outline\nabout rust";
  assert(DeriveCacheKey(crlf) == DeriveCacheKey(lf));
}

void TestKeyIsDeterministicAndSensitive() {
  const auto base = DeriveCacheKey(BaseInput());
  assert(base.size() == 64);
  assert(base == DeriveCacheKey(BaseInput()));

  std::set<std::string> keys{base};

  auto model  = BaseInput();
  model.model = "model-b";
  keys.insert(DeriveCacheKey(model));

  auto context            = BaseInput();
  context.context["tone"] = "casual";
  keys.insert(DeriveCacheKey(context));

  auto scope            = BaseInput();
  scope.isolation_scope = "workspace-2";
  keys.insert(DeriveCacheKey(scope));

  auto prompt   = BaseInput();
  prompt.prompt = "Write an outline about go";
  keys.insert(DeriveCacheKey(prompt));

  assert(keys.size() == 5);
}

void TestFieldBoundariesAreUnambiguous() {
  CacheKeyInput left;
  left.prompt = "ab";
  left.model  = "c";

  CacheKeyInput right;
  right.prompt = "a";
  right.model  = "bc";

  assert(DeriveCacheKey(left) != DeriveCacheKey(right));

  CacheKeyInput pair_a;
  pair_a.context["k"] = "v=x";
  CacheKeyInput pair_b;
  pair_b.context["k=v"] = "x";
  assert(DeriveCacheKey(pair_a) != DeriveCacheKey(pair_b));
}

void TestCandidateIndexIsSeparateFromContext() {
  auto indexed      = BaseInput();
  indexed.candidate = 1;

  auto user_key                 = BaseInput();
  user_key.context["candidate"] = "1";

  std::set<std::string> keys{DeriveCacheKey(BaseInput()), DeriveCacheKey(indexed), DeriveCacheKey(user_key)};
  assert(keys.size() == 3);

  // A stage that reads a "candidate" input still gets one key per sibling.
  auto first       = user_key;
  first.candidate  = 0;
  auto second      = user_key;
  second.candidate = 1;
  assert(DeriveCacheKey(first) != DeriveCacheKey(second));
  assert(DeriveCacheKey(first) != DeriveCacheKey(user_key));

  // Index 0 is not the same as no index.
  auto zero      = BaseInput();
  zero.candidate = 0;
  assert(DeriveCacheKey(zero) != DeriveCacheKey(BaseInput()));
}

} // namespace

int main() {
  TestSha256KnownVectors();
  TestNormalization();
  TestKeyIsDeterministicAndSensitive();
  TestFieldBoundariesAreUnambiguous();
  TestCandidateIndexIsSeparateFromContext();

  std::cout << "stageflow_unit_cache_key: pass\n";
  return 0;
}
