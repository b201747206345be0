#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "stageflow/cache/v1/cache_entry.pb.h"

namespace stageflow::cache {

/*
  Tier 2: persistent key-value store for cache entries.

  Entries carry their own expiry; Get never returns an expired entry.
  Implementations report failures as util::CacheBackendError.
*/
class CacheBackend {
 public:
  virtual ~CacheBackend() = default;

  virtual std::optional<stageflow::cache::v1::CacheEntry> Get(const std::string& key) = 0;

  // Last writer wins.
  virtual void Put(const std::string& key, const stageflow::cache::v1::CacheEntry& entry, std::chrono::milliseconds ttl) = 0;

  virtual void Invalidate(const std::string& key) = 0;

  virtual void InvalidateScope(const std::string& isolation_scope) = 0;

  // Returns the number of entries removed, when known.
  virtual std::size_t PurgeExpired() = 0;
};

} // namespace stageflow::cache
