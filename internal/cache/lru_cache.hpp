#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"
#include "stageflow/cache/v1/cache_entry.pb.h"

namespace stageflow::cache {

using stageflow::cache::v1::CacheEntry;

/*
  Tier 1: fixed-capacity LRU of cache entries.

  Get refreshes recency and access stats. Entries past expires_at are
  dropped on access and never returned.
*/
class LruCache {
 public:
  LruCache(std::size_t capacity, std::shared_ptr<const util::ClockSource> clock);

  std::optional<CacheEntry> Get(const std::string& key);

  // Inserts or replaces. Returns the number of entries evicted.
  std::size_t Put(const CacheEntry& entry);

  bool        Erase(const std::string& key);
  std::size_t EraseScope(const std::string& isolation_scope);
  std::size_t PurgeExpired();

  std::size_t Size() const;

  std::size_t capacity() const {
    return capacity_;
  }

 private:
  using Order = std::list<std::string>;

  struct Slot {
    CacheEntry      entry;
    Order::iterator position;
  };

  bool Expired(const CacheEntry& entry, util::TimePoint now) const;

  std::size_t                              capacity_;
  std::shared_ptr<const util::ClockSource> clock_;

  mutable std::mutex                    mutex_;
  Order                                 order_; // front = most recent
  std::unordered_map<std::string, Slot> slots_;
};

} // namespace stageflow::cache
