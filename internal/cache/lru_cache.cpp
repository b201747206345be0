#include "internal/cache/lru_cache.hpp"

namespace stageflow::cache {

LruCache::LruCache(std::size_t capacity, std::shared_ptr<const util::ClockSource> clock)
    : capacity_(capacity ? capacity : 1), clock_(std::move(clock)) {
}

bool LruCache::Expired(const CacheEntry& entry, util::TimePoint now) const {
  return entry.has_expires_at() && util::FromProto(entry.expires_at()) <= now;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<CacheEntry> LruCache::Get(const std::string& key) {
  const auto now = clock_->Now();

  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return std::nullopt;

  if (Expired(it->second.entry, now)) {
    order_.erase(it->second.position);
    slots_.erase(it);
    return std::nullopt;
  }

  order_.splice(order_.begin(), order_, it->second.position);

  auto& entry = it->second.entry;
  entry.set_access_count(entry.access_count() + 1);
  *entry.mutable_last_accessed_at() = util::ToProto(now);
  return entry;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

std::size_t LruCache::Put(const CacheEntry& entry) {
  std::lock_guard lock(mutex_);

  auto it = slots_.find(entry.key());
  if (it != slots_.end()) {
    it->second.entry = entry;
    order_.splice(order_.begin(), order_, it->second.position);
    return 0;
  }

  std::size_t evicted = 0;
  while (slots_.size() >= capacity_ && !order_.empty()) {
    slots_.erase(order_.back());
    order_.pop_back();
    ++evicted;
  }

  order_.push_front(entry.key());
  slots_.emplace(entry.key(), Slot{entry, order_.begin()});
  return evicted;
}

// ------------------------------------------------------------
// Removal
// ------------------------------------------------------------

bool LruCache::Erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return false;
  order_.erase(it->second.position);
  slots_.erase(it);
  return true;
}

std::size_t LruCache::EraseScope(const std::string& isolation_scope) {
  std::lock_guard lock(mutex_);
  std::size_t     removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (it->second.entry.isolation_scope() != isolation_scope) {
      ++it;
      continue;
    }
    order_.erase(it->second.position);
    it = slots_.erase(it);
    ++removed;
  }
  return removed;
}

std::size_t LruCache::PurgeExpired() {
  const auto now = clock_->Now();

  std::lock_guard lock(mutex_);
  std::size_t     removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (!Expired(it->second.entry, now)) {
      ++it;
      continue;
    }
    order_.erase(it->second.position);
    it = slots_.erase(it);
    ++removed;
  }
  return removed;
}

std::size_t LruCache::Size() const {
  std::lock_guard lock(mutex_);
  return slots_.size();
}

} // namespace stageflow::cache
