#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/cache/cache_backend.hpp"
#include "internal/cache/cache_writer.hpp"
#include "internal/cache/lru_cache.hpp"
#include "internal/util/time.hpp"

namespace stageflow::cache {

enum class CacheTier { kMemory, kPersistent };

struct CacheHit {
  CacheEntry entry;
  CacheTier  tier = CacheTier::kMemory;
};

struct CacheStats {
  uint64_t hits            = 0;
  uint64_t persistent_hits = 0;
  uint64_t misses          = 0;
  uint64_t evictions       = 0;
  uint64_t writes          = 0;
  uint64_t dropped_writes  = 0;
  uint64_t backend_errors  = 0;
};

// Entries removed by a purge, per tier. One key may count in both.
struct PurgeCounts {
  std::size_t memory     = 0;
  std::size_t persistent = 0;
};

struct ResponseCacheOptions {
  std::size_t               memory_capacity   = 1000;
  std::chrono::milliseconds ttl               = std::chrono::hours(24);
  std::size_t               write_queue_limit = 4096;
};

/*
  Two-tier response cache.

  Lookup checks memory, then the persistent tier, promoting persistent
  hits into memory. Store writes memory synchronously and queues the
  persistent write. A backend failure is logged and counted, never
  thrown to the stage: lookups degrade to a miss and writes are lost.

  Invalidation holds the exclusive lock while it clears both tiers, so
  no lookup can observe a half-invalidated key. Queued writes that were
  made before an invalidation of their key or scope are discarded.
*/
class ResponseCache {
 public:
  // `backend` may be null for a memory-only cache.
  ResponseCache(ResponseCacheOptions options, std::shared_ptr<CacheBackend> backend, std::shared_ptr<const util::ClockSource> clock);
  ~ResponseCache();

  ResponseCache(const ResponseCache&)            = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  std::optional<CacheHit> Lookup(const std::string& key);

  // Stamps created/expiry times onto the entry.
  void Store(CacheEntry entry);

  // Throws CacheBackendError when the persistent tier cannot be cleared.
  void Invalidate(const std::string& key);
  void InvalidateScope(const std::string& isolation_scope);

  PurgeCounts PurgeExpired();

  // Blocks until queued persistent writes have been applied.
  void Flush();

  void Shutdown();

  CacheStats Stats() const;

  std::size_t MemorySize() const {
    return memory_.Size();
  }

  // Invalidation markers still waiting on older queued writes.
  std::size_t TombstoneCount() const;

 private:
  void ApplyWrite(const WriteTask& task);
  void MarkInvalidated(const std::string* key, const std::string* scope);
  void ReleaseEpoch(uint64_t epoch);
  void NoteBackendError(const char* op, const std::exception& e);

  ResponseCacheOptions                     options_;
  std::shared_ptr<CacheBackend>            backend_;
  std::shared_ptr<const util::ClockSource> clock_;

  LruCache                   memory_;
  std::unique_ptr<CacheWriter> writer_;

  // Reads and writes share; invalidation is exclusive.
  mutable std::shared_mutex mutex_;
  uint64_t                  epoch_ = 0;

  // Guards the tombstones and the epochs of queued writes.
  mutable std::mutex                        epochs_mutex_;
  std::multiset<uint64_t>                   pending_epochs_;
  std::unordered_map<std::string, uint64_t> key_epochs_;
  std::unordered_map<std::string, uint64_t> scope_epochs_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> persistent_hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> evictions_{0};
  std::atomic<uint64_t> writes_{0};
  std::atomic<uint64_t> dropped_writes_{0};
  std::atomic<uint64_t> backend_errors_{0};
};

} // namespace stageflow::cache
