#include "internal/cache/response_cache.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::cache {

using stageflow::observability::StringField;

ResponseCache::ResponseCache(ResponseCacheOptions options, std::shared_ptr<CacheBackend> backend,
                             std::shared_ptr<const util::ClockSource> clock)
    : options_(options), backend_(std::move(backend)), clock_(std::move(clock)), memory_(options.memory_capacity, clock_) {
  if (backend_) {
    writer_ = std::make_unique<CacheWriter>(options_.write_queue_limit, [this](const WriteTask& task) { ApplyWrite(task); });
    writer_->Start();
  }
}

ResponseCache::~ResponseCache() {
  Shutdown();
}

void ResponseCache::Shutdown() {
  if (writer_) writer_->Stop();
}

void ResponseCache::NoteBackendError(const char* op, const std::exception& e) {
  backend_errors_++;
  STAGEFLOW_LOG_WARN("Persistent cache unavailable", {StringField("op", op), StringField("error", e.what())});
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::optional<CacheHit> ResponseCache::Lookup(const std::string& key) {
  auto& metrics = observability::Metrics::Instance();

  std::shared_lock lock(mutex_);

  if (auto entry = memory_.Get(key)) {
    hits_++;
    metrics.RecordCacheLookup("memory", true);
    return CacheHit{std::move(*entry), CacheTier::kMemory};
  }
  metrics.RecordCacheLookup("memory", false);

  if (backend_) {
    try {
      if (auto entry = backend_->Get(key)) {
        entry->set_access_count(entry->access_count() + 1);
        *entry->mutable_last_accessed_at() = util::ToProto(clock_->Now());

        auto evicted = memory_.Put(*entry);
        evictions_ += evicted;
        for (std::size_t i = 0; i < evicted; ++i) metrics.RecordCacheEviction();

        persistent_hits_++;
        metrics.RecordCacheLookup("persistent", true);
        return CacheHit{std::move(*entry), CacheTier::kPersistent};
      }
      metrics.RecordCacheLookup("persistent", false);
    } catch (const util::CacheBackendError& e) {
      NoteBackendError("get", e);
    }
  }

  misses_++;
  return std::nullopt;
}

// ------------------------------------------------------------
// Store
// ------------------------------------------------------------

void ResponseCache::Store(CacheEntry entry) {
  const auto now = clock_->Now();
  *entry.mutable_created_at()       = util::ToProto(now);
  *entry.mutable_last_accessed_at() = util::ToProto(now);
  *entry.mutable_expires_at()       = util::ToProto(now + options_.ttl);

  std::shared_lock lock(mutex_);

  auto evicted = memory_.Put(entry);
  evictions_ += evicted;
  for (std::size_t i = 0; i < evicted; ++i) observability::Metrics::Instance().RecordCacheEviction();
  writes_++;

  if (!writer_) return;

  WriteTask task;
  task.entry = std::move(entry);
  task.ttl   = options_.ttl;
  task.epoch = epoch_;
  {
    std::lock_guard epochs_lock(epochs_mutex_);
    pending_epochs_.insert(task.epoch);
  }
  const auto epoch = task.epoch;
  if (!writer_->Submit(std::move(task))) {
    dropped_writes_++;
    STAGEFLOW_LOG_WARN("Cache write queue full, dropping persistent write");
    std::lock_guard epochs_lock(epochs_mutex_);
    ReleaseEpoch(epoch);
  }
}

void ResponseCache::ReleaseEpoch(uint64_t epoch) {
  // Caller holds epochs_mutex_.
  auto it = pending_epochs_.find(epoch);
  if (it != pending_epochs_.end()) pending_epochs_.erase(it);

  // A tombstone only stops writes queued before it. Once the oldest
  // pending write is at least as new, it can go.
  auto prune = [&](std::unordered_map<std::string, uint64_t>& epochs) {
    for (auto t = epochs.begin(); t != epochs.end();) {
      if (pending_epochs_.empty() || t->second <= *pending_epochs_.begin()) {
        t = epochs.erase(t);
      } else {
        ++t;
      }
    }
  };
  prune(key_epochs_);
  prune(scope_epochs_);
}

void ResponseCache::ApplyWrite(const WriteTask& task) {
  std::shared_lock lock(mutex_);

  bool is_stale = false;
  {
    std::lock_guard epochs_lock(epochs_mutex_);
    auto stale = [&](const std::unordered_map<std::string, uint64_t>& epochs, const std::string& name) {
      auto it = epochs.find(name);
      return it != epochs.end() && task.epoch < it->second;
    };
    is_stale = stale(key_epochs_, task.entry.key()) || stale(scope_epochs_, task.entry.isolation_scope());
    ReleaseEpoch(task.epoch);
  }
  if (is_stale) {
    dropped_writes_++;
    return;
  }

  try {
    backend_->Put(task.entry.key(), task.entry, task.ttl);
  } catch (const util::CacheBackendError& e) {
    NoteBackendError("put", e);
  }
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

void ResponseCache::MarkInvalidated(const std::string* key, const std::string* scope) {
  // Caller holds the exclusive lock. Tombstones only matter while older
  // writes may still be queued.
  std::lock_guard epochs_lock(epochs_mutex_);
  if (pending_epochs_.empty()) return;
  ++epoch_;
  if (key) key_epochs_[*key] = epoch_;
  if (scope) scope_epochs_[*scope] = epoch_;
}

void ResponseCache::Invalidate(const std::string& key) {
  std::unique_lock lock(mutex_);
  MarkInvalidated(&key, nullptr);
  memory_.Erase(key);
  if (backend_) backend_->Invalidate(key);
  STAGEFLOW_LOG_DEBUG("Cache key invalidated", {StringField("key", key)});
}

void ResponseCache::InvalidateScope(const std::string& isolation_scope) {
  std::unique_lock lock(mutex_);
  MarkInvalidated(nullptr, &isolation_scope);
  auto removed = memory_.EraseScope(isolation_scope);
  if (backend_) backend_->InvalidateScope(isolation_scope);
  STAGEFLOW_LOG_INFO("Cache scope invalidated", {StringField("scope", isolation_scope),
                                                 observability::IntField("memory_entries", static_cast<int64_t>(removed))});
}

PurgeCounts ResponseCache::PurgeExpired() {
  std::shared_lock lock(mutex_);
  PurgeCounts      removed;
  removed.memory = memory_.PurgeExpired();
  if (backend_) {
    try {
      removed.persistent = backend_->PurgeExpired();
    } catch (const util::CacheBackendError& e) {
      NoteBackendError("purge", e);
    }
  }
  return removed;
}

std::size_t ResponseCache::TombstoneCount() const {
  std::lock_guard epochs_lock(epochs_mutex_);
  return key_epochs_.size() + scope_epochs_.size();
}

void ResponseCache::Flush() {
  if (writer_) writer_->Flush();
}

CacheStats ResponseCache::Stats() const {
  CacheStats stats;
  stats.hits            = hits_;
  stats.persistent_hits = persistent_hits_;
  stats.misses          = misses_;
  stats.evictions       = evictions_;
  stats.writes          = writes_;
  stats.dropped_writes  = dropped_writes_;
  stats.backend_errors  = backend_errors_;
  return stats;
}

} // namespace stageflow::cache
