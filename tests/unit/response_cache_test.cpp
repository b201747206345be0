#include "internal/cache/response_cache.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/repository_cache_backend.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using stageflow::cache::CacheEntry;
using stageflow::cache::CacheTier;
using stageflow::cache::ResponseCache;
using stageflow::cache::ResponseCacheOptions;
using stageflow::util::ManualClock;

// Scriptable Tier 2: can fail every call or hold writes until released.
class ScriptedBackend final : public stageflow::cache::CacheBackend {
 public:
  std::optional<CacheEntry> Get(const std::string& key) override {
    std::lock_guard lock(mutex_);
    if (failing_) throw stageflow::util::CacheBackendError("backend down");
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
  }

  void Put(const std::string& key, const CacheEntry& entry, std::chrono::milliseconds) override {
    std::unique_lock lock(mutex_);
    if (failing_) throw stageflow::util::CacheBackendError("backend down");
    ++puts_entered_;
    cv_.notify_all();
    cv_.wait(lock, [&] { return !holding_; });
    entries_[key] = entry;
    ops_.push_back("put:" + key);
  }

  void Invalidate(const std::string& key) override {
    std::lock_guard lock(mutex_);
    if (failing_) throw stageflow::util::CacheBackendError("backend down");
    entries_.erase(key);
    ops_.push_back("invalidate:" + key);
  }

  void InvalidateScope(const std::string& scope) override {
    std::lock_guard lock(mutex_);
    if (failing_) throw stageflow::util::CacheBackendError("backend down");
    for (auto it = entries_.begin(); it != entries_.end();) {
      it = it->second.isolation_scope() == scope ? entries_.erase(it) : std::next(it);
    }
    ops_.push_back("invalidate-scope:" + scope);
  }

  std::size_t PurgeExpired() override {
    std::lock_guard lock(mutex_);
    if (failing_) throw stageflow::util::CacheBackendError("backend down");
    return 0;
  }

  void SetFailing(bool failing) {
    std::lock_guard lock(mutex_);
    failing_ = failing;
  }

  void Hold() {
    std::lock_guard lock(mutex_);
    holding_ = true;
  }

  void Release() {
    {
      std::lock_guard lock(mutex_);
      holding_ = false;
    }
    cv_.notify_all();
  }

  void WaitForPuts(std::size_t count) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return puts_entered_ >= count; });
  }

  bool Contains(const std::string& key) {
    std::lock_guard lock(mutex_);
    return entries_.count(key) != 0;
  }

  std::vector<std::string> Ops() {
    std::lock_guard lock(mutex_);
    return ops_;
  }

 private:
  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::map<std::string, CacheEntry> entries_;
  std::vector<std::string>          ops_;
  std::size_t                       puts_entered_ = 0;
  bool                              failing_      = false;
  bool                              holding_      = false;
};

CacheEntry MakeEntry(const std::string& key, const std::string& scope = "scope") {
  CacheEntry entry;
  entry.set_key(key);
  entry.set_isolation_scope(scope);
  entry.set_model("model-a");
  entry.set_text("reply for " + key);
  return entry;
}

ResponseCacheOptions Options(std::size_t capacity = 16, std::chrono::milliseconds ttl = std::chrono::hours(1), std::size_t queue = 64) {
  ResponseCacheOptions options;
  options.memory_capacity   = capacity;
  options.ttl               = ttl;
  options.write_queue_limit = queue;
  return options;
}

void TestMemoryHitAfterStore() {
  auto          clock = std::make_shared<ManualClock>();
  ResponseCache cache(Options(), nullptr, clock);

  assert(!cache.Lookup("k").has_value());
  cache.Store(MakeEntry("k"));

  const auto hit = cache.Lookup("k");
  assert(hit && hit->tier == CacheTier::kMemory);
  assert(hit->entry.text() == "reply for k");
  assert(stageflow::util::FromProto(hit->entry.expires_at()) == clock->Now() + std::chrono::hours(1));

  const auto stats = cache.Stats();
  assert(stats.hits == 1 && stats.misses == 1 && stats.writes == 1);
}

void TestPersistentHitIsPromoted() {
  auto clock      = std::make_shared<ManualClock>();
  auto repository = std::make_shared<stageflow::db::memory::MemoryRepository>();
  auto backend    = std::make_shared<stageflow::cache::RepositoryCacheBackend>(repository, clock);

  {
    ResponseCache writer(Options(), backend, clock);
    writer.Store(MakeEntry("k"));
    writer.Flush();
  }

  // A fresh process: empty memory tier over the same store.
  ResponseCache cache(Options(), backend, clock);
  const auto    first = cache.Lookup("k");
  assert(first && first->tier == CacheTier::kPersistent);
  assert(first->entry.text() == "reply for k");
  assert(cache.MemorySize() == 1);

  const auto second = cache.Lookup("k");
  assert(second && second->tier == CacheTier::kMemory);

  const auto stats = cache.Stats();
  assert(stats.persistent_hits == 1);
  assert(stats.hits == 1);
}

void TestEntriesExpireInBothTiers() {
  auto clock      = std::make_shared<ManualClock>();
  auto repository = std::make_shared<stageflow::db::memory::MemoryRepository>();
  auto backend    = std::make_shared<stageflow::cache::RepositoryCacheBackend>(repository, clock);

  ResponseCache cache(Options(16, std::chrono::seconds(30)), backend, clock);
  cache.Store(MakeEntry("k"));
  cache.Store(MakeEntry("other"));
  cache.Flush();

  clock->Advance(std::chrono::seconds(29));
  assert(cache.Lookup("k").has_value());

  clock->Advance(std::chrono::seconds(1));
  assert(!cache.Lookup("k").has_value());
  assert(!backend->Get("other").has_value());

  // "k" already left memory on lookup; "other" goes now, and Tier 2 drops both rows.
  const auto purged = cache.PurgeExpired();
  assert(purged.memory == 1);
  assert(purged.persistent == 2);
  assert(cache.MemorySize() == 0);

  auto tx = repository->Begin();
  assert(!repository->GetCacheEntry(*tx, "k").has_value());
  assert(!repository->GetCacheEntry(*tx, "other").has_value());
  tx->Commit();
}

void TestPersistentPurgeCountsRemovedRows() {
  auto clock      = std::make_shared<ManualClock>();
  auto repository = std::make_shared<stageflow::db::memory::MemoryRepository>();
  stageflow::cache::RepositoryCacheBackend backend(repository, clock);

  backend.Put("short-1", MakeEntry("short-1"), std::chrono::milliseconds(10));
  backend.Put("short-2", MakeEntry("short-2"), std::chrono::milliseconds(10));
  backend.Put("long", MakeEntry("long"), std::chrono::hours(1));
  assert(backend.PurgeExpired() == 0);

  clock->Advance(std::chrono::milliseconds(20));
  assert(backend.PurgeExpired() == 2);
  assert(backend.PurgeExpired() == 0);
  assert(backend.Get("long").has_value());
}

void TestInvalidationClearsBothTiers() {
  auto clock   = std::make_shared<ManualClock>();
  auto backend = std::make_shared<ScriptedBackend>();

  ResponseCache cache(Options(), backend, clock);
  cache.Store(MakeEntry("a", "one"));
  cache.Store(MakeEntry("b", "one"));
  cache.Store(MakeEntry("c", "two"));
  cache.Flush();

  cache.Invalidate("a");
  assert(!cache.Lookup("a").has_value());
  assert(!backend->Contains("a"));

  cache.InvalidateScope("one");
  assert(!cache.Lookup("b").has_value());
  assert(!backend->Contains("b"));
  assert(cache.Lookup("c").has_value());
  assert(backend->Contains("c"));
}

void TestQueuedWriteDoesNotOutliveInvalidation() {
  auto clock   = std::make_shared<ManualClock>();
  auto backend = std::make_shared<ScriptedBackend>();

  ResponseCache cache(Options(), backend, clock);

  backend->Hold();
  cache.Store(MakeEntry("blocker"));
  backend->WaitForPuts(1);

  // Queued behind the held write.
  cache.Store(MakeEntry("k"));

  std::thread invalidator([&] { cache.Invalidate("k"); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  backend->Release();
  invalidator.join();
  cache.Flush();

  assert(!cache.Lookup("k").has_value());
  assert(!backend->Contains("k"));

  // The backend never saw the stale write land after the invalidation.
  const auto ops         = backend->Ops();
  bool       invalidated = false;
  for (const auto& op : ops) {
    if (op == "invalidate:k") invalidated = true;
    assert(!(invalidated && op == "put:k"));
  }
  assert(invalidated);
  assert(cache.TombstoneCount() == 0);
}

void TestTombstonesPrunedAsOlderWritesLand() {
  auto clock   = std::make_shared<ManualClock>();
  auto backend = std::make_shared<ScriptedBackend>();

  ResponseCache cache(Options(), backend, clock);

  // Nothing queued: no marker is needed.
  cache.Invalidate("idle");
  cache.InvalidateScope("idle-scope");
  assert(cache.TombstoneCount() == 0);

  backend->Hold();
  cache.Store(MakeEntry("blocker"));
  backend->WaitForPuts(1);
  cache.Store(MakeEntry("k", "s1"));
  cache.Store(MakeEntry("j", "s2"));

  std::thread invalidator([&] {
    cache.Invalidate("k");
    cache.InvalidateScope("s2");
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  backend->Release();
  invalidator.join();

  // Writes keep arriving after the invalidations.
  for (int i = 0; i < 50; ++i) cache.Store(MakeEntry("later-" + std::to_string(i)));
  cache.Flush();

  assert(cache.TombstoneCount() == 0);
  assert(!backend->Contains("k"));
  assert(!backend->Contains("j"));
  assert(backend->Contains("later-49"));

  // Markers from earlier rounds do not leak into later ones.
  for (int round = 0; round < 20; ++round) {
    const auto key = "churn-" + std::to_string(round);
    cache.Store(MakeEntry(key));
    cache.Invalidate(key);
  }
  cache.Flush();
  assert(cache.TombstoneCount() == 0);
}

void TestFullWriteQueueDropsWrites() {
  auto clock   = std::make_shared<ManualClock>();
  auto backend = std::make_shared<ScriptedBackend>();

  ResponseCache cache(Options(16, std::chrono::hours(1), 1), backend, clock);

  backend->Hold();
  cache.Store(MakeEntry("first"));
  backend->WaitForPuts(1);

  cache.Store(MakeEntry("queued"));
  cache.Store(MakeEntry("dropped"));
  assert(cache.Stats().dropped_writes == 1);

  backend->Release();
  cache.Flush();

  // Memory still serves every stored entry.
  assert(cache.Lookup("dropped").has_value());
  assert(backend->Contains("queued"));
  assert(!backend->Contains("dropped"));
}

void TestBackendFailureDegradesToMiss() {
  auto clock   = std::make_shared<ManualClock>();
  auto backend = std::make_shared<ScriptedBackend>();
  backend->SetFailing(true);

  ResponseCache cache(Options(), backend, clock);

  assert(!cache.Lookup("k").has_value());
  cache.Store(MakeEntry("k"));
  cache.Flush();
  assert(cache.Lookup("k").has_value());
  const auto purged = cache.PurgeExpired();
  assert(purged.memory == 0);
  assert(purged.persistent == 0);

  const auto stats = cache.Stats();
  assert(stats.backend_errors == 3);
  assert(stats.misses == 1);

  bool threw = false;
  try {
    cache.Invalidate("k");
  } catch (const stageflow::util::CacheBackendError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMemoryHitAfterStore();
  TestPersistentHitIsPromoted();
  TestEntriesExpireInBothTiers();
  TestPersistentPurgeCountsRemovedRows();
  TestInvalidationClearsBothTiers();
  TestQueuedWriteDoesNotOutliveInvalidation();
  TestTombstonesPrunedAsOlderWritesLand();
  TestFullWriteQueueDropsWrites();
  TestBackendFailureDegradesToMiss();

  std::cout << "stageflow_unit_response_cache: pass\n";
  return 0;
}
