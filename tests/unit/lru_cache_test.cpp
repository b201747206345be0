#include "internal/cache/lru_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

namespace {

using stageflow::cache::CacheEntry;
using stageflow::cache::LruCache;
using stageflow::util::ManualClock;

CacheEntry MakeEntry(const std::string& key, const std::string& scope, const ManualClock& clock, std::chrono::milliseconds ttl) {
  CacheEntry entry;
  entry.set_key(key);
  entry.set_isolation_scope(scope);
  entry.set_text("text for " + key);
  *entry.mutable_expires_at() = stageflow::util::ToProto(clock.Now() + ttl);
  return entry;
}

void TestLeastRecentlyUsedIsEvicted() {
  auto     clock = std::make_shared<ManualClock>();
  LruCache cache(2, clock);

  assert(cache.Put(MakeEntry("a", "s", *clock, std::chrono::hours(1))) == 0);
  assert(cache.Put(MakeEntry("b", "s", *clock, std::chrono::hours(1))) == 0);

  // Touch a so b becomes the eviction candidate.
  assert(cache.Get("a").has_value());
  assert(cache.Put(MakeEntry("c", "s", *clock, std::chrono::hours(1))) == 1);

  assert(cache.Get("a").has_value());
  assert(!cache.Get("b").has_value());
  assert(cache.Get("c").has_value());
  assert(cache.Size() == 2);

  // Replacing an existing key never evicts.
  assert(cache.Put(MakeEntry("c", "s", *clock, std::chrono::hours(1))) == 0);
}

void TestGetUpdatesAccessStats() {
  auto     clock = std::make_shared<ManualClock>();
  LruCache cache(4, clock);
  cache.Put(MakeEntry("a", "s", *clock, std::chrono::hours(1)));

  clock->Advance(std::chrono::seconds(3));
  cache.Get("a");
  const auto entry = cache.Get("a");
  assert(entry->access_count() == 2);
  assert(stageflow::util::FromProto(entry->last_accessed_at()) == clock->Now());
}

void TestExpiredEntriesAreNeverReturned() {
  auto     clock = std::make_shared<ManualClock>();
  LruCache cache(4, clock);
  cache.Put(MakeEntry("short", "s", *clock, std::chrono::seconds(10)));
  cache.Put(MakeEntry("long", "s", *clock, std::chrono::hours(1)));

  clock->Advance(std::chrono::seconds(10));
  assert(!cache.Get("short").has_value());
  assert(cache.Size() == 1);

  clock->Advance(std::chrono::hours(2));
  assert(cache.PurgeExpired() == 1);
  assert(cache.Size() == 0);
}

void TestEraseByKeyAndScope() {
  auto     clock = std::make_shared<ManualClock>();
  LruCache cache(8, clock);
  cache.Put(MakeEntry("a", "one", *clock, std::chrono::hours(1)));
  cache.Put(MakeEntry("b", "one", *clock, std::chrono::hours(1)));
  cache.Put(MakeEntry("c", "two", *clock, std::chrono::hours(1)));

  assert(cache.Erase("a"));
  assert(!cache.Erase("a"));
  assert(cache.EraseScope("one") == 1);
  assert(cache.Size() == 1);
  assert(cache.Get("c").has_value());

  // Capacity is still honoured after removals.
  for (const char* key : {"d", "e", "f", "g", "h", "i", "j", "k"}) cache.Put(MakeEntry(key, "two", *clock, std::chrono::hours(1)));
  assert(cache.Size() == cache.capacity());
}

} // namespace

int main() {
  TestLeastRecentlyUsedIsEvicted();
  TestGetUpdatesAccessStats();
  TestExpiredEntriesAreNeverReturned();
  TestEraseByKeyAndScope();

  std::cout << "stageflow_unit_lru_cache: pass\n";
  return 0;
}
