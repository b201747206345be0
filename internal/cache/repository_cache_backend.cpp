#include "internal/cache/repository_cache_backend.hpp"

#include "internal/util/errors.hpp"

namespace stageflow::cache {

using stageflow::cache::v1::CacheEntry;

namespace {

void Check(const db::Result& result, const std::string& what) {
  if (!result) throw util::CacheBackendError(what + ": " + result.Describe());
}

template <typename Fn>
auto Guard(const std::string& what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::CacheBackendError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::CacheBackendError(what + ": " + e.what());
  }
}

} // namespace

RepositoryCacheBackend::RepositoryCacheBackend(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::ClockSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

std::optional<CacheEntry> RepositoryCacheBackend::Get(const std::string& key) {
  return Guard("cache get", [&]() -> std::optional<CacheEntry> {
    auto tx     = repository_->Begin();
    auto record = repository_->GetCacheEntry(*tx, key);
    tx->Commit();
    if (!record) return std::nullopt;
    if (record->expires_at_ms && record->expires_at_ms <= util::ToUnixMillis(clock_->Now())) return std::nullopt;

    CacheEntry entry;
    if (!entry.ParseFromString(record->payload)) {
      throw util::CacheBackendError("cache entry " + key + " is corrupt");
    }
    return entry;
  });
}

void RepositoryCacheBackend::Put(const std::string& key, const CacheEntry& entry, std::chrono::milliseconds ttl) {
  Guard("cache put", [&] {
    const auto now = clock_->Now();

    CacheEntry stored = entry;
    stored.set_key(key);
    *stored.mutable_expires_at() = util::ToProto(now + ttl);

    db::model::CacheEntryRecord record;
    record.cache_key       = key;
    record.isolation_scope = stored.isolation_scope();
    record.created_at_ms   = util::ToUnixMillis(now);
    record.expires_at_ms   = util::ToUnixMillis(now + ttl);
    if (!stored.SerializeToString(&record.payload)) throw util::CacheBackendError("failed to serialize cache entry " + key);

    auto tx = repository_->Begin();
    Check(repository_->PutCacheEntry(*tx, record), "cache put " + key);
    tx->Commit();
  });
}

void RepositoryCacheBackend::Invalidate(const std::string& key) {
  Guard("cache invalidate", [&] {
    auto tx     = repository_->Begin();
    auto result = repository_->DeleteCacheEntry(*tx, key);
    if (!result && result.code != db::ErrorCode::NotFound) Check(result, "cache invalidate " + key);
    tx->Commit();
  });
}

void RepositoryCacheBackend::InvalidateScope(const std::string& isolation_scope) {
  Guard("cache invalidate scope", [&] {
    auto tx = repository_->Begin();
    Check(repository_->DeleteCacheScope(*tx, isolation_scope), "cache invalidate scope " + isolation_scope);
    tx->Commit();
  });
}

std::size_t RepositoryCacheBackend::PurgeExpired() {
  return Guard("cache purge", [&] {
    uint64_t removed = 0;
    auto     tx      = repository_->Begin();
    Check(repository_->DeleteExpiredCacheEntries(*tx, util::ToUnixMillis(clock_->Now()), removed), "cache purge");
    tx->Commit();
    return static_cast<std::size_t>(removed);
  });
}

} // namespace stageflow::cache
