#include "admin_service.hpp"

#include "internal/cache/response_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace stageflow::service {

using namespace stageflow::service::v1;
using stageflow::observability::IntField;
using stageflow::observability::StringField;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AdminService::InvalidateCache(const InvalidateCacheRequest& req) {
  ObserveRpc("AdminService.InvalidateCache", "", [&] {
    switch (req.target_case()) {
      case InvalidateCacheRequest::kKey:
        ctx_.cache->Invalidate(req.key());
        STAGEFLOW_LOG_INFO("Cache entry invalidated", {StringField("key", req.key())});
        return;
      case InvalidateCacheRequest::kIsolationScope:
        ctx_.cache->InvalidateScope(req.isolation_scope());
        STAGEFLOW_LOG_INFO("Cache scope invalidated", {StringField("isolation_scope", req.isolation_scope())});
        return;
      default:
        throw util::ValidationError("invalidate cache: a key or an isolation scope is required");
    }
  });
}

PurgeExpiredCacheResponse AdminService::PurgeExpiredCache(const PurgeExpiredCacheRequest&) {
  return ObserveRpc("AdminService.PurgeExpiredCache", "", [&] {
    PurgeExpiredCacheResponse resp;
    const auto removed = ctx_.cache->PurgeExpired();
    resp.set_memory_removed(removed.memory);
    resp.set_persistent_removed(removed.persistent);
    STAGEFLOW_LOG_INFO("Expired cache entries purged", {IntField("memory_removed", static_cast<int64_t>(removed.memory)),
                                                        IntField("persistent_removed", static_cast<int64_t>(removed.persistent))});
    return resp;
  });
}

CacheStatsResponse AdminService::CacheStats(const CacheStatsRequest&) {
  return ObserveRpc("AdminService.CacheStats", "", [&] {
    const auto stats = ctx_.cache->Stats();

    CacheStatsResponse resp;
    resp.set_hits(stats.hits);
    resp.set_persistent_hits(stats.persistent_hits);
    resp.set_misses(stats.misses);
    resp.set_evictions(stats.evictions);
    resp.set_writes(stats.writes);
    resp.set_dropped_writes(stats.dropped_writes);
    resp.set_backend_errors(stats.backend_errors);
    resp.set_memory_entries(ctx_.cache->MemorySize());
    return resp;
  });
}

} // namespace stageflow::service
