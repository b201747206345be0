#pragma once

#include "service_context.hpp"
#include "stageflow/service/v1/control.pb.h"

namespace stageflow::service {

// Response cache administration.
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  // Throws CacheBackendError when the persistent tier could not be cleared.
  void InvalidateCache(const stageflow::service::v1::InvalidateCacheRequest& req);

  stageflow::service::v1::PurgeExpiredCacheResponse
  PurgeExpiredCache(const stageflow::service::v1::PurgeExpiredCacheRequest& req);

  stageflow::service::v1::CacheStatsResponse
  CacheStats(const stageflow::service::v1::CacheStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
