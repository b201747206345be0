#pragma once

#include <cstdint>
#include <string>

namespace stageflow::db::model {

struct CacheEntryRecord {
  std::string cache_key;
  std::string isolation_scope;
  std::string payload;
  uint64_t    created_at_ms = 0;
  uint64_t    expires_at_ms = 0;
};

} // namespace stageflow::db::model
