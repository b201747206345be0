#pragma once

#include <memory>

#include "internal/cache/cache_backend.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace stageflow::cache {

class RepositoryCacheBackend final : public CacheBackend {
 public:
  RepositoryCacheBackend(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::ClockSource> clock);

  std::optional<stageflow::cache::v1::CacheEntry> Get(const std::string& key) override;

  void Put(const std::string& key, const stageflow::cache::v1::CacheEntry& entry, std::chrono::milliseconds ttl) override;

  void Invalidate(const std::string& key) override;

  void InvalidateScope(const std::string& isolation_scope) override;

  std::size_t PurgeExpired() override;

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<const util::ClockSource> clock_;
};

} // namespace stageflow::cache
