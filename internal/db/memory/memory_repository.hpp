#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace stageflow::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord>  GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord>    ListRuns(Transaction&) override;

  Result                            AppendEvent(Transaction&, const model::EventRecord&) override;
  std::vector<model::EventRecord>   ReadEvents(Transaction&, const std::string&, uint64_t, uint64_t) override;
  std::optional<model::EventRecord> LatestSnapshot(Transaction&, const std::string&, uint64_t) override;
  uint64_t                          LastSequence(Transaction&, const std::string&) override;
  Result                            TruncateEvents(Transaction&, const std::string&, uint64_t) override;

  Result                                 PutCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string&) override;
  Result                                 DeleteCacheEntry(Transaction&, const std::string&) override;
  Result                                 DeleteCacheScope(Transaction&, const std::string&) override;
  Result                                 DeleteExpiredCacheEntries(Transaction&, uint64_t, uint64_t&) override;

  Result                               InsertTemplate(Transaction&, const model::TemplateRecord&) override;
  std::optional<model::TemplateRecord> GetTemplate(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::TemplateRecord>   ListTemplates(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RunRecord>                      runs;
    std::unordered_map<std::string, std::map<uint64_t, model::EventRecord>> events;
    std::unordered_map<std::string, model::CacheEntryRecord>               cache;
    std::map<std::pair<std::string, std::string>, model::TemplateRecord>   templates;
  };

  std::mutex mutex_;
  State      state_;
};

} // namespace stageflow::db::memory
