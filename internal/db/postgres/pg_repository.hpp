#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_tx.hpp"

namespace stageflow::db::postgres {

/*
  PostgreSQL repository.

  Opaque payloads are BYTEA columns, moved across the wire hex encoded.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord>   ListRuns(Transaction&) override;

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

  // Creates tables and indexes if missing.
  static void Bootstrap(PgPool& pool);

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace stageflow::db::postgres
