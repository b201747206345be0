#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/template_record.hpp"

namespace stageflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Event sequences per run are contiguous: AppendEvent refuses any
    sequence other than last + 1 with ErrorCode::Conflict. A branch's
    own log starts right after its branch_sequence
  - Events are never updated; TruncateEvents only removes a torn tail

  The DB is the source of truth for:
    run catalog
    run event logs
    persistent cache tier
    registered templates
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result InsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& run_id) = 0;

  virtual std::vector<model::RunRecord> ListRuns(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  virtual Result AppendEvent(Transaction&, const model::EventRecord&) = 0;

  // Events with from_sequence <= sequence <= to_sequence, ordered.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& run_id, uint64_t from_sequence,
                                                     uint64_t to_sequence) = 0;

  virtual std::optional<model::EventRecord> LatestSnapshot(Transaction&, const std::string& run_id, uint64_t max_sequence) = 0;

  // 0 when the run has no events.
  virtual uint64_t LastSequence(Transaction&, const std::string& run_id) = 0;

  // Removes every event with sequence >= from_sequence.
  virtual Result TruncateEvents(Transaction&, const std::string& run_id, uint64_t from_sequence) = 0;

  // ---------------------------------------------------------------------
  // Persistent cache tier
  // ---------------------------------------------------------------------

  virtual Result PutCacheEntry(Transaction&, const model::CacheEntryRecord&) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& cache_key) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& cache_key) = 0;

  virtual Result DeleteCacheScope(Transaction&, const std::string& isolation_scope) = 0;

  // Sets `removed` to the number of entries deleted.
  virtual Result DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms, uint64_t& removed) = 0;

  // ---------------------------------------------------------------------
  // Templates
  // ---------------------------------------------------------------------

  virtual Result InsertTemplate(Transaction&, const model::TemplateRecord&) = 0;

  virtual std::optional<model::TemplateRecord> GetTemplate(Transaction&, const std::string& template_id, const std::string& version) = 0;

  virtual std::vector<model::TemplateRecord> ListTemplates(Transaction&) = 0;
};

// Translates a non-OK result into the matching util exception.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace stageflow::db
