#include "internal/db/postgres/pg_repository.hpp"

#include <algorithm>
#include <cstdint>

#include "internal/util/sha256.hpp"

namespace stageflow::db::postgres {

namespace {

// BIGINT is signed
int64_t ToBigint(uint64_t v) {
  return static_cast<int64_t>(std::min<uint64_t>(v, static_cast<uint64_t>(INT64_MAX)));
}

model::RunRecord ReadRun(const pqxx::row& row) {
  model::RunRecord r;
  r.run_id           = row[0].c_str();
  r.template_id      = row[1].c_str();
  r.template_version = row[2].c_str();
  r.isolation_scope  = row[3].c_str();
  r.parent_run_id    = row[4].c_str();
  r.branch_sequence  = row[5].as<uint64_t>();
  r.created_at_ms    = row[6].as<uint64_t>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.run_id         = row[0].c_str();
  r.sequence       = row[1].as<uint64_t>();
  r.event_type     = row[2].c_str();
  r.is_snapshot    = row[3].as<bool>();
  r.payload        = util::HexDecode(row[4].c_str());
  r.recorded_at_ms = row[5].as<uint64_t>();
  return r;
}

model::TemplateRecord ReadTemplate(const pqxx::row& row) {
  model::TemplateRecord r;
  r.template_id    = row[0].c_str();
  r.version        = row[1].c_str();
  r.payload        = util::HexDecode(row[2].c_str());
  r.content_digest = row[3].c_str();
  r.created_at_ms  = row[4].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgRepository::Bootstrap(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, template_id TEXT NOT NULL, template_version TEXT NOT NULL, isolation_scope TEXT NOT NULL, parent_run_id TEXT NOT NULL DEFAULT '', branch_sequence BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS run_events (run_id TEXT NOT NULL, sequence BIGINT NOT NULL, event_type TEXT NOT NULL, is_snapshot BOOLEAN NOT NULL DEFAULT FALSE, payload BYTEA NOT NULL, recorded_at_ms BIGINT NOT NULL, PRIMARY KEY (run_id, sequence));");
  tx.exec("CREATE INDEX IF NOT EXISTS run_events_snapshots ON run_events(run_id, sequence) WHERE is_snapshot;");
  tx.exec("CREATE TABLE IF NOT EXISTS cache_entries (cache_key TEXT PRIMARY KEY, isolation_scope TEXT NOT NULL, payload BYTEA NOT NULL, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS cache_entries_scope ON cache_entries(isolation_scope);");
  tx.exec("CREATE INDEX IF NOT EXISTS cache_entries_expiry ON cache_entries(expires_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS pipeline_templates (template_id TEXT NOT NULL, version TEXT NOT NULL, payload BYTEA NOT NULL, content_digest TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (template_id, version));");
  tx.exec("CREATE TABLE IF NOT EXISTS stageflow_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO stageflow_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;");
  tx.commit();
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result PgRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_run", r.run_id, r.template_id, r.template_version, r.isolation_scope, r.parent_run_id,
                               ToBigint(r.branch_sequence), ToBigint(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RunRecord> PgRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_prepared("get_run", run_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::vector<model::RunRecord> PgRepository::ListRuns(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT run_id,template_id,template_version,isolation_scope,parent_run_id,branch_sequence,created_at_ms FROM runs ORDER BY created_at_ms, "
      "run_id;");

  std::vector<model::RunRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRun(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  try {
    uint64_t last = LastSequence(t, r.run_id);
    if (last == 0) {
      if (auto run = GetRun(t, r.run_id)) last = run->branch_sequence;
    }
    if (r.sequence != last + 1) {
      return Result::Err(ErrorCode::Conflict, "expected sequence " + std::to_string(last + 1) + ", got " + std::to_string(r.sequence));
    }
    TX(t).Work().exec_prepared("append_event", r.run_id, ToBigint(r.sequence), r.event_type, r.is_snapshot, util::HexEncode(r.payload),
                               ToBigint(r.recorded_at_ms));
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::Conflict, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t from_sequence, uint64_t to_sequence) {
  auto res = TX(t).Work().exec_prepared("read_events", run_id, ToBigint(from_sequence), ToBigint(to_sequence));

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEvent(row));
  }
  return out;
}

std::optional<model::EventRecord> PgRepository::LatestSnapshot(Transaction& t, const std::string& run_id, uint64_t max_sequence) {
  auto res = TX(t).Work().exec_prepared("latest_snapshot", run_id, ToBigint(max_sequence));
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

uint64_t PgRepository::LastSequence(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_prepared("last_sequence", run_id);
  if (res.empty()) return 0;
  return res[0][0].as<uint64_t>();
}

Result PgRepository::TruncateEvents(Transaction& t, const std::string& run_id, uint64_t from_sequence) {
  try {
    TX(t).Work().exec_params("DELETE FROM run_events WHERE run_id=$1 AND sequence>=$2;", run_id, ToBigint(from_sequence));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

Result PgRepository::PutCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("put_cache_entry", r.cache_key, r.isolation_scope, util::HexEncode(r.payload), ToBigint(r.created_at_ms),
                               ToBigint(r.expires_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CacheEntryRecord> PgRepository::GetCacheEntry(Transaction& t, const std::string& cache_key) {
  auto res = TX(t).Work().exec_prepared("get_cache_entry", cache_key);
  if (res.empty()) return std::nullopt;

  model::CacheEntryRecord r;
  r.cache_key       = res[0][0].c_str();
  r.isolation_scope = res[0][1].c_str();
  r.payload         = util::HexDecode(res[0][2].c_str());
  r.created_at_ms   = res[0][3].as<uint64_t>();
  r.expires_at_ms   = res[0][4].as<uint64_t>();
  return r;
}

Result PgRepository::DeleteCacheEntry(Transaction& t, const std::string& cache_key) {
  try {
    TX(t).Work().exec_params("DELETE FROM cache_entries WHERE cache_key=$1;", cache_key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteCacheScope(Transaction& t, const std::string& isolation_scope) {
  try {
    TX(t).Work().exec_params("DELETE FROM cache_entries WHERE isolation_scope=$1;", isolation_scope);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms, uint64_t& removed) {
  removed = 0;
  try {
    const auto result = TX(t).Work().exec_params("DELETE FROM cache_entries WHERE expires_at_ms<=$1;", ToBigint(now_ms));
    removed           = static_cast<uint64_t>(result.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Templates
// ------------------------------------------------------------------

Result PgRepository::InsertTemplate(Transaction& t, const model::TemplateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO pipeline_templates(template_id,version,payload,content_digest,created_at_ms) VALUES($1,$2,decode($3,'hex'),$4,$5);",
        r.template_id, r.version, util::HexEncode(r.payload), r.content_digest, ToBigint(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TemplateRecord> PgRepository::GetTemplate(Transaction& t, const std::string& template_id, const std::string& version) {
  auto res = TX(t).Work().exec_params(
      "SELECT template_id,version,encode(payload,'hex'),content_digest,created_at_ms FROM pipeline_templates WHERE template_id=$1 AND version=$2;",
      template_id, version);
  if (res.empty()) return std::nullopt;
  return ReadTemplate(res[0]);
}

std::vector<model::TemplateRecord> PgRepository::ListTemplates(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT template_id,version,encode(payload,'hex'),content_digest,created_at_ms FROM pipeline_templates ORDER BY template_id, created_at_ms;");

  std::vector<model::TemplateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTemplate(row));
  }
  return out;
}

} // namespace stageflow::db::postgres
