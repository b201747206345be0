#include "internal/db/sqlite/sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stageflow::db::sqlite {

using stageflow::db::ErrorCode;
using stageflow::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

// Open-ended bounds are clamped into the signed range.
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::min<uint64_t>(v, static_cast<uint64_t>(INT64_MAX))));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.run_id           = ColText(st, 0);
  r.template_id      = ColText(st, 1);
  r.template_version = ColText(st, 2);
  r.isolation_scope  = ColText(st, 3);
  r.parent_run_id    = ColText(st, 4);
  r.branch_sequence  = ColU64(st, 5);
  r.created_at_ms    = ColU64(st, 6);
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.run_id         = ColText(st, 0);
  r.sequence       = ColU64(st, 1);
  r.event_type     = ColText(st, 2);
  r.is_snapshot    = sqlite3_column_int(st, 3) != 0;
  r.payload        = ColBlob(st, 4);
  r.recorded_at_ms = ColU64(st, 5);
  return r;
}

model::TemplateRecord ReadTemplate(sqlite3_stmt* st) {
  model::TemplateRecord r;
  r.template_id    = ColText(st, 0);
  r.version        = ColText(st, 1);
  r.payload        = ColBlob(st, 2);
  r.content_digest = ColText(st, 3);
  r.created_at_ms  = ColU64(st, 4);
  return r;
}

constexpr const char* kEventColumns = "run_id,sequence,event_type,is_snapshot,payload,recorded_at_ms";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteRepository::Bootstrap(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, template_id TEXT NOT NULL, template_version TEXT NOT NULL, isolation_scope TEXT NOT NULL, parent_run_id TEXT NOT NULL DEFAULT '', branch_sequence INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS run_events (run_id TEXT NOT NULL, sequence INTEGER NOT NULL, event_type TEXT NOT NULL, is_snapshot INTEGER NOT NULL DEFAULT 0, payload BLOB NOT NULL, recorded_at_ms INTEGER NOT NULL, PRIMARY KEY (run_id, sequence));",
      "CREATE INDEX IF NOT EXISTS run_events_snapshots ON run_events(run_id, is_snapshot, sequence);",
      "CREATE TABLE IF NOT EXISTS cache_entries (cache_key TEXT PRIMARY KEY, isolation_scope TEXT NOT NULL, payload BLOB NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS cache_entries_scope ON cache_entries(isolation_scope);",
      "CREATE INDEX IF NOT EXISTS cache_entries_expiry ON cache_entries(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS pipeline_templates (template_id TEXT NOT NULL, version TEXT NOT NULL, payload BLOB NOT NULL, content_digest TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (template_id, version));",
      "CREATE TABLE IF NOT EXISTS stageflow_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO stageflow_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO runs(run_id,template_id,template_version,isolation_scope,parent_run_id,branch_sequence,created_at_ms) "
                    "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.run_id);
  BindText(st.get(), 2, r.template_id);
  BindText(st.get(), 3, r.template_version);
  BindText(st.get(), 4, r.isolation_scope);
  BindText(st.get(), 5, r.parent_run_id);
  BindU64(st.get(), 6, r.branch_sequence);
  BindU64(st.get(), 7, r.created_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "run " + r.run_id);
  return Translate(db, rc);
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "SELECT run_id,template_id,template_version,isolation_scope,parent_run_id,branch_sequence,created_at_ms "
                    "FROM runs WHERE run_id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, run_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRun(st.get());
}

std::vector<model::RunRecord> SqliteRepository::ListRuns(Transaction& t) {
  auto*                         db = TX(t).Handle();
  std::vector<model::RunRecord> out;

  auto st = Prepare(db,
                    "SELECT run_id,template_id,template_version,isolation_scope,parent_run_id,branch_sequence,created_at_ms "
                    "FROM runs ORDER BY created_at_ms, run_id;");
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRun(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  auto* db = TX(t).Handle();

  // contiguity check and insert share the transaction's write lock
  uint64_t last = LastSequence(t, r.run_id);
  if (last == 0) {
    if (auto run = GetRun(t, r.run_id)) last = run->branch_sequence;
  }
  if (r.sequence != last + 1) {
    return Result::Err(ErrorCode::Conflict, "expected sequence " + std::to_string(last + 1) + ", got " + std::to_string(r.sequence));
  }

  auto st = Prepare(db, "INSERT INTO run_events(run_id,sequence,event_type,is_snapshot,payload,recorded_at_ms) VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.run_id);
  BindU64(st.get(), 2, r.sequence);
  BindText(st.get(), 3, r.event_type);
  sqlite3_bind_int(st.get(), 4, r.is_snapshot ? 1 : 0);
  BindBlob(st.get(), 5, r.payload);
  BindU64(st.get(), 6, r.recorded_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t from_sequence,
                                                             uint64_t to_sequence) {
  auto*                           db = TX(t).Handle();
  std::vector<model::EventRecord> out;

  const std::string sql = std::string("SELECT ") + kEventColumns + " FROM run_events WHERE run_id=? AND sequence>=? AND sequence<=? ORDER BY sequence;";
  auto              st  = Prepare(db, sql.c_str());
  if (!st) return out;

  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, from_sequence);
  // sqlite integers are signed; clamp open-ended reads
  BindU64(st.get(), 3, std::min<uint64_t>(to_sequence, static_cast<uint64_t>(INT64_MAX)));

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEvent(st.get()));
  }
  return out;
}

std::optional<model::EventRecord> SqliteRepository::LatestSnapshot(Transaction& t, const std::string& run_id, uint64_t max_sequence) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("SELECT ") + kEventColumns + " FROM run_events WHERE run_id=? AND is_snapshot=1 AND sequence<=? ORDER BY sequence DESC LIMIT 1;";
  auto st = Prepare(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, std::min<uint64_t>(max_sequence, static_cast<uint64_t>(INT64_MAX)));
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEvent(st.get());
}

uint64_t SqliteRepository::LastSequence(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT COALESCE(MAX(sequence),0) FROM run_events WHERE run_id=?;");
  if (!st) return 0;

  BindText(st.get(), 1, run_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

Result SqliteRepository::TruncateEvents(Transaction& t, const std::string& run_id, uint64_t from_sequence) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM run_events WHERE run_id=? AND sequence>=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, from_sequence);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

Result SqliteRepository::PutCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO cache_entries(cache_key,isolation_scope,payload,created_at_ms,expires_at_ms) VALUES(?,?,?,?,?) "
                    "ON CONFLICT(cache_key) DO UPDATE SET isolation_scope=excluded.isolation_scope, payload=excluded.payload, "
                    "created_at_ms=excluded.created_at_ms, expires_at_ms=excluded.expires_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.cache_key);
  BindText(st.get(), 2, r.isolation_scope);
  BindBlob(st.get(), 3, r.payload);
  BindU64(st.get(), 4, r.created_at_ms);
  BindU64(st.get(), 5, r.expires_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& cache_key) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT cache_key,isolation_scope,payload,created_at_ms,expires_at_ms FROM cache_entries WHERE cache_key=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, cache_key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::CacheEntryRecord r;
  r.cache_key       = ColText(st.get(), 0);
  r.isolation_scope = ColText(st.get(), 1);
  r.payload         = ColBlob(st.get(), 2);
  r.created_at_ms   = ColU64(st.get(), 3);
  r.expires_at_ms   = ColU64(st.get(), 4);
  return r;
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& cache_key) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM cache_entries WHERE cache_key=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, cache_key);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteCacheScope(Transaction& t, const std::string& isolation_scope) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM cache_entries WHERE isolation_scope=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, isolation_scope);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms, uint64_t& removed) {
  auto* db = TX(t).Handle();
  removed  = 0;

  auto st = Prepare(db, "DELETE FROM cache_entries WHERE expires_at_ms<=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, now_ms);
  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) removed = static_cast<uint64_t>(sqlite3_changes(db));
  return result;
}

// ------------------------------------------------------------------
// Templates
// ------------------------------------------------------------------

Result SqliteRepository::InsertTemplate(Transaction& t, const model::TemplateRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO pipeline_templates(template_id,version,payload,content_digest,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.template_id);
  BindText(st.get(), 2, r.version);
  BindBlob(st.get(), 3, r.payload);
  BindText(st.get(), 4, r.content_digest);
  BindU64(st.get(), 5, r.created_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "template " + r.template_id + "@" + r.version);
  return Translate(db, rc);
}

std::optional<model::TemplateRecord> SqliteRepository::GetTemplate(Transaction& t, const std::string& template_id, const std::string& version) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT template_id,version,payload,content_digest,created_at_ms FROM pipeline_templates WHERE template_id=? AND version=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, template_id);
  BindText(st.get(), 2, version);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadTemplate(st.get());
}

std::vector<model::TemplateRecord> SqliteRepository::ListTemplates(Transaction& t) {
  auto*                              db = TX(t).Handle();
  std::vector<model::TemplateRecord> out;

  auto st = Prepare(db, "SELECT template_id,version,payload,content_digest,created_at_ms FROM pipeline_templates ORDER BY template_id, created_at_ms;");
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadTemplate(st.get()));
  }
  return out;
}

} // namespace stageflow::db::sqlite
