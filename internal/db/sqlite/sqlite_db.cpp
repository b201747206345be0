#include "internal/db/sqlite/sqlite_db.hpp"

#include <stdexcept>

namespace stageflow::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

// Applied after the journal mode on every new connection.
constexpr const char* kConnectionPragmas[] = {
    "PRAGMA synchronous=FULL;",
    "PRAGMA foreign_keys=ON;",
    "PRAGMA temp_store=MEMORY;",
    "PRAGMA cache_size=-8000;",
};

std::runtime_error SqliteError(const std::string& path, const std::string& what, const std::string& detail) {
  return std::runtime_error("sqlite " + what + " (" + path + "): " + detail);
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(path_, "open", detail);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw SqliteError(path_, "exec", detail);
  }
}

std::string SqliteDB::PragmaValue(const std::string& pragma) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db_, pragma.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    const std::string detail = sqlite3_errmsg(db_);
    sqlite3_finalize(st);
    throw SqliteError(path_, "pragma", detail);
  }

  std::string value;
  if (sqlite3_step(st) == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(st, 0);
    if (text) value = reinterpret_cast<const char*>(text);
  }
  sqlite3_finalize(st);
  return value;
}

void SqliteDB::Configure(bool wal_mode) {
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw SqliteError(path_, "busy_timeout", sqlite3_errmsg(db_));
  }

  // journal_mode answers with the mode in effect; ":memory:" never goes WAL.
  journal_mode_ = PragmaValue(wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");

  for (const char* pragma : kConnectionPragmas) {
    Exec(pragma);
  }
}

} // namespace stageflow::db::sqlite
