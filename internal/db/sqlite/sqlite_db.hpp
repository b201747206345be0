#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace stageflow::db::sqlite {

/*
  Owns the single sqlite3 connection behind a SqliteRepository.

  The event log is the durable record of every run, so the connection
  is opened with synchronous=FULL. WAL is used unless the config turns
  it off; JournalMode() reports what sqlite actually accepted.

  Every SqliteTransaction holds TxMutex() for its whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  const std::string& JournalMode() const {
    return journal_mode_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements that return no rows (schema, pragmas).
  void Exec(const std::string& sql);

 private:
  void        Configure(bool wal_mode);
  std::string PragmaValue(const std::string& pragma);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::string journal_mode_;
  std::mutex  tx_mutex_;
};

} // namespace stageflow::db::sqlite
