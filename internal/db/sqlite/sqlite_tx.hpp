#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace stageflow::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction lock for its whole lifetime and
  uses BEGIN IMMEDIATE to grab the database write lock early.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace stageflow::db::sqlite
