#pragma once

namespace stageflow::db {

/*
  Unit of work against a Repository.

  An event append and the snapshot written beside it land in the same
  transaction, so a reader never sees one without the other. Writes stay
  private until Commit(); a transaction destroyed without Commit() rolls
  back.

  At most one transaction per repository is open at a time:
    memory   - exclusive lock, undo journal replayed on rollback
    sqlite   - connection mutex held across BEGIN IMMEDIATE .. COMMIT
    postgres - pooled pqxx::work holding pg_advisory_xact_lock
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace stageflow::db
