#include "internal/db/postgres/pg_tx.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"

namespace stageflow::db::postgres {

namespace {

// Shared by every stageflow process on the database. Held until
// commit or rollback, it serializes writers the way the sqlite
// connection mutex does.
constexpr long long kRepositoryLockKey = 0x5354414745464C57LL;

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  tx_->exec("SELECT pg_advisory_xact_lock(" + std::to_string(kRepositoryLockKey) + ")");
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    STAGEFLOW_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace stageflow::db::postgres
