#include "internal/db/postgres/pg_pool.hpp"

namespace stageflow::db::postgres {

namespace {

struct PreparedStatement {
  const char* name;
  const char* sql;
};

// Hot-path statements. Payload columns travel hex encoded so that
// arbitrary bytes survive the text protocol.
constexpr PreparedStatement kStatements[] = {
    {"insert_run",
     "INSERT INTO runs(run_id,template_id,template_version,isolation_scope,parent_run_id,branch_sequence,created_at_ms) "
     "VALUES($1,$2,$3,$4,$5,$6,$7)"},
    {"get_run",
     "SELECT run_id,template_id,template_version,isolation_scope,parent_run_id,branch_sequence,created_at_ms "
     "FROM runs WHERE run_id=$1"},
    {"last_sequence", "SELECT COALESCE(MAX(sequence),0) FROM run_events WHERE run_id=$1"},
    {"append_event",
     "INSERT INTO run_events(run_id,sequence,event_type,is_snapshot,payload,recorded_at_ms) "
     "VALUES($1,$2,$3,$4,decode($5,'hex'),$6)"},
    {"read_events",
     "SELECT run_id,sequence,event_type,is_snapshot,encode(payload,'hex'),recorded_at_ms FROM run_events "
     "WHERE run_id=$1 AND sequence>=$2 AND sequence<=$3 ORDER BY sequence"},
    {"latest_snapshot",
     "SELECT run_id,sequence,event_type,is_snapshot,encode(payload,'hex'),recorded_at_ms FROM run_events "
     "WHERE run_id=$1 AND is_snapshot AND sequence<=$2 ORDER BY sequence DESC LIMIT 1"},
    {"get_cache_entry",
     "SELECT cache_key,isolation_scope,encode(payload,'hex'),created_at_ms,expires_at_ms FROM cache_entries WHERE cache_key=$1"},
    {"put_cache_entry",
     "INSERT INTO cache_entries(cache_key,isolation_scope,payload,created_at_ms,expires_at_ms) VALUES($1,$2,decode($3,'hex'),$4,$5) "
     "ON CONFLICT(cache_key) DO UPDATE SET isolation_scope=EXCLUDED.isolation_scope,payload=EXCLUDED.payload,"
     "created_at_ms=EXCLUDED.created_at_ms,expires_at_ms=EXCLUDED.expires_at_ms"},
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t size) : conninfo_(std::move(conninfo)), size_(size == 0 ? 1 : size) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || open_ < size_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.front());
    idle_.pop_front();
    return Lend(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++open_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = Connect();
  } catch (const std::exception&) {
    Forget();
    throw;
  }
  return Lend(std::move(conn));
}

PgPool::Stats PgPool::Snapshot() const {
  std::lock_guard lock(mutex_);
  return Stats{open_, idle_.size()};
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& statement : kStatements) {
    conn->prepare(statement.name, statement.sql);
  }
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* lent) {
    if (auto self = pool.lock()) {
      self->Return(lent);
    } else {
      delete lent;
    }
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

void PgPool::Forget() {
  {
    std::lock_guard lock(mutex_);
    --open_;
  }
  returned_.notify_one();
}

} // namespace stageflow::db::postgres
