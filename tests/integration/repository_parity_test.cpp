#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if STAGEFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STAGEFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using stageflow::db::ErrorCode;
using stageflow::db::Repository;
using stageflow::db::memory::MemoryRepository;
using stageflow::db::model::CacheEntryRecord;
using stageflow::db::model::EventRecord;
using stageflow::db::model::RunRecord;
using stageflow::db::model::TemplateRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RunRecord MakeRun(const std::string& id, const std::string& parent = "", uint64_t branch_sequence = 0) {
  return RunRecord{.run_id           = id,
                   .template_id      = "article",
                   .template_version = "1",
                   .isolation_scope  = "parity",
                   .parent_run_id    = parent,
                   .branch_sequence  = branch_sequence,
                   .created_at_ms    = NowMs()};
}

EventRecord MakeEvent(const std::string& run_id, uint64_t sequence, bool snapshot = false) {
  return EventRecord{.run_id         = run_id,
                     .sequence       = sequence,
                     .event_type     = snapshot ? "state_snapshot" : "stage_started",
                     .is_snapshot    = snapshot,
                     .payload        = std::string("event-") + std::to_string(sequence) + std::string(1, '\0') + "tail",
                     .recorded_at_ms = 1000 + sequence};
}

void VerifyRunCatalog(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  assert(repo.InsertRun(*tx, MakeRun(id)));
  auto duplicate = repo.InsertRun(*tx, MakeRun(id));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto read = repo.GetRun(*tx, id);
  assert(read.has_value());
  assert(read->template_id == "article");
  assert(read->isolation_scope == "parity");
  assert(read->parent_run_id.empty());
  assert(!repo.GetRun(*tx, id + "-missing").has_value());

  bool listed = false;
  for (const auto& run : repo.ListRuns(*tx)) listed = listed || run.run_id == id;
  assert(listed);

  tx->Commit();
}

void VerifyEventLog(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    assert(repo.LastSequence(*tx, id) == 0);

    auto gap = repo.AppendEvent(*tx, MakeEvent(id, 2));
    assert(gap.code == ErrorCode::Conflict);

    for (uint64_t seq = 1; seq <= 5; ++seq) assert(repo.AppendEvent(*tx, MakeEvent(id, seq, seq == 3)));

    auto duplicate = repo.AppendEvent(*tx, MakeEvent(id, 5));
    assert(duplicate.code == ErrorCode::Conflict);
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.LastSequence(*tx, id) == 5);

    auto all = repo.ReadEvents(*tx, id, 1, UINT64_MAX);
    assert(all.size() == 5);
    for (std::size_t i = 0; i < all.size(); ++i) assert(all[i].sequence == i + 1);
    assert(all[1].payload == MakeEvent(id, 2).payload);
    assert(all[2].is_snapshot);

    auto middle = repo.ReadEvents(*tx, id, 2, 4);
    assert(middle.size() == 3);
    assert(middle.front().sequence == 2);

    auto snapshot = repo.LatestSnapshot(*tx, id, UINT64_MAX);
    assert(snapshot.has_value());
    assert(snapshot->sequence == 3);
    assert(!repo.LatestSnapshot(*tx, id, 2).has_value());
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.TruncateEvents(*tx, id, 3));
    assert(repo.LastSequence(*tx, id) == 2);
    assert(!repo.LatestSnapshot(*tx, id, UINT64_MAX).has_value());
    assert(repo.AppendEvent(*tx, MakeEvent(id, 3)));
    tx->Commit();
  }
}

void VerifyBranchLog(Repository& repo, const std::string& parent, const std::string& child) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(parent)));
  for (uint64_t seq = 1; seq <= 6; ++seq) assert(repo.AppendEvent(*tx, MakeEvent(parent, seq)));

  assert(repo.InsertRun(*tx, MakeRun(child, parent, 4)));
  auto from_start = repo.AppendEvent(*tx, MakeEvent(child, 1));
  assert(from_start.code == ErrorCode::Conflict);
  assert(repo.AppendEvent(*tx, MakeEvent(child, 5)));
  assert(repo.AppendEvent(*tx, MakeEvent(child, 6)));

  auto own = repo.ReadEvents(*tx, child, 1, UINT64_MAX);
  assert(own.size() == 2);
  assert(own.front().sequence == 5);
  assert(repo.ReadEvents(*tx, parent, 1, UINT64_MAX).size() == 6);

  auto read = repo.GetRun(*tx, child);
  assert(read.has_value());
  assert(read->parent_run_id == parent);
  assert(read->branch_sequence == 4);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    assert(repo.AppendEvent(*tx, MakeEvent(id, 1)));
    tx->Rollback();
  }
  {
    // Dropped without commit.
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id + "-dropped")));
  }
  auto tx = repo.Begin();
  assert(!repo.GetRun(*tx, id).has_value());
  assert(!repo.GetRun(*tx, id + "-dropped").has_value());
  assert(repo.LastSequence(*tx, id) == 0);
  tx->Commit();
}

void VerifyCacheEntries(Repository& repo, const std::string& prefix) {
  const std::string scope = prefix + "-scope";
  const std::string other = prefix + "-other";
  {
    auto tx = repo.Begin();
    assert(repo.PutCacheEntry(*tx, CacheEntryRecord{prefix + "-a", scope, "alpha", 100, 5000}));
    assert(repo.PutCacheEntry(*tx, CacheEntryRecord{prefix + "-b", scope, "beta", 100, 2000}));
    assert(repo.PutCacheEntry(*tx, CacheEntryRecord{prefix + "-c", other, "gamma", 100, 9000}));

    // Upsert replaces the payload and expiry.
    assert(repo.PutCacheEntry(*tx, CacheEntryRecord{prefix + "-a", scope, "alpha-2", 200, 6000}));
    auto a = repo.GetCacheEntry(*tx, prefix + "-a");
    assert(a.has_value());
    assert(a->payload == "alpha-2");
    assert(a->expires_at_ms == 6000);
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    uint64_t removed = 0;
    assert(repo.DeleteExpiredCacheEntries(*tx, 2000, removed));
    assert(removed == 1);
    assert(!repo.GetCacheEntry(*tx, prefix + "-b").has_value());
    assert(repo.GetCacheEntry(*tx, prefix + "-a").has_value());

    assert(repo.DeleteCacheScope(*tx, scope));
    assert(!repo.GetCacheEntry(*tx, prefix + "-a").has_value());
    assert(repo.GetCacheEntry(*tx, prefix + "-c").has_value());

    assert(repo.DeleteCacheEntry(*tx, prefix + "-c"));
    assert(!repo.GetCacheEntry(*tx, prefix + "-c").has_value());
    tx->Commit();
  }
}

void VerifyTemplates(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertTemplate(*tx, TemplateRecord{id, "1", "payload-1", "digest-1", NowMs()}));
  assert(repo.InsertTemplate(*tx, TemplateRecord{id, "2", "payload-2", "digest-2", NowMs()}));

  auto duplicate = repo.InsertTemplate(*tx, TemplateRecord{id, "1", "other", "digest-x", NowMs()});
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto v1 = repo.GetTemplate(*tx, id, "1");
  assert(v1.has_value());
  assert(v1->payload == "payload-1");
  assert(v1->content_digest == "digest-1");
  assert(!repo.GetTemplate(*tx, id, "3").has_value());

  std::size_t versions = 0;
  for (const auto& record : repo.ListTemplates(*tx)) {
    if (record.template_id == id) ++versions;
  }
  assert(versions == 2);
  tx->Commit();
}

void VerifySerializedTransactions(Repository& repo, const std::string& id) {
  auto              tx1 = repo.Begin();
  std::atomic<bool> second_began{false};

  std::thread other([&] {
    auto tx2     = repo.Begin();
    second_began = true;
    assert(repo.GetRun(*tx2, id).has_value());
    tx2->Commit();
  });

  assert(repo.InsertRun(*tx1, MakeRun(id)));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!second_began);
  tx1->Commit();

  other.join();
  assert(second_began);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertRun(*tx, MakeRun(id)));
    assert(repo->AppendEvent(*tx, MakeEvent(id, 1)));
    assert(repo->AppendEvent(*tx, MakeEvent(id, 2, true)));
    assert(repo->PutCacheEntry(*tx, CacheEntryRecord{id + "-entry", "durable", "kept", 1, UINT64_MAX / 2}));
    assert(repo->InsertTemplate(*tx, TemplateRecord{id + "-tpl", "1", "body", "digest", NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetRun(*tx, id).has_value());
  assert(repo->LastSequence(*tx, id) == 2);
  assert(repo->LatestSnapshot(*tx, id, UINT64_MAX)->sequence == 2);
  assert(repo->GetCacheEntry(*tx, id + "-entry")->payload == "kept");
  assert(repo->GetTemplate(*tx, id + "-tpl", "1").has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if STAGEFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("stageflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path]() {
    auto db = std::make_shared<stageflow::db::sqlite::SqliteDB>(db_path, true);
    assert(db->JournalMode() == "wal");
    stageflow::db::sqlite::SqliteRepository::Bootstrap(*db);
    return std::make_shared<stageflow::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if STAGEFLOW_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STAGEFLOW_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STAGEFLOW_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<stageflow::db::postgres::PgPool>(conninfo, 4);
    stageflow::db::postgres::PgRepository::Bootstrap(*pool);
    const auto stats = pool->Snapshot();
    assert(stats.open == 1 && stats.idle == 1);
    return std::make_shared<stageflow::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Unique per invocation so a shared postgres database can be reused.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyRunCatalog(*repo, prefix + "-catalog");
  VerifyEventLog(*repo, prefix + "-log");
  VerifyBranchLog(*repo, prefix + "-parent", prefix + "-child");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyCacheEntries(*repo, prefix + "-cache");
  VerifyTemplates(*repo, prefix + "-template");
  VerifySerializedTransactions(*repo, prefix + "-serial");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STAGEFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STAGEFLOW_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "stageflow_integration_repository_parity: pass\n";
  return 0;
}
