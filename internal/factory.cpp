#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/cache/repository_cache_backend.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/repository_event_sink.hpp"
#include "internal/flight/attempt_table.hpp"
#include "internal/generation/mock_generation_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/stage/handler_set.hpp"
#if STAGEFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STAGEFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace stageflow::factory {

using google::protobuf::util::TimeUtil;
using stageflow::observability::IntField;
using stageflow::observability::StringField;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(duration));
}

core::OrchestratorOptions BuildRunOptions(const stageflow::runtime::config::OrchestratorConfig& config) {
  core::OrchestratorOptions options;
  options.max_concurrent_stages = config.max_concurrent_stages();
  options.cancel_timeout        = ToMillis(config.cancel_timeout());

  const auto& retry = config.default_retry();
  options.default_retry.set_max_attempts(retry.max_attempts());
  options.default_retry.set_initial_backoff_ms(retry.initial_backoff_ms());
  options.default_retry.set_max_backoff_ms(retry.max_backoff_ms());
  options.default_retry.set_backoff_multiplier(retry.backoff_multiplier());
  options.default_retry.set_jitter(retry.jitter());
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const stageflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STAGEFLOW_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::Bootstrap(*sqlite_db);
    STAGEFLOW_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path()),
                                                   StringField("journal_mode", sqlite_db->JournalMode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STAGEFLOW_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() > 0 ? database.postgres().pool_size() : 16;
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    db::postgres::PgRepository::Bootstrap(*pool);
    STAGEFLOW_LOG_INFO("Using postgres repository", {IntField("pool_size", static_cast<int64_t>(pool->Size())),
                                                     IntField("open_connections", static_cast<int64_t>(pool->Snapshot().open))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STAGEFLOW_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const stageflow::runtime::config::RuntimeConfig& config, std::shared_ptr<generation::GenerationClient> client,
                  std::shared_ptr<const util::ClockSource> clock) {
  Application app;
  if (!clock) clock = std::make_shared<util::SystemClock>();

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto sink     = std::make_shared<events::RepositoryEventSink>(app.repository);
  app.store     = std::make_shared<state::StateStore>(sink, clock, config.orchestrator().snapshot_interval());
  app.templates = std::make_shared<pipeline::TemplateRegistry>(app.repository);

  // ------------------------------------------------------------------
  // Response cache
  // ------------------------------------------------------------------
  const auto&                 cache_config = config.cache();
  cache::ResponseCacheOptions cache_options;
  cache_options.memory_capacity   = cache_config.memory_capacity();
  cache_options.ttl               = ToMillis(cache_config.ttl());
  cache_options.write_queue_limit = cache_config.write_queue_limit();

  std::shared_ptr<cache::CacheBackend> backend;
  if (cache_config.persistent_enabled()) backend = std::make_shared<cache::RepositoryCacheBackend>(app.repository, clock);
  app.cache = std::make_shared<cache::ResponseCache>(cache_options, backend, clock);

  // ------------------------------------------------------------------
  // Stage execution
  // ------------------------------------------------------------------
  if (!client) {
    const auto& generation = config.generation();
    client = std::make_shared<generation::MockGenerationClient>(std::chrono::milliseconds(generation.chunk_delay_ms()),
                                                                generation.chunk_words());
  }
  app.generation = client;

  auto handlers = std::make_shared<stage::HandlerSet>(client, app.cache);
  auto attempts = std::make_shared<flight::AttemptTable>();
  app.bus       = std::make_shared<core::EventBus>();
  app.runs      = std::make_shared<core::RunRegistry>();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.templates       = app.templates;
  ctx.store           = app.store;
  ctx.handlers        = handlers;
  ctx.attempts        = attempts;
  ctx.bus             = app.bus;
  ctx.runs            = app.runs;
  ctx.cache           = app.cache;
  ctx.run_options     = BuildRunOptions(config.orchestrator());
  ctx.isolation_scope = config.orchestrator().isolation_scope();

  app.orchestrator = std::make_shared<service::OrchestratorService>(ctx);
  app.catalog      = std::make_shared<service::CatalogService>(ctx);
  app.admin        = std::make_shared<service::AdminService>(ctx);

  return app;
}

void Application::Shutdown() {
  if (orchestrator) orchestrator->Shutdown();
  if (cache) cache->Shutdown();
}

} // namespace stageflow::factory
