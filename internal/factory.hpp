#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/response_cache.hpp"
#include "internal/core/event_bus.hpp"
#include "internal/core/run_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/generation/generation_client.hpp"
#include "internal/pipeline/template_registry.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/orchestrator_service.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/time.hpp"

namespace stageflow::factory {

/*
  Application

  Owns all long-lived components. Everything here lives until Shutdown.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<generation::GenerationClient> generation;
  std::shared_ptr<cache::ResponseCache>         cache;
  std::shared_ptr<state::StateStore>            store;
  std::shared_ptr<pipeline::TemplateRegistry>   templates;
  std::shared_ptr<core::EventBus>               bus;
  std::shared_ptr<core::RunRegistry>            runs;

  std::shared_ptr<service::OrchestratorService> orchestrator;
  std::shared_ptr<service::CatalogService>      catalog;
  std::shared_ptr<service::AdminService>        admin;

  // Stops live runs (they stay resumable) and drains queued cache writes.
  void Shutdown();
};

/*
  Build

  Constructs the entire application from runtime config. This is the
  composition root: the only place that knows concrete backends.

  `client` and `clock` replace the configured generation provider and
  the system clock when given.
*/
Application Build(const stageflow::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<generation::GenerationClient>     client = nullptr,
                  std::shared_ptr<const util::ClockSource>          clock  = nullptr);

// Exposed for tools that only read the event log.
std::shared_ptr<db::Repository> BuildRepository(const stageflow::runtime::config::RuntimeConfig& config);

} // namespace stageflow::factory
