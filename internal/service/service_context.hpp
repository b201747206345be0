#pragma once

#include <memory>
#include <string>

#include "internal/core/run_orchestrator.hpp"

namespace stageflow::pipeline { class TemplateRegistry; }
namespace stageflow::state { class StateStore; }
namespace stageflow::stage { class HandlerSet; }
namespace stageflow::flight { class AttemptTable; }
namespace stageflow::cache { class ResponseCache; }
namespace stageflow::core { class EventBus; class RunRegistry; }

namespace stageflow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<stageflow::pipeline::TemplateRegistry> templates;
  std::shared_ptr<stageflow::state::StateStore>          store;
  std::shared_ptr<stageflow::stage::HandlerSet>          handlers;
  std::shared_ptr<stageflow::flight::AttemptTable>       attempts;
  std::shared_ptr<stageflow::core::EventBus>             bus;
  std::shared_ptr<stageflow::core::RunRegistry>          runs;
  std::shared_ptr<stageflow::cache::ResponseCache>       cache;

  stageflow::core::OrchestratorOptions run_options;
  std::string                          isolation_scope;
};

}
