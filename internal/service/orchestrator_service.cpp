#include "orchestrator_service.hpp"

#include <algorithm>

#include "internal/core/run_registry.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/run_inputs.hpp"
#include "internal/pipeline/template_registry.hpp"
#include "internal/state/run_state_util.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace stageflow::service {

using namespace stageflow::service::v1;
using stageflow::core::v1::RunState;
using stageflow::observability::IntField;
using stageflow::observability::StringField;

OrchestratorService::OrchestratorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

StartRunResponse OrchestratorService::StartRun(const StartRunRequest& req) {
  return ObserveRpc("OrchestratorService.StartRun", "", [&] {
    const auto compiled = req.template_version().empty() ? ctx_.templates->Latest(req.template_id())
                                                         : ctx_.templates->Get(req.template_id(), req.template_version());
    const auto& definition = compiled->definition;

    const std::map<std::string, std::string> supplied(req.inputs().begin(), req.inputs().end());

    stageflow::events::v1::RunCreated created;
    created.set_template_id(definition.id());
    created.set_template_version(definition.version());
    for (const auto& [key, value] : pipeline::ResolveRunInputs(definition, supplied)) {
      (*created.mutable_inputs())[key] = value;
    }
    for (const auto& stage : definition.stages()) {
      auto* topology = created.add_topology();
      topology->set_stage_id(stage.id());
      *topology->mutable_depends_on() = stage.depends_on();
      topology->set_optional(stage.optional());
    }
    created.set_isolation_scope(req.isolation_scope().empty() ? ctx_.isolation_scope : req.isolation_scope());

    const auto run_id = util::NewRunId();
    auto       state  = ctx_.store->CreateRun(run_id, created);
    Launch(compiled, std::move(state));

    STAGEFLOW_LOG_INFO("Run created", {StringField("run_id", run_id), StringField("template_id", definition.id()),
                                       StringField("template_version", definition.version()),
                                       StringField("isolation_scope", created.isolation_scope())});

    StartRunResponse resp;
    resp.set_run_id(run_id);
    return resp;
  });
}

BranchRunResponse OrchestratorService::BranchRun(const BranchRunRequest& req) {
  return ObserveRpc("OrchestratorService.BranchRun", req.run_id(), [&] {
    const auto child_id = util::NewRunId();
    auto       state    = ctx_.store->CreateBranch(req.run_id(), req.sequence(), child_id);
    const auto compiled = ctx_.templates->Get(state.template_id(), state.template_version());
    Launch(compiled, std::move(state));

    BranchRunResponse resp;
    resp.set_run_id(child_id);
    return resp;
  });
}

RecoverRunsResponse OrchestratorService::RecoverRuns() {
  return ObserveRpc("OrchestratorService.RecoverRuns", "", [&] {
    RecoverRunsResponse resp;
    for (const auto& record : ctx_.store->ListRuns()) {
      if (auto live = ctx_.runs->Find(record.run_id); live && !live->Done()) continue;

      auto state = ctx_.store->Load(record.run_id);
      if (state::IsTerminal(state.status())) continue;

      std::shared_ptr<const pipeline::CompiledTemplate> compiled;
      try {
        compiled = ctx_.templates->Get(record.template_id, record.template_version);
      } catch (const util::NotFound& e) {
        STAGEFLOW_LOG_ERROR("Cannot recover run without its template",
                            {StringField("run_id", record.run_id), StringField("error", e.what())});
        continue;
      }

      STAGEFLOW_LOG_INFO("Recovering run", {StringField("run_id", record.run_id), StringField("status", state::RunStatusName(state.status())),
                                            IntField("sequence", static_cast<int64_t>(state.sequence()))});
      Launch(compiled, std::move(state));
      resp.add_run_ids(record.run_id);
    }
    return resp;
  });
}

void OrchestratorService::Shutdown() {
  for (const auto& run : ctx_.runs->List()) run->Stop();
  const auto stopped = ctx_.runs->ReapFinished();
  STAGEFLOW_LOG_INFO("Orchestrator service stopped", {IntField("runs", static_cast<int64_t>(stopped))});
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

RunState OrchestratorService::GetRunState(const GetRunStateRequest& req) {
  return ObserveRpc("OrchestratorService.GetRunState", req.run_id(), [&] {
    if (auto live = ctx_.runs->Find(req.run_id())) return live->State();
    return ctx_.store->Load(req.run_id());
  });
}

RunState OrchestratorService::GetRunStateAt(const GetRunStateAtRequest& req) {
  return ObserveRpc("OrchestratorService.GetRunStateAt", req.run_id(), [&] { return ctx_.store->LoadAt(req.run_id(), req.sequence()); });
}

ReadEventsResponse OrchestratorService::ReadEvents(const ReadEventsRequest& req) {
  return ObserveRpc("OrchestratorService.ReadEvents", req.run_id(), [&] {
    const auto from = std::max<uint64_t>(req.from_sequence(), 1);
    const auto to   = req.to_sequence() == 0 ? events::kEndOfLog : req.to_sequence();

    ReadEventsResponse resp;
    for (auto& event : ctx_.store->ReadEvents(req.run_id(), from, to)) *resp.add_events() = std::move(event);
    return resp;
  });
}

ListRunsResponse OrchestratorService::ListRuns(const ListRunsRequest&) {
  return ObserveRpc("OrchestratorService.ListRuns", "", [&] {
    ListRunsResponse resp;
    for (const auto& record : ctx_.store->ListRuns()) {
      auto* summary = resp.add_runs();
      summary->set_run_id(record.run_id);
      summary->set_template_id(record.template_id);
      summary->set_template_version(record.template_version);
      summary->set_parent_run_id(record.parent_run_id);
      summary->set_branch_sequence(record.branch_sequence);

      auto live = ctx_.runs->Find(record.run_id);
      summary->set_active(live && !live->Done());
      summary->set_status(live ? live->State().status() : ctx_.store->Load(record.run_id).status());
    }
    return resp;
  });
}

std::shared_ptr<core::Subscription> OrchestratorService::Subscribe(const std::string& run_id) {
  return ObserveRpc("OrchestratorService.Subscribe", run_id, [&] {
    auto live = ctx_.runs->Find(run_id);
    // NotFound for an unknown run.
    if (!live) ctx_.store->Load(run_id);

    auto subscription = ctx_.bus->Subscribe(run_id);
    if (!live || live->Done() || state::IsTerminal(live->State().status())) ctx_.bus->CloseRun(run_id);
    return subscription;
  });
}

void OrchestratorService::Unsubscribe(const std::shared_ptr<core::Subscription>& subscription) {
  ctx_.bus->Unsubscribe(subscription);
}

RunState OrchestratorService::WaitForRun(const std::string& run_id, std::chrono::milliseconds timeout) {
  if (auto live = ctx_.runs->Find(run_id)) {
    live->WaitUntilDone(timeout);
    return live->State();
  }
  return ctx_.store->Load(run_id);
}

// ------------------------------------------------------------
// Control
// ------------------------------------------------------------

void OrchestratorService::SupplyFeedback(const SupplyFeedbackRequest& req) {
  ObserveRpc("OrchestratorService.SupplyFeedback", req.run_id(),
             [&] { RequireLive(req.run_id())->SupplyFeedback(req.stage_id(), req.selection()); });
}

void OrchestratorService::CancelRun(const CancelRunRequest& req) {
  ObserveRpc("OrchestratorService.CancelRun", req.run_id(), [&] {
    auto live = ctx_.runs->Find(req.run_id());
    if (!live || live->Done()) {
      // Cancelling a finished run changes nothing.
      if (state::IsTerminal(ctx_.store->Load(req.run_id()).status())) return;
    }
    RequireLive(req.run_id())->Cancel(req.reason().empty() ? "cancelled on request" : req.reason());
  });
}

void OrchestratorService::PauseRun(const PauseRunRequest& req) {
  ObserveRpc("OrchestratorService.PauseRun", req.run_id(), [&] { RequireLive(req.run_id())->Pause(req.reason()); });
}

void OrchestratorService::ResumeRun(const ResumeRunRequest& req) {
  ObserveRpc("OrchestratorService.ResumeRun", req.run_id(), [&] { RequireLive(req.run_id())->Resume(); });
}

void OrchestratorService::SkipStage(const SkipStageRequest& req) {
  ObserveRpc("OrchestratorService.SkipStage", req.run_id(), [&] { RequireLive(req.run_id())->Skip(req.stage_id()); });
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

std::shared_ptr<core::RunOrchestrator> OrchestratorService::Launch(std::shared_ptr<const pipeline::CompiledTemplate> compiled,
                                                                   RunState                                          state) {
  ctx_.runs->ReapFinished();

  core::RunDependencies deps{ctx_.store, ctx_.handlers, ctx_.attempts, ctx_.bus};
  auto run = std::make_shared<core::RunOrchestrator>(std::move(compiled), std::move(state), std::move(deps), ctx_.run_options);
  ctx_.runs->Add(run);
  run->Start();
  return run;
}

std::shared_ptr<core::RunOrchestrator> OrchestratorService::RequireLive(const std::string& run_id) {
  if (auto live = ctx_.runs->Find(run_id); live && !live->Done()) return live;

  const auto state = ctx_.store->Load(run_id);
  if (state::IsTerminal(state.status())) {
    throw util::InvalidState("run " + run_id + " is " + std::string(state::RunStatusName(state.status())));
  }
  throw util::InvalidState("run " + run_id + " is not active in this process; recover it first");
}

} // namespace stageflow::service
