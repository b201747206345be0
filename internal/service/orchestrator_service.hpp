#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/core/event_bus.hpp"
#include "service_context.hpp"
#include "stageflow/service/v1/control.pb.h"

namespace stageflow::service {

/*
  Run control surface.

  Runs are started from a registered template, driven by their own
  orchestrator and observed through state queries, the event log or a
  live subscription. Calls on a run that has no live orchestrator in
  this process report NotFound for an unknown run and InvalidState for
  a known one.
*/
class OrchestratorService {
 public:
  explicit OrchestratorService(ServiceContext ctx);

  stageflow::service::v1::StartRunResponse StartRun(const stageflow::service::v1::StartRunRequest& req);

  stageflow::core::v1::RunState GetRunState(const stageflow::service::v1::GetRunStateRequest& req);
  stageflow::core::v1::RunState GetRunStateAt(const stageflow::service::v1::GetRunStateAtRequest& req);

  void SupplyFeedback(const stageflow::service::v1::SupplyFeedbackRequest& req);
  void CancelRun(const stageflow::service::v1::CancelRunRequest& req);
  void PauseRun(const stageflow::service::v1::PauseRunRequest& req);
  void ResumeRun(const stageflow::service::v1::ResumeRunRequest& req);
  void SkipStage(const stageflow::service::v1::SkipStageRequest& req);

  stageflow::service::v1::BranchRunResponse  BranchRun(const stageflow::service::v1::BranchRunRequest& req);
  stageflow::service::v1::ReadEventsResponse ReadEvents(const stageflow::service::v1::ReadEventsRequest& req);
  stageflow::service::v1::ListRunsResponse   ListRuns(const stageflow::service::v1::ListRunsRequest& req);

  // Live updates of a run from the moment of subscribing. Nothing is
  // replayed: read earlier events with ReadEvents, then subscribe. The
  // stream is closed and empty at once when the run is terminal or not
  // driven by this process.
  std::shared_ptr<stageflow::core::Subscription> Subscribe(const std::string& run_id);
  void                                           Unsubscribe(const std::shared_ptr<stageflow::core::Subscription>& subscription);

  // Returns the state once the run is terminal or the timeout passed.
  stageflow::core::v1::RunState WaitForRun(const std::string& run_id, std::chrono::milliseconds timeout);

  // Resumes every non-terminal run found in the event log.
  stageflow::service::v1::RecoverRunsResponse RecoverRuns();

  // Stops every live run without recording anything.
  void Shutdown();

 private:
  std::shared_ptr<stageflow::core::RunOrchestrator> Launch(std::shared_ptr<const stageflow::pipeline::CompiledTemplate> compiled,
                                                           stageflow::core::v1::RunState                               state);
  std::shared_ptr<stageflow::core::RunOrchestrator> RequireLive(const std::string& run_id);

  ServiceContext ctx_;
};

} // namespace stageflow::service
