#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/event_bus.hpp"
#include "internal/core/mailbox.hpp"
#include "internal/flight/attempt_table.hpp"
#include "internal/pipeline/template_registry.hpp"
#include "internal/resolver/dependency_resolver.hpp"
#include "internal/stage/handler_set.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/cancellation.hpp"
#include "stageflow/core/v1/run.pb.h"

namespace stageflow::core {

struct OrchestratorOptions {
  std::size_t                      max_concurrent_stages = 4;
  std::chrono::milliseconds        cancel_timeout{5000};
  stageflow::core::v1::RetryPolicy default_retry;
};

struct RunDependencies {
  std::shared_ptr<state::StateStore>    store;
  std::shared_ptr<stage::HandlerSet>    handlers;
  std::shared_ptr<flight::AttemptTable> attempts;
  std::shared_ptr<EventBus>             bus;
};

/*
  Drives one run.

  A single loop thread owns the run's state and is the only writer of its
  events. Each tick it asks the resolver for runnable stages, appends
  StageStarted and hands the attempt to a worker thread. Workers report
  back through the mailbox; control requests (feedback, cancel, pause,
  resume, skip) travel the same way and are answered once the loop has
  recorded them.

  Run lifecycle:

    Pending -> Running <-> Paused
    Running -> Completed | Failed | Cancelled

  A required stage failing for good stops new starts; in-flight attempts
  drain, then RunFailed is appended. Cancellation aborts in-flight calls
  and waits up to cancel_timeout for them before RunCancelled. An event
  sink failure stops the loop at once: nothing more is appended and the
  run reports Failed.
*/
class RunOrchestrator {
 public:
  RunOrchestrator(std::shared_ptr<const pipeline::CompiledTemplate> compiled, stageflow::core::v1::RunState initial,
                  RunDependencies deps, OrchestratorOptions options);
  ~RunOrchestrator();

  RunOrchestrator(const RunOrchestrator&)            = delete;
  RunOrchestrator& operator=(const RunOrchestrator&) = delete;

  void Start();

  // Each call returns once the loop handled it and rethrows its rejection.
  void SupplyFeedback(const std::string& stage_id, const std::string& selection);
  void Cancel(const std::string& reason);
  void Pause(const std::string& reason);
  void Resume();
  void Skip(const std::string& stage_id);

  // Stops the loop without recording anything. The run can be recovered.
  void Stop();

  stageflow::core::v1::RunState State() const;

  bool Done() const;
  bool WaitUntilDone(std::chrono::milliseconds timeout) const;

  const std::string& run_id() const {
    return run_id_;
  }

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct RetryTimer {
    uint32_t                next_attempt = 0;
    SteadyClock::time_point due;
  };

  void Loop();
  void Bootstrap();
  void Tick();

  void Handle(RunMessage message);
  void HandleAttempt(AttemptFinished finished);
  void HandleControl(ControlMessage message);

  void OnFeedback(const FeedbackRequest& request);
  void OnCancel(const CancelRequest& request);
  void OnPause(const PauseRequest& request);
  void OnResume();
  void OnSkip(const SkipRequest& request);

  void StartAttempt(const std::string& stage_id, uint32_t attempt);
  void RecordLate(const AttemptFinished& finished);
  void DrainWorkers(SteadyClock::time_point deadline);
  void ReapWorker(const std::string& stage_id);
  void Conclude();

  void Request(ControlRequest request);
  void Record(std::vector<stageflow::events::v1::Event> batch);

  const stageflow::core::v1::StageDefinition& Definition(const std::string& stage_id) const;
  stageflow::core::v1::RetryPolicy            RetryFor(const stageflow::core::v1::StageDefinition& definition) const;
  std::chrono::milliseconds                   Backoff(const stageflow::core::v1::RetryPolicy& policy, uint32_t failed_attempt);
  bool                                        RequiredStageFailed() const;

  std::string                                       run_id_;
  std::shared_ptr<const pipeline::CompiledTemplate> compiled_;
  RunDependencies                                   deps_;
  OrchestratorOptions                               options_;
  resolver::DependencyResolver                      resolver_;

  std::shared_ptr<Mailbox> mailbox_;
  util::CancellationSource cancel_;

  // Loop thread only.
  stageflow::core::v1::RunState      state_;
  std::map<std::string, std::thread> workers_;
  std::map<std::string, RetryTimer>  retries_;
  bool                               cancelling_ = false;
  bool                               stopping_   = false;
  std::mt19937_64                    rng_;

  mutable std::mutex              view_mutex_;
  mutable std::condition_variable done_cv_;
  stageflow::core::v1::RunState   view_;
  std::string                     fatal_;
  bool                            done_ = false;

  std::thread loop_;
};

} // namespace stageflow::core
