#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/events/event_sink.hpp"
#include "internal/util/time.hpp"
#include "stageflow/core/v1/run.pb.h"
#include "stageflow/events/v1/event.pb.h"

namespace stageflow::state {

/*
  Event-sourced run state.

  Append stamps run id, sequence and time onto new events, writes them
  durably as one batch, then folds them into the caller's state. Only the
  run's orchestrator appends, so sequences never race.

  A snapshot is appended after every `snapshot_interval` events and after
  a terminal event. Loading starts from the nearest snapshot.

  Branches record a parent run and a branch sequence. Their state at N is
  the parent's state at min(N, branch sequence) followed by the child's
  own events. Nothing is copied.
*/
class StateStore {
 public:
  StateStore(std::shared_ptr<events::EventSink> sink, std::shared_ptr<const util::ClockSource> clock, uint64_t snapshot_interval);

  // Records the run and appends RunCreated.
  stageflow::core::v1::RunState CreateRun(const std::string& run_id, const stageflow::events::v1::RunCreated& created);

  // Child run sharing the parent log up to `sequence`.
  // Throws NotFound, InvalidState when the parent is terminal at that point.
  stageflow::core::v1::RunState CreateBranch(const std::string& parent_run_id, uint64_t sequence, const std::string& child_run_id);

  // Returns the events as written.
  std::vector<stageflow::events::v1::Event> Append(stageflow::core::v1::RunState& state,
                                                   std::vector<stageflow::events::v1::Event> events);

  // Throws NotFound.
  stageflow::core::v1::RunState Load(const std::string& run_id);
  stageflow::core::v1::RunState LoadAt(const std::string& run_id, uint64_t sequence);

  // Events visible to the run, parent prefix included.
  std::vector<stageflow::events::v1::Event> ReadEvents(const std::string& run_id, uint64_t from_sequence = 1,
                                                       uint64_t to_sequence = events::kEndOfLog);

  std::vector<db::model::RunRecord> ListRuns();

  uint64_t snapshot_interval() const {
    return snapshot_interval_;
  }

 private:
  db::model::RunRecord RequireRun(const std::string& run_id);

  stageflow::core::v1::RunState Rebuild(const db::model::RunRecord& record, uint64_t sequence);

  bool SnapshotDue(const stageflow::core::v1::RunState& state, bool terminal);
  void NoteSnapshot(const std::string& run_id, uint64_t sequence);

  std::shared_ptr<events::EventSink>       sink_;
  std::shared_ptr<const util::ClockSource> clock_;
  uint64_t                                 snapshot_interval_;

  std::mutex                                mutex_;
  std::unordered_map<std::string, uint64_t> last_snapshot_;
};

} // namespace stageflow::state
