#include "internal/state/state_store.hpp"

#include <algorithm>

#include "internal/events/event_types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/projector.hpp"
#include "internal/state/run_state_util.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::state {

using stageflow::core::v1::RunState;
using stageflow::events::v1::Event;
using stageflow::observability::IntField;
using stageflow::observability::StringField;

StateStore::StateStore(std::shared_ptr<events::EventSink> sink, std::shared_ptr<const util::ClockSource> clock,
                       uint64_t snapshot_interval)
    : sink_(std::move(sink)), clock_(std::move(clock)), snapshot_interval_(snapshot_interval ? snapshot_interval : 1) {
}

// ------------------------------------------------------------
// Creation
// ------------------------------------------------------------

RunState StateStore::CreateRun(const std::string& run_id, const stageflow::events::v1::RunCreated& created) {
  const auto now = clock_->Now();

  db::model::RunRecord record;
  record.run_id           = run_id;
  record.template_id      = created.template_id();
  record.template_version = created.template_version();
  record.isolation_scope  = created.isolation_scope();
  record.created_at_ms    = util::ToUnixMillis(now);
  sink_->CreateRun(record);

  Event event;
  *event.mutable_run_created() = created;

  RunState state;
  state.set_run_id(run_id);
  Append(state, {std::move(event)});
  return state;
}

RunState StateStore::CreateBranch(const std::string& parent_run_id, uint64_t sequence, const std::string& child_run_id) {
  const auto parent = RequireRun(parent_run_id);
  auto       at     = Rebuild(parent, sequence);

  if (at.sequence() < sequence) {
    throw util::InvalidState("run " + parent_run_id + " has no sequence " + std::to_string(sequence));
  }
  if (at.run_id().empty()) {
    throw util::InvalidState("cannot branch run " + parent_run_id + " before it was created");
  }
  if (IsTerminal(at.status())) {
    throw util::InvalidState("run " + parent_run_id + " is " + std::string(RunStatusName(at.status())) + " at sequence " +
                             std::to_string(sequence));
  }

  db::model::RunRecord record;
  record.run_id           = child_run_id;
  record.template_id      = parent.template_id;
  record.template_version = parent.template_version;
  record.isolation_scope  = parent.isolation_scope;
  record.parent_run_id    = parent_run_id;
  record.branch_sequence  = sequence;
  record.created_at_ms    = util::ToUnixMillis(clock_->Now());
  sink_->CreateRun(record);

  at.set_run_id(child_run_id);
  at.set_parent_run_id(parent_run_id);
  at.set_branch_sequence(sequence);

  NoteSnapshot(child_run_id, sequence);

  STAGEFLOW_LOG_INFO("Run branched", {StringField("run_id", child_run_id), StringField("parent_run_id", parent_run_id),
                                      IntField("sequence", static_cast<int64_t>(sequence))});
  return at;
}

// ------------------------------------------------------------
// Append
// ------------------------------------------------------------

std::vector<Event> StateStore::Append(RunState& state, std::vector<Event> batch) {
  if (batch.empty()) return batch;

  if (state.run_id().empty()) throw util::InvalidState("append to a state without run id");

  const auto  recorded_at = util::ToProto(clock_->Now());
  const auto& target      = state.run_id();

  uint64_t sequence = state.sequence();
  bool     terminal = false;

  for (auto& event : batch) {
    event.set_run_id(target);
    event.set_sequence(++sequence);
    *event.mutable_recorded_at() = recorded_at;
    terminal                     = terminal || events::IsTerminalEvent(event);
  }

  // Fold into a copy so a failed append leaves the caller's state untouched.
  RunState next = state;
  Projector::Replay(next, batch);

  if (SnapshotDue(next, terminal)) {
    Event snapshot;
    snapshot.set_run_id(target);
    snapshot.set_sequence(next.sequence() + 1);
    *snapshot.mutable_recorded_at() = recorded_at;

    auto* snap_state = snapshot.mutable_state_snapshot()->mutable_state();
    *snap_state      = next;
    snap_state->set_sequence(snapshot.sequence());

    Projector::Apply(next, snapshot);
    batch.push_back(std::move(snapshot));
  }

  sink_->Append(target, batch);

  if (batch.back().has_state_snapshot()) NoteSnapshot(target, batch.back().sequence());
  state = std::move(next);
  return batch;
}

bool StateStore::SnapshotDue(const RunState& state, bool terminal) {
  if (terminal) return true;
  std::lock_guard lock(mutex_);
  const auto      it   = last_snapshot_.find(state.run_id());
  const uint64_t  last = it == last_snapshot_.end() ? 0 : it->second;
  return state.sequence() - last >= snapshot_interval_;
}

void StateStore::NoteSnapshot(const std::string& run_id, uint64_t sequence) {
  std::lock_guard lock(mutex_);
  last_snapshot_[run_id] = sequence;
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

db::model::RunRecord StateStore::RequireRun(const std::string& run_id) {
  auto record = sink_->FindRun(run_id);
  if (!record) throw util::NotFound("run " + run_id);
  return *record;
}

RunState StateStore::Rebuild(const db::model::RunRecord& record, uint64_t sequence) {
  RunState state;
  uint64_t first_own = 1;

  if (!record.parent_run_id.empty()) {
    state = Rebuild(RequireRun(record.parent_run_id), std::min(sequence, record.branch_sequence));
    state.set_run_id(record.run_id);
    state.set_parent_run_id(record.parent_run_id);
    state.set_branch_sequence(record.branch_sequence);
    if (sequence <= record.branch_sequence) return state;
    first_own = record.branch_sequence + 1;
  }

  if (auto snapshot = sink_->ReadLatestSnapshot(record.run_id, sequence)) {
    Projector::Apply(state, *snapshot);
    first_own = snapshot->sequence() + 1;
  }

  Projector::Replay(state, sink_->ReadFrom(record.run_id, first_own, sequence));
  return state;
}

RunState StateStore::Load(const std::string& run_id) {
  const auto record = RequireRun(run_id);
  auto       state  = Rebuild(record, events::kEndOfLog);

  // Resume the snapshot cadence where the log left it.
  uint64_t last = record.parent_run_id.empty() ? 0 : record.branch_sequence;
  if (auto snapshot = sink_->ReadLatestSnapshot(run_id, events::kEndOfLog)) last = snapshot->sequence();
  NoteSnapshot(run_id, std::min(last, state.sequence()));
  return state;
}

RunState StateStore::LoadAt(const std::string& run_id, uint64_t sequence) {
  return Rebuild(RequireRun(run_id), sequence);
}

std::vector<Event> StateStore::ReadEvents(const std::string& run_id, uint64_t from_sequence, uint64_t to_sequence) {
  const auto         record = RequireRun(run_id);
  std::vector<Event> out;

  if (!record.parent_run_id.empty() && from_sequence <= record.branch_sequence) {
    out = ReadEvents(record.parent_run_id, from_sequence, std::min(to_sequence, record.branch_sequence));
  }
  auto own = sink_->ReadFrom(run_id, from_sequence, to_sequence);
  out.insert(out.end(), std::make_move_iterator(own.begin()), std::make_move_iterator(own.end()));
  return out;
}

std::vector<db::model::RunRecord> StateStore::ListRuns() {
  return sink_->ListRuns();
}

} // namespace stageflow::state
