#include "internal/events/repository_event_sink.hpp"

#include <algorithm>

#include "internal/events/event_types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stageflow::events {

using stageflow::observability::IntField;
using stageflow::observability::StringField;

namespace {

[[noreturn]] void Fail(const std::string& what, const std::string& run_id, const std::exception& e) {
  throw util::EventSinkError(what + " for run " + run_id + ": " + e.what());
}

void Check(const db::Result& result, const std::string& what) {
  if (!result) throw util::EventSinkError(what + ": " + result.Describe());
}

} // namespace

RepositoryEventSink::RepositoryEventSink(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// ------------------------------------------------------------
// Append
// ------------------------------------------------------------

void RepositoryEventSink::Append(const std::string& run_id, const std::vector<Event>& events) {
  if (events.empty()) return;

  try {
    auto tx = repository_->Begin();
    for (const auto& event : events) {
      if (event.run_id() != run_id) {
        throw util::EventSinkError("event for run " + event.run_id() + " appended to run " + run_id);
      }

      db::model::EventRecord record;
      record.run_id         = run_id;
      record.sequence       = event.sequence();
      record.event_type     = std::string(PayloadName(event));
      record.is_snapshot    = IsSnapshot(event);
      record.recorded_at_ms = util::ToUnixMillis(util::FromProto(event.recorded_at()));
      if (!event.SerializeToString(&record.payload)) {
        throw util::EventSinkError("failed to serialize event " + std::to_string(event.sequence()));
      }

      Check(repository_->AppendEvent(*tx, record), "append sequence " + std::to_string(event.sequence()) + " to run " + run_id);
    }
    tx->Commit();
  } catch (const util::EventSinkError&) {
    throw;
  } catch (const std::exception& e) {
    Fail("append failed", run_id, e);
  }
}

// ------------------------------------------------------------
// Read
// ------------------------------------------------------------

std::vector<Event> RepositoryEventSink::ReadFrom(const std::string& run_id, uint64_t from_sequence, uint64_t to_sequence) {
  std::vector<Event>          out;
  std::vector<db::model::EventRecord> records;
  uint64_t                    first_own = 1;

  try {
    auto tx  = repository_->Begin();
    auto run = repository_->GetRun(*tx, run_id);
    if (run && !run->parent_run_id.empty()) first_own = run->branch_sequence + 1;
    records = repository_->ReadEvents(*tx, run_id, std::max(from_sequence, first_own), to_sequence);
    tx->Commit();
  } catch (const std::exception& e) {
    Fail("read failed", run_id, e);
  }

  uint64_t expected = std::max(from_sequence, first_own);
  for (const auto& record : records) {
    Event event;
    if (record.sequence != expected) {
      TruncateTail(run_id, std::min(record.sequence, expected), "sequence gap");
      break;
    }
    if (!event.ParseFromString(record.payload) || event.sequence() != record.sequence || event.run_id() != run_id ||
        event.payload_case() == Event::PAYLOAD_NOT_SET) {
      TruncateTail(run_id, record.sequence, "undeserializable record");
      break;
    }
    out.push_back(std::move(event));
    ++expected;
  }
  return out;
}

std::optional<Event> RepositoryEventSink::ReadLatestSnapshot(const std::string& run_id, uint64_t max_sequence) {
  std::optional<db::model::EventRecord> record;
  try {
    auto tx = repository_->Begin();
    record  = repository_->LatestSnapshot(*tx, run_id, max_sequence);
    tx->Commit();
  } catch (const std::exception& e) {
    Fail("snapshot read failed", run_id, e);
  }
  if (!record) return std::nullopt;

  Event event;
  if (!event.ParseFromString(record->payload) || !event.has_state_snapshot() || event.sequence() != record->sequence) {
    // A damaged snapshot only costs replay time.
    STAGEFLOW_LOG_WARN("Ignoring unreadable snapshot",
                       {StringField("run_id", run_id), IntField("sequence", static_cast<int64_t>(record->sequence))});
    return std::nullopt;
  }
  return event;
}

uint64_t RepositoryEventSink::LastSequence(const std::string& run_id) {
  try {
    auto tx   = repository_->Begin();
    auto last = repository_->LastSequence(*tx, run_id);
    tx->Commit();
    return last;
  } catch (const std::exception& e) {
    Fail("sequence lookup failed", run_id, e);
  }
}

void RepositoryEventSink::TruncateTail(const std::string& run_id, uint64_t from_sequence, const std::string& why) {
  STAGEFLOW_LOG_WARN("Truncating torn event log tail", {StringField("run_id", run_id),
                                                        IntField("from_sequence", static_cast<int64_t>(from_sequence)),
                                                        StringField("reason", why)});
  try {
    auto tx = repository_->Begin();
    Check(repository_->TruncateEvents(*tx, run_id, from_sequence), "truncate run " + run_id);
    tx->Commit();
  } catch (const util::EventSinkError&) {
    throw;
  } catch (const std::exception& e) {
    Fail("truncate failed", run_id, e);
  }
}

// ------------------------------------------------------------
// Run catalog
// ------------------------------------------------------------

void RepositoryEventSink::CreateRun(const db::model::RunRecord& record) {
  db::Result result;
  try {
    auto tx = repository_->Begin();
    result  = repository_->InsertRun(*tx, record);
    if (result) tx->Commit();
  } catch (const std::exception& e) {
    Fail("create failed", record.run_id, e);
  }
  if (result.code == db::ErrorCode::AlreadyExists) throw util::AlreadyExists("run " + record.run_id);
  Check(result, "create run " + record.run_id);
}

std::optional<db::model::RunRecord> RepositoryEventSink::FindRun(const std::string& run_id) {
  try {
    auto tx  = repository_->Begin();
    auto run = repository_->GetRun(*tx, run_id);
    tx->Commit();
    return run;
  } catch (const std::exception& e) {
    Fail("lookup failed", run_id, e);
  }
}

std::vector<db::model::RunRecord> RepositoryEventSink::ListRuns() {
  try {
    auto tx   = repository_->Begin();
    auto runs = repository_->ListRuns(*tx);
    tx->Commit();
    return runs;
  } catch (const std::exception& e) {
    throw util::EventSinkError(std::string("run listing failed: ") + e.what());
  }
}

} // namespace stageflow::events
