#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/run_record.hpp"
#include "stageflow/events/v1/event.pb.h"

namespace stageflow::events {

using stageflow::events::v1::Event;

constexpr uint64_t kEndOfLog = std::numeric_limits<uint64_t>::max();

/*
  Durable event sink.

  Append returns only once the events are durable. A batch is atomic.
  Every failure is reported as util::EventSinkError; callers treat it as
  fatal for the run.

  The sink also keeps the run catalog, including the parent pointer of
  branched runs. It knows nothing about branch replay.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Append(const std::string& run_id, const std::vector<Event>& events) = 0;

  // Own events of the run with from <= sequence <= to, contiguous.
  virtual std::vector<Event> ReadFrom(const std::string& run_id, uint64_t from_sequence, uint64_t to_sequence = kEndOfLog) = 0;

  virtual std::optional<Event> ReadLatestSnapshot(const std::string& run_id, uint64_t max_sequence = kEndOfLog) = 0;

  // 0 for a run without own events.
  virtual uint64_t LastSequence(const std::string& run_id) = 0;

  // Throws util::AlreadyExists for a duplicate run id.
  virtual void CreateRun(const db::model::RunRecord& record) = 0;

  virtual std::optional<db::model::RunRecord> FindRun(const std::string& run_id) = 0;

  virtual std::vector<db::model::RunRecord> ListRuns() = 0;
};

} // namespace stageflow::events
