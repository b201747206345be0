#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"

namespace stageflow::events {

/*
  EventSink over the repository.

  Reads stop at the first record that does not parse or breaks the
  sequence. That record and everything after it is a torn tail from an
  interrupted write: it is truncated from the repository and a warning is
  logged, so the next append continues from the last good sequence.
*/
class RepositoryEventSink final : public EventSink {
 public:
  explicit RepositoryEventSink(std::shared_ptr<db::Repository> repository);

  void Append(const std::string& run_id, const std::vector<Event>& events) override;

  std::vector<Event> ReadFrom(const std::string& run_id, uint64_t from_sequence, uint64_t to_sequence) override;

  std::optional<Event> ReadLatestSnapshot(const std::string& run_id, uint64_t max_sequence) override;

  uint64_t LastSequence(const std::string& run_id) override;

  void CreateRun(const db::model::RunRecord& record) override;

  std::optional<db::model::RunRecord> FindRun(const std::string& run_id) override;

  std::vector<db::model::RunRecord> ListRuns() override;

 private:
  void TruncateTail(const std::string& run_id, uint64_t from_sequence, const std::string& why);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace stageflow::events
