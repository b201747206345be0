#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stageflow/events/v1/event.pb.h"

namespace stageflow::core {

using stageflow::events::v1::RunUpdate;

/*
  Live feed of one run: appended events and streamed stage chunks, in
  the order they were published. StateSnapshot events are not
  published, so the last event of a finished run is its terminal run
  event. Updates published before Subscribe() are not replayed; history
  is read from the event log.
*/
class Subscription {
 public:
  explicit Subscription(std::string run_id);

  // nullopt on timeout or once closed and drained.
  std::optional<RunUpdate> Next(std::chrono::milliseconds timeout);

  // Blocks until an update arrives or the stream ends.
  std::optional<RunUpdate> Next();

  bool Closed() const;

  const std::string& run_id() const {
    return run_id_;
  }

 private:
  friend class EventBus;

  void Push(const RunUpdate& update);
  void Close();

  std::string run_id_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<RunUpdate>   queue_;
  bool                    closed_ = false;
};

class EventBus {
 public:
  std::shared_ptr<Subscription> Subscribe(const std::string& run_id);

  void Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  void Publish(const std::string& run_id, const RunUpdate& update);

  // Ends every stream of the run.
  void CloseRun(const std::string& run_id);

  std::size_t SubscriberCount(const std::string& run_id) const;

 private:
  mutable std::mutex                                                   mutex_;
  std::map<std::string, std::vector<std::shared_ptr<Subscription>>> subscribers_;
};

} // namespace stageflow::core
