#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/stage/stage_handler.hpp"

namespace stageflow::core {

// Reported by a worker when its attempt ends, successfully or not.
struct AttemptFinished {
  std::string stage_id;
  uint32_t    attempt = 0;

  std::optional<stage::StageOutcome> outcome;

  std::string error;
  bool        retryable = false;
  bool        cancelled = false;

  uint64_t duration_ms = 0;
};

struct FeedbackRequest {
  std::string stage_id;
  std::string selection;
};

struct CancelRequest {
  std::string reason;
};

struct PauseRequest {
  std::string reason;
};

struct ResumeRequest {};

struct SkipRequest {
  std::string stage_id;
};

// Process shutdown: leave the run resumable, append nothing.
struct StopRequest {};

using ControlRequest = std::variant<FeedbackRequest, CancelRequest, PauseRequest, ResumeRequest, SkipRequest, StopRequest>;

struct ControlMessage {
  ControlRequest                      request;
  std::shared_ptr<std::promise<void>> done;
};

using RunMessage = std::variant<AttemptFinished, ControlMessage>;

/*
  Inbox of a run's loop thread. Workers and control calls post here; only
  the loop pops.
*/
class Mailbox {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  // false once closed.
  bool Post(RunMessage message);

  // Waits until a message arrives or the deadline passes.
  std::optional<RunMessage> PopUntil(std::optional<Deadline> deadline);

  // Refuses further posts and hands back what was never popped.
  std::vector<RunMessage> Close();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<RunMessage>  queue_;
  bool                    closed_ = false;
};

} // namespace stageflow::core
