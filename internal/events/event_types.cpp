#include "internal/events/event_types.hpp"

namespace stageflow::events {

using stageflow::events::v1::Event;

std::string_view PayloadName(const Event& event) {
  switch (event.payload_case()) {
    case Event::kRunCreated:
      return "run_created";
    case Event::kRunStarted:
      return "run_started";
    case Event::kRunPaused:
      return "run_paused";
    case Event::kRunResumed:
      return "run_resumed";
    case Event::kStageStarted:
      return "stage_started";
    case Event::kStageCompleted:
      return "stage_completed";
    case Event::kStageFailed:
      return "stage_failed";
    case Event::kStageRetried:
      return "stage_retried";
    case Event::kStageAwaitingFeedback:
      return "stage_awaiting_feedback";
    case Event::kStageSkipped:
      return "stage_skipped";
    case Event::kUserFeedbackRecorded:
      return "user_feedback_recorded";
    case Event::kRunCompleted:
      return "run_completed";
    case Event::kRunFailed:
      return "run_failed";
    case Event::kRunCancelled:
      return "run_cancelled";
    case Event::kStateSnapshot:
      return "state_snapshot";
    case Event::PAYLOAD_NOT_SET:
      break;
  }
  return "unknown";
}

bool IsTerminalEvent(const Event& event) {
  return event.has_run_completed() || event.has_run_failed() || event.has_run_cancelled();
}

bool IsSnapshot(const Event& event) {
  return event.has_state_snapshot();
}

} // namespace stageflow::events
