#pragma once

#include <stdexcept>
#include <string>

namespace stageflow::util {

/*
  Central error types.

  Stage level errors are caught by the orchestrator and turned into
  events. Everything else propagates to the caller of the control surface.
*/

// Template rejected at load time (cycle, unknown dependency, bad reference).
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StageExecutionError : public std::runtime_error {
 public:
  explicit StageExecutionError(const std::string& msg, bool retryable = true) : std::runtime_error(msg), retryable_(retryable) {
  }

  bool retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

class DependencyUnsatisfiable : public std::runtime_error {
 public:
  explicit DependencyUnsatisfiable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persistent cache tier failure. Never fails a stage.
class CacheBackendError : public std::runtime_error {
 public:
  explicit CacheBackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable event log failure. Fatal for the run.
class EventSinkError : public std::runtime_error {
 public:
  explicit EventSinkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AttemptConflict : public std::runtime_error {
 public:
  explicit AttemptConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace stageflow::util
