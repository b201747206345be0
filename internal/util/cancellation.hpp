#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace stageflow::util {

/*
  Cooperative cancellation.

  A CancellationSource owns the flag; tokens are cheap copies observed by
  workers. WaitFor doubles as an interruptible sleep for retry backoff.
*/

class CancellationToken {
 public:
  CancellationToken();

  bool IsCancelled() const;

  // Returns true if cancelled before the timeout elapsed.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Throws Cancelled when the token is cancelled.
  void ThrowIfCancelled(const std::string& what) const;

 private:
  friend class CancellationSource;

  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled{false};
  };

  explicit CancellationToken(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

class CancellationSource {
 public:
  CancellationSource();

  void Cancel();
  bool IsCancelled() const;

  CancellationToken Token() const;

 private:
  std::shared_ptr<CancellationToken::State> state_;
};

} // namespace stageflow::util
