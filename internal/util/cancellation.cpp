#include "internal/util/cancellation.hpp"

#include "internal/util/errors.hpp"

namespace stageflow::util {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout, [&] { return state_->cancelled; });
}

void CancellationToken::ThrowIfCancelled(const std::string& what) const {
  if (IsCancelled()) {
    throw Cancelled(what + " cancelled");
  }
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {
}

void CancellationSource::Cancel() {
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationSource::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(state_);
}

} // namespace stageflow::util
