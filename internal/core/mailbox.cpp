#include "internal/core/mailbox.hpp"

namespace stageflow::core {

bool Mailbox::Post(RunMessage message) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    queue_.push_back(std::move(message));
  }
  cv_.notify_one();
  return true;
}

std::optional<RunMessage> Mailbox::PopUntil(std::optional<Deadline> deadline) {
  std::unique_lock lock(mutex_);

  auto ready = [&] { return !queue_.empty(); };
  if (deadline) {
    if (!cv_.wait_until(lock, *deadline, ready)) return std::nullopt;
  } else {
    cv_.wait(lock, ready);
  }

  RunMessage message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

std::vector<RunMessage> Mailbox::Close() {
  std::lock_guard         lock(mutex_);
  std::vector<RunMessage> rest(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  closed_ = true;
  return rest;
}

} // namespace stageflow::core
