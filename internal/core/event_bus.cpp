#include "internal/core/event_bus.hpp"

#include <algorithm>

namespace stageflow::core {

// ------------------------------------------------------------
// Subscription
// ------------------------------------------------------------

Subscription::Subscription(std::string run_id) : run_id_(std::move(run_id)) {
}

std::optional<RunUpdate> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return std::nullopt;

  RunUpdate update = std::move(queue_.front());
  queue_.pop_front();
  return update;
}

std::optional<RunUpdate> Subscription::Next() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return std::nullopt;

  RunUpdate update = std::move(queue_.front());
  queue_.pop_front();
  return update;
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_ && queue_.empty();
}

void Subscription::Push(const RunUpdate& update) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    queue_.push_back(update);
  }
  cv_.notify_all();
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

// ------------------------------------------------------------
// EventBus
// ------------------------------------------------------------

std::shared_ptr<Subscription> EventBus::Subscribe(const std::string& run_id) {
  auto            subscription = std::make_shared<Subscription>(run_id);
  std::lock_guard lock(mutex_);
  subscribers_[run_id].push_back(subscription);
  return subscription;
}

void EventBus::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(subscription->run_id());
    if (it != subscribers_.end()) {
      auto& list = it->second;
      list.erase(std::remove(list.begin(), list.end(), subscription), list.end());
      if (list.empty()) subscribers_.erase(it);
    }
  }
  subscription->Close();
}

void EventBus::Publish(const std::string& run_id, const RunUpdate& update) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(run_id);
    if (it == subscribers_.end()) return;
    targets = it->second;
  }
  for (const auto& subscription : targets) subscription->Push(update);
}

void EventBus::CloseRun(const std::string& run_id) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(run_id);
    if (it == subscribers_.end()) return;
    targets = std::move(it->second);
    subscribers_.erase(it);
  }
  for (const auto& subscription : targets) subscription->Close();
}

std::size_t EventBus::SubscriberCount(const std::string& run_id) const {
  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(run_id);
  return it == subscribers_.end() ? 0 : it->second.size();
}

} // namespace stageflow::core
