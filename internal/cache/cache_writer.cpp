#include "internal/cache/cache_writer.hpp"

#include "internal/observability/logging.hpp"

namespace stageflow::cache {

using stageflow::observability::StringField;

// ------------------------------------------------------------
// WriteQueue
// ------------------------------------------------------------

WriteQueue::WriteQueue(std::size_t limit) : limit_(limit ? limit : 1) {
}

bool WriteQueue::Enqueue(WriteTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= limit_) return false;
    queue_.push(std::move(task));
    ++pending_;
  }
  cv_.notify_one();
  return true;
}

std::optional<WriteTask> WriteQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  WriteTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void WriteQueue::Done() {
  {
    std::lock_guard lock(mutex_);
    if (pending_) --pending_;
  }
  idle_cv_.notify_all();
}

void WriteQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return pending_ == 0; });
}

std::size_t WriteQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return pending_;
}

void WriteQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

// ------------------------------------------------------------
// CacheWriter
// ------------------------------------------------------------

CacheWriter::CacheWriter(std::size_t queue_limit, Handler handler) : queue_(queue_limit), handler_(std::move(handler)) {
}

CacheWriter::~CacheWriter() {
  Stop();
}

void CacheWriter::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&CacheWriter::Run, this);
}

void CacheWriter::Stop() {
  queue_.Shutdown();
  if (thread_.joinable()) thread_.join();
}

bool CacheWriter::Submit(WriteTask task) {
  return queue_.Enqueue(std::move(task));
}

void CacheWriter::Flush() {
  if (!thread_.joinable()) return;
  queue_.WaitIdle();
}

std::size_t CacheWriter::Pending() const {
  return queue_.Pending();
}

void CacheWriter::Run() {
  for (;;) {
    auto task = queue_.Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      STAGEFLOW_LOG_WARN("Cache write failed", {StringField("key", task->entry.key()), StringField("error", e.what())});
    }
    queue_.Done();
  }
}

} // namespace stageflow::cache
