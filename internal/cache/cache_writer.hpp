#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>

#include "stageflow/cache/v1/cache_entry.pb.h"

namespace stageflow::cache {

// A Tier 2 write waiting for the background worker.
struct WriteTask {
  stageflow::cache::v1::CacheEntry entry;
  std::chrono::milliseconds        ttl{0};

  // Invalidation epoch current when the write was queued.
  uint64_t epoch = 0;
};

/*
  Bounded blocking queue of cache writes.

  A task counts as pending from Enqueue until the worker reports it
  Done, so WaitIdle covers writes already dequeued.
*/
class WriteQueue {
 public:
  explicit WriteQueue(std::size_t limit);

  // false when the queue is full or shut down.
  bool Enqueue(WriteTask task);

  // blocking wait
  std::optional<WriteTask> Dequeue();

  void Done();

  void WaitIdle();

  std::size_t Pending() const;

  void Shutdown();

 private:
  std::size_t limit_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<WriteTask>   queue_;
  std::size_t             pending_  = 0;
  bool                    shutdown_ = false;
};

/*
  Background worker draining the write queue into Tier 2.

  Handler exceptions are logged and dropped: a lost write only costs a
  future cache miss.
*/
class CacheWriter {
 public:
  using Handler = std::function<void(const WriteTask&)>;

  CacheWriter(std::size_t queue_limit, Handler handler);
  ~CacheWriter();

  void Start();
  void Stop();

  bool Submit(WriteTask task);

  void Flush();

  std::size_t Pending() const;

 private:
  void Run();

  WriteQueue  queue_;
  Handler     handler_;
  std::thread thread_;
};

} // namespace stageflow::cache
