#include "internal/core/run_registry.hpp"

#include "internal/util/errors.hpp"

namespace stageflow::core {

void RunRegistry::Add(std::shared_ptr<RunOrchestrator> run) {
  std::lock_guard lock(mutex_);
  const auto& run_id = run->run_id();
  if (auto it = runs_.find(run_id); it != runs_.end() && !it->second->Done()) {
    throw util::AlreadyExists("run " + run_id + " is already active");
  }
  runs_[run_id] = std::move(run);
}

std::shared_ptr<RunOrchestrator> RunRegistry::Find(const std::string& run_id) const {
  std::lock_guard lock(mutex_);
  auto            it = runs_.find(run_id);
  return it == runs_.end() ? nullptr : it->second;
}

void RunRegistry::Remove(const std::string& run_id) {
  std::lock_guard lock(mutex_);
  runs_.erase(run_id);
}

std::vector<std::shared_ptr<RunOrchestrator>> RunRegistry::List() const {
  std::lock_guard                               lock(mutex_);
  std::vector<std::shared_ptr<RunOrchestrator>> out;
  out.reserve(runs_.size());
  for (const auto& [_, run] : runs_) out.push_back(run);
  return out;
}

std::size_t RunRegistry::ReapFinished() {
  std::vector<std::shared_ptr<RunOrchestrator>> finished;
  {
    std::lock_guard lock(mutex_);
    for (auto it = runs_.begin(); it != runs_.end();) {
      if (it->second->Done()) {
        finished.push_back(std::move(it->second));
        it = runs_.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Joining happens outside the lock.
  for (auto& run : finished) run->Stop();
  return finished.size();
}

std::size_t RunRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return runs_.size();
}

} // namespace stageflow::core
