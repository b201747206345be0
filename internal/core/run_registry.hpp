#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/run_orchestrator.hpp"

namespace stageflow::core {

/*
  Live orchestrators by run id. Owned by the composition root; a run is
  in here from start until its loop has finished and it was reaped.
*/
class RunRegistry {
 public:
  // Throws AlreadyExists when the run already has a live orchestrator.
  void Add(std::shared_ptr<RunOrchestrator> run);

  std::shared_ptr<RunOrchestrator> Find(const std::string& run_id) const;

  void Remove(const std::string& run_id);

  std::vector<std::shared_ptr<RunOrchestrator>> List() const;

  // Drops orchestrators whose loop has finished.
  std::size_t ReapFinished();

  std::size_t Size() const;

 private:
  mutable std::mutex                                      mutex_;
  std::map<std::string, std::shared_ptr<RunOrchestrator>> runs_;
};

} // namespace stageflow::core
