#include "internal/db/memory/memory_tx.hpp"

#include <stdexcept>

namespace stageflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Journal(Undo undo) {
  if (finished_) {
    throw std::logic_error("write on a finished memory transaction");
  }
  undo_.push_back(std::move(undo));
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("memory transaction already finished");
  }
  undo_.clear();
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_.clear();
  finished_ = true;
  lock_.unlock();
}

} // namespace stageflow::db::memory
