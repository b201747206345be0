#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace stageflow::db::memory {

/*
  Transaction = exclusive repository lock + undo journal.

  Writes apply in place; Rollback replays the journal in reverse.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return repo_.state_;
  }
  const MemoryRepository::State& View() const {
    return repo_.state_;
  }

  void Journal(Undo undo);

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  std::vector<Undo>            undo_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace stageflow::db::memory
