#include "internal/flight/attempt_table.hpp"

#include "internal/util/errors.hpp"

namespace stageflow::flight {

namespace {

std::string Describe(const AttemptKey& key) {
  return key.run_id + "/" + key.stage_id + "#" + std::to_string(key.attempt);
}

} // namespace

// ------------------------------------------------------------
// AttemptLease
// ------------------------------------------------------------

AttemptLease::AttemptLease(AttemptTable* table, AttemptKey key) : table_(table), key_(std::move(key)) {
}

AttemptLease::~AttemptLease() {
  Release();
}

AttemptLease::AttemptLease(AttemptLease&& other) noexcept : table_(other.table_), key_(std::move(other.key_)) {
  other.table_ = nullptr;
}

AttemptLease& AttemptLease::operator=(AttemptLease&& other) noexcept {
  if (this != &other) {
    Release();
    table_       = other.table_;
    key_         = std::move(other.key_);
    other.table_ = nullptr;
  }
  return *this;
}

void AttemptLease::Release() {
  if (!table_) return;
  table_->Release(key_);
  table_ = nullptr;
}

// ------------------------------------------------------------
// AttemptTable
// ------------------------------------------------------------

AttemptLease AttemptTable::Acquire(const std::string& run_id, const std::string& stage_id, uint32_t attempt) {
  AttemptKey key{run_id, stage_id, attempt};

  std::lock_guard lock(mutex_);
  auto [it, inserted] = attempts_.emplace(key, State::kActive);
  if (!inserted) {
    throw util::AttemptConflict("attempt " + Describe(key) +
                                (it->second == State::kActive ? " is already running" : " was already started"));
  }
  return AttemptLease(this, std::move(key));
}

void AttemptTable::Release(const AttemptKey& key) {
  std::lock_guard lock(mutex_);
  auto            it = attempts_.find(key);
  if (it != attempts_.end()) it->second = State::kFinished;
}

bool AttemptTable::IsActive(const std::string& run_id, const std::string& stage_id, uint32_t attempt) const {
  std::lock_guard lock(mutex_);
  auto            it = attempts_.find(AttemptKey{run_id, stage_id, attempt});
  return it != attempts_.end() && it->second == State::kActive;
}

std::size_t AttemptTable::ActiveCount(const std::string& run_id) const {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (auto it = attempts_.lower_bound(AttemptKey{run_id, "", 0}); it != attempts_.end() && it->first.run_id == run_id; ++it) {
    if (it->second == State::kActive) ++count;
  }
  return count;
}

void AttemptTable::ForgetRun(const std::string& run_id) {
  std::lock_guard lock(mutex_);
  for (auto it = attempts_.lower_bound(AttemptKey{run_id, "", 0}); it != attempts_.end() && it->first.run_id == run_id;) {
    if (it->second == State::kActive) {
      ++it;
      continue;
    }
    it = attempts_.erase(it);
  }
}

} // namespace stageflow::flight
