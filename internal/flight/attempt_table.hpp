#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

namespace stageflow::flight {

struct AttemptKey {
  std::string run_id;
  std::string stage_id;
  uint32_t    attempt = 0;

  bool operator<(const AttemptKey& other) const {
    return std::tie(run_id, stage_id, attempt) < std::tie(other.run_id, other.stage_id, other.attempt);
  }
};

class AttemptTable;

// Held for the lifetime of an attempt. Releases on destruction.
class AttemptLease {
 public:
  AttemptLease() = default;
  AttemptLease(AttemptTable* table, AttemptKey key);
  ~AttemptLease();

  AttemptLease(const AttemptLease&)            = delete;
  AttemptLease& operator=(const AttemptLease&) = delete;

  AttemptLease(AttemptLease&& other) noexcept;
  AttemptLease& operator=(AttemptLease&& other) noexcept;

  void Release();

  bool Held() const {
    return table_ != nullptr;
  }

  const AttemptKey& key() const {
    return key_;
  }

 private:
  AttemptTable* table_ = nullptr;
  AttemptKey    key_;
};

/*
  Single-flight table keyed by (run id, stage id, attempt).

  An attempt can be acquired once. A second acquisition, concurrent or
  after release, throws util::AttemptConflict until the run is forgotten.
*/
class AttemptTable {
 public:
  AttemptLease Acquire(const std::string& run_id, const std::string& stage_id, uint32_t attempt);

  bool        IsActive(const std::string& run_id, const std::string& stage_id, uint32_t attempt) const;
  std::size_t ActiveCount(const std::string& run_id) const;

  void ForgetRun(const std::string& run_id);

 private:
  friend class AttemptLease;

  void Release(const AttemptKey& key);

  enum class State { kActive, kFinished };

  mutable std::mutex          mutex_;
  std::map<AttemptKey, State> attempts_;
};

} // namespace stageflow::flight
