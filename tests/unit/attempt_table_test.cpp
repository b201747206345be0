#include "internal/flight/attempt_table.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using stageflow::flight::AttemptLease;
using stageflow::flight::AttemptTable;

bool Conflicts(AttemptTable& table, const std::string& run, const std::string& stage, uint32_t attempt) {
  try {
    auto lease = table.Acquire(run, stage, attempt);
  } catch (const stageflow::util::AttemptConflict&) {
    return true;
  }
  return false;
}

void TestAttemptIsAcquiredOnce() {
  AttemptTable table;
  {
    auto lease = table.Acquire("run", "outline", 1);
    assert(lease.Held());
    assert(table.IsActive("run", "outline", 1));
    assert(table.ActiveCount("run") == 1);
    assert(Conflicts(table, "run", "outline", 1));
  }
  assert(!table.IsActive("run", "outline", 1));
  assert(table.ActiveCount("run") == 0);

  // Finished attempts stay claimed; the next attempt number is free.
  assert(Conflicts(table, "run", "outline", 1));
  auto next = table.Acquire("run", "outline", 2);
  assert(next.Held());

  // Other runs and stages are independent.
  auto other_stage = table.Acquire("run", "draft", 1);
  auto other_run   = table.Acquire("run-2", "outline", 1);
  assert(table.ActiveCount("run") == 2);
  assert(table.ActiveCount("run-2") == 1);
}

void TestLeaseMovesAndReleasesOnce() {
  AttemptTable table;
  auto         lease = table.Acquire("run", "a", 1);

  AttemptLease moved = std::move(lease);
  assert(!lease.Held());
  assert(moved.Held());
  assert(table.IsActive("run", "a", 1));

  moved.Release();
  assert(!moved.Held());
  assert(!table.IsActive("run", "a", 1));
  moved.Release();
}

void TestForgetRunKeepsActiveAttempts() {
  AttemptTable table;
  {
    auto done = table.Acquire("run", "a", 1);
  }
  auto running = table.Acquire("run", "b", 1);

  table.ForgetRun("run");
  auto again = table.Acquire("run", "a", 1);
  assert(again.Held());
  assert(Conflicts(table, "run", "b", 1));
}

void TestConcurrentAcquireHasOneWinner() {
  AttemptTable              table;
  std::atomic<int>          winners{0};
  std::atomic<int>          conflicts{0};
  std::vector<AttemptLease> held(8);
  std::vector<std::thread>  threads;

  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        held[i] = table.Acquire("run", "hot", 1);
        winners++;
      } catch (const stageflow::util::AttemptConflict&) {
        conflicts++;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
  assert(conflicts == 7);
}

} // namespace

int main() {
  TestAttemptIsAcquiredOnce();
  TestLeaseMovesAndReleasesOnce();
  TestForgetRunKeepsActiveAttempts();
  TestConcurrentAcquireHasOneWinner();

  std::cout << "stageflow_unit_attempt_table: pass\n";
  return 0;
}
