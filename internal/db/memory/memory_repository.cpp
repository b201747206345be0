#include "internal/db/memory/memory_repository.hpp"

#include <algorithm>

#include "internal/db/memory/memory_tx.hpp"

namespace stageflow::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Runs
// ------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.runs.contains(r.run_id)) return Result::Err(ErrorCode::AlreadyExists, "run " + r.run_id);
  s.runs[r.run_id] = r;
  TX(t).Journal([id = r.run_id](State& state) { state.runs.erase(id); });
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(run_id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RunRecord> MemoryRepository::ListRuns(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::RunRecord> records;
  records.reserve(s.runs.size());
  for (const auto& [_, record] : s.runs) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.run_id < b.run_id;
  });
  return records;
}

// ------------------------------------------------------------
// Event log
// ------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  uint64_t last = LastSequence(t, r.run_id);
  if (last == 0) {
    // A branch continues after the parent prefix it shares.
    if (auto run = GetRun(t, r.run_id)) last = run->branch_sequence;
  }
  auto& log = TX(t).Mutable().events[r.run_id];
  if (r.sequence != last + 1) {
    return Result::Err(ErrorCode::Conflict, "expected sequence " + std::to_string(last + 1) + ", got " + std::to_string(r.sequence));
  }
  log.emplace(r.sequence, r);
  TX(t).Journal([id = r.run_id, seq = r.sequence](State& state) { state.events[id].erase(seq); });
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t from_sequence,
                                                             uint64_t to_sequence) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;
  auto                            it = s.events.find(run_id);
  if (it == s.events.end()) return out;

  for (auto e = it->second.lower_bound(from_sequence); e != it->second.end() && e->first <= to_sequence; ++e) {
    out.push_back(e->second);
  }
  return out;
}

std::optional<model::EventRecord> MemoryRepository::LatestSnapshot(Transaction& t, const std::string& run_id, uint64_t max_sequence) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(run_id);
  if (it == s.events.end()) return std::nullopt;

  auto& log = it->second;
  for (auto e = log.upper_bound(max_sequence); e != log.begin();) {
    --e;
    if (e->second.is_snapshot) return e->second;
  }
  return std::nullopt;
}

uint64_t MemoryRepository::LastSequence(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(run_id);
  if (it == s.events.end() || it->second.empty()) return 0;
  return it->second.rbegin()->first;
}

Result MemoryRepository::TruncateEvents(Transaction& t, const std::string& run_id, uint64_t from_sequence) {
  auto& s  = TX(t).Mutable();
  auto  it = s.events.find(run_id);
  if (it == s.events.end()) return Result::Ok();

  std::map<uint64_t, model::EventRecord> removed;
  auto                                   first = it->second.lower_bound(from_sequence);
  removed.insert(first, it->second.end());
  it->second.erase(first, it->second.end());

  TX(t).Journal([run_id, removed = std::move(removed)](State& state) { state.events[run_id].insert(removed.begin(), removed.end()); });
  return Result::Ok();
}

// ------------------------------------------------------------
// Cache
// ------------------------------------------------------------

Result MemoryRepository::PutCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto&                                  s = TX(t).Mutable();
  std::optional<model::CacheEntryRecord> previous;
  if (auto it = s.cache.find(r.cache_key); it != s.cache.end()) previous = it->second;

  s.cache[r.cache_key] = r;
  TX(t).Journal([key = r.cache_key, previous = std::move(previous)](State& state) {
    if (previous) {
      state.cache[key] = *previous;
    } else {
      state.cache.erase(key);
    }
  });
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& cache_key) {
  const auto& s  = TX(t).View();
  auto        it = s.cache.find(cache_key);
  if (it == s.cache.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& cache_key) {
  auto& s  = TX(t).Mutable();
  auto  it = s.cache.find(cache_key);
  if (it == s.cache.end()) return Result::Ok();

  auto previous = it->second;
  s.cache.erase(it);
  TX(t).Journal([previous = std::move(previous)](State& state) { state.cache[previous.cache_key] = previous; });
  return Result::Ok();
}

Result MemoryRepository::DeleteCacheScope(Transaction& t, const std::string& isolation_scope) {
  auto&                                s = TX(t).Mutable();
  std::vector<model::CacheEntryRecord> removed;
  for (auto it = s.cache.begin(); it != s.cache.end();) {
    if (it->second.isolation_scope == isolation_scope) {
      removed.push_back(it->second);
      it = s.cache.erase(it);
    } else {
      ++it;
    }
  }
  TX(t).Journal([removed = std::move(removed)](State& state) {
    for (const auto& r : removed) state.cache[r.cache_key] = r;
  });
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms, uint64_t& removed_count) {
  auto&                                s = TX(t).Mutable();
  std::vector<model::CacheEntryRecord> removed;
  for (auto it = s.cache.begin(); it != s.cache.end();) {
    if (it->second.expires_at_ms <= now_ms) {
      removed.push_back(it->second);
      it = s.cache.erase(it);
    } else {
      ++it;
    }
  }
  removed_count = removed.size();
  TX(t).Journal([removed = std::move(removed)](State& state) {
    for (const auto& r : removed) state.cache[r.cache_key] = r;
  });
  return Result::Ok();
}

// ------------------------------------------------------------
// Templates
// ------------------------------------------------------------

Result MemoryRepository::InsertTemplate(Transaction& t, const model::TemplateRecord& r) {
  auto& s   = TX(t).Mutable();
  auto  key = std::make_pair(r.template_id, r.version);
  if (s.templates.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "template " + r.template_id + "@" + r.version);
  s.templates[key] = r;
  TX(t).Journal([key](State& state) { state.templates.erase(key); });
  return Result::Ok();
}

std::optional<model::TemplateRecord> MemoryRepository::GetTemplate(Transaction& t, const std::string& template_id, const std::string& version) {
  const auto& s  = TX(t).View();
  auto        it = s.templates.find({template_id, version});
  if (it == s.templates.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TemplateRecord> MemoryRepository::ListTemplates(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::TemplateRecord> out;
  out.reserve(s.templates.size());
  for (const auto& [_, record] : s.templates) {
    out.push_back(record);
  }
  return out;
}

} // namespace stageflow::db::memory
