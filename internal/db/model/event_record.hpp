#pragma once

#include <cstdint>
#include <string>

namespace stageflow::db::model {

/*
  One serialized event. The payload is opaque to the repository.
*/
struct EventRecord {
  std::string run_id;
  uint64_t    sequence = 0;
  std::string event_type;
  bool        is_snapshot = false;
  std::string payload;
  uint64_t    recorded_at_ms = 0;
};

} // namespace stageflow::db::model
