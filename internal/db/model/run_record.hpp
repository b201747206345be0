#pragma once

#include <cstdint>
#include <string>

namespace stageflow::db::model {

struct RunRecord {
  std::string run_id;
  std::string template_id;
  std::string template_version;
  std::string isolation_scope;

  // Empty for root runs. A branch shares the parent log up to branch_sequence.
  std::string parent_run_id;
  uint64_t    branch_sequence = 0;

  uint64_t created_at_ms = 0;
};

} // namespace stageflow::db::model
