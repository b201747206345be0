#pragma once

#include <cstdint>
#include <string>

namespace stageflow::db::model {

struct TemplateRecord {
  std::string template_id;
  std::string version;
  std::string payload;
  std::string content_digest;
  uint64_t    created_at_ms = 0;
};

} // namespace stageflow::db::model
