#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace stageflow::config {

constexpr uint32_t kDefaultMaxConcurrentStages  = 4;
constexpr uint32_t kDefaultSnapshotInterval     = 50;
constexpr int64_t  kDefaultCancelTimeoutSeconds = 5;
constexpr uint32_t kDefaultMaxAttempts          = 3;
constexpr uint64_t kDefaultInitialBackoffMs     = 1000;
constexpr uint64_t kDefaultMaxBackoffMs         = 30000;
constexpr double   kDefaultBackoffMultiplier    = 2.0;
constexpr uint32_t kDefaultCacheCapacity        = 1000;
constexpr int64_t  kDefaultCacheTtlSeconds      = 24 * 60 * 60;
constexpr uint32_t kDefaultWriteQueueLimit      = 4096;
constexpr uint32_t kDefaultChunkWords           = 4;

/*
  Loads RuntimeConfig from a YAML file.

  The YAML tree is rewritten as a google.protobuf.Value, printed as JSON
  and parsed into RuntimeConfig, so field names follow the proto (snake
  case or lowerCamel) and durations are strings such as "5s". Unknown
  keys are an error. Unset fields get the defaults above, then the
  result is validated.
*/
class ConfigLoader {
 public:
  static stageflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // In-memory database, default tuning.
  static stageflow::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(stageflow::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the first offending field.
  static void Validate(const stageflow::runtime::config::RuntimeConfig& config);
};

} // namespace stageflow::config
