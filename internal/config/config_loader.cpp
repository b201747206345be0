#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace stageflow::config {

namespace {

// Plain scalars are typed the way YAML 1.2 core schema reads them;
// quoted scalars (tag "!") always stay strings so that `version: "1"`
// is not turned into a number.
void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) NodeToValue(item, list->add_values());
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) NodeToValue(entry.second, &fields[entry.first.Scalar()]);
      return;
    }
  }
}

[[noreturn]] void Reject(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

stageflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  NodeToValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  stageflow::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

stageflow::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  stageflow::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_cache()->set_persistent_enabled(true);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(stageflow::runtime::config::RuntimeConfig& config) {
  if (config.database().backend_case() == stageflow::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* orchestrator = config.mutable_orchestrator();
  if (orchestrator->max_concurrent_stages() == 0) {
    orchestrator->set_max_concurrent_stages(kDefaultMaxConcurrentStages);
  }
  if (orchestrator->snapshot_interval() == 0) {
    orchestrator->set_snapshot_interval(kDefaultSnapshotInterval);
  }
  if (!orchestrator->has_cancel_timeout()) {
    orchestrator->mutable_cancel_timeout()->set_seconds(kDefaultCancelTimeoutSeconds);
  }
  if (orchestrator->isolation_scope().empty()) {
    orchestrator->set_isolation_scope("default");
  }

  auto* retry = orchestrator->mutable_default_retry();
  if (retry->max_attempts() == 0) {
    retry->set_max_attempts(kDefaultMaxAttempts);
  }
  if (retry->initial_backoff_ms() == 0) {
    retry->set_initial_backoff_ms(kDefaultInitialBackoffMs);
  }
  if (retry->max_backoff_ms() == 0) {
    retry->set_max_backoff_ms(kDefaultMaxBackoffMs);
  }
  if (retry->backoff_multiplier() <= 0.0) {
    retry->set_backoff_multiplier(kDefaultBackoffMultiplier);
  }

  auto* cache = config.mutable_cache();
  if (cache->memory_capacity() == 0) {
    cache->set_memory_capacity(kDefaultCacheCapacity);
  }
  if (!cache->has_ttl()) {
    cache->mutable_ttl()->set_seconds(kDefaultCacheTtlSeconds);
  }
  if (cache->write_queue_limit() == 0) {
    cache->set_write_queue_limit(kDefaultWriteQueueLimit);
  }

  auto* generation = config.mutable_generation();
  if (generation->chunk_words() == 0) {
    generation->set_chunk_words(kDefaultChunkWords);
  }
}

void ConfigLoader::Validate(const stageflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) Reject("database.sqlite.path is empty");
  if (database.has_postgres() && database.postgres().connection_uri().empty()) Reject("database.postgres.connection_uri is empty");

  const auto& orchestrator = config.orchestrator();
  if (orchestrator.cancel_timeout().seconds() < 0 || orchestrator.cancel_timeout().nanos() < 0) {
    Reject("orchestrator.cancel_timeout is negative");
  }

  const auto& retry = orchestrator.default_retry();
  if (retry.backoff_multiplier() < 1.0) Reject("orchestrator.default_retry.backoff_multiplier must be at least 1");
  if (retry.max_backoff_ms() < retry.initial_backoff_ms()) {
    Reject("orchestrator.default_retry.max_backoff_ms is below initial_backoff_ms");
  }

  const auto& ttl = config.cache().ttl();
  if (ttl.seconds() < 0 || (ttl.seconds() == 0 && ttl.nanos() <= 0)) Reject("cache.ttl must be positive");
}

} // namespace stageflow::config
