#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stageflow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\stageflow\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = stageflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\stageflow\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(orchestrator:
  isolation_scope: "line1\nline2☃"
)");

  auto config = stageflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.orchestrator().isolation_scope() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(orchestrator:
  max_concurrent_stages: 2
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)stageflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestDefaultsFillUnsetFields() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(orchestrator:
  max_concurrent_stages: 2
cache:
  persistent_enabled: false
)");

  auto config = stageflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.orchestrator().max_concurrent_stages() == 2);
  assert(config.orchestrator().snapshot_interval() == stageflow::config::kDefaultSnapshotInterval);
  assert(config.orchestrator().cancel_timeout().seconds() == stageflow::config::kDefaultCancelTimeoutSeconds);
  assert(config.orchestrator().default_retry().max_attempts() == stageflow::config::kDefaultMaxAttempts);
  assert(config.orchestrator().isolation_scope() == "default");
  assert(config.cache().memory_capacity() == stageflow::config::kDefaultCacheCapacity);
  assert(!config.cache().persistent_enabled());
}

void TestDurationsParse() {
  const auto yaml_path = WriteYaml("durations",
                                   R"(orchestrator:
  cancel_timeout: "1.5s"
cache:
  ttl: "3600s"
)");

  auto config = stageflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.orchestrator().cancel_timeout().seconds() == 1);
  assert(config.orchestrator().cancel_timeout().nanos() == 500000000);
  assert(config.cache().ttl().seconds() == 3600);
}

void TestBuiltInDefaults() {
  auto config = stageflow::config::ConfigLoader::Defaults();
  assert(config.database().has_memory());
  assert(config.cache().persistent_enabled());
  assert(config.generation().chunk_words() == stageflow::config::kDefaultChunkWords);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)stageflow::config::ConfigLoader::LoadFromYaml("/nonexistent/stageflow/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

bool LoadFails(const std::string& test_name, const std::string& yaml) {
  try {
    (void)stageflow::config::ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml).string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestQuotedScalarsStayStrings() {
  // An unquoted 007 would become the number 7.
  const auto path   = WriteYaml("quoted_scope", R"(orchestrator:
  isolation_scope: "007"
  max_concurrent_stages: 3
)");
  const auto config = stageflow::config::ConfigLoader::LoadFromYaml(path.string());
  assert(config.orchestrator().isolation_scope() == "007");
  assert(config.orchestrator().max_concurrent_stages() == 3);
}

void TestInvalidSettingsAreRejected() {
  assert(LoadFails("empty_sqlite_path", R"(database:
  sqlite:
    path: ""
)"));
  assert(LoadFails("empty_postgres_uri", R"(database:
  postgres:
    pool_size: 2
)"));
  assert(LoadFails("shrinking_backoff", R"(orchestrator:
  default_retry:
    backoff_multiplier: 0.5
)"));
  assert(LoadFails("inverted_backoff_bounds", R"(orchestrator:
  default_retry:
    initial_backoff_ms: 5000
    max_backoff_ms: 100
)"));
  assert(LoadFails("negative_ttl", R"(cache:
  ttl: "-5s"
)"));

  assert(!LoadFails("valid_retry", R"(orchestrator:
  default_retry:
    max_attempts: 5
    initial_backoff_ms: 100
    max_backoff_ms: 100
    backoff_multiplier: 1
)"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestDefaultsFillUnsetFields();
  TestDurationsParse();
  TestBuiltInDefaults();
  TestMissingFileIsReported();
  TestQuotedScalarsStayStrings();
  TestInvalidSettingsAreRejected();

  std::cout << "stageflow_unit_config_loader: pass\n";
  return 0;
}
