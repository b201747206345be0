#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/resolver/dependency_graph.hpp"
#include "stageflow/core/v1/pipeline.pb.h"

namespace stageflow::pipeline {

struct CompiledTemplate {
  stageflow::core::v1::PipelineTemplate definition;
  resolver::DependencyGraph             graph;
  std::string                           digest;
};

/*
  Registered templates, keyed by (id, version).

  A registered version is immutable. Registering the same content again
  returns the existing entry; different content under the same version
  is rejected with AlreadyExists. Templates persist in the repository so
  runs can be recovered after a restart.
*/
class TemplateRegistry {
 public:
  explicit TemplateRegistry(std::shared_ptr<db::Repository> repository);

  // Validates the template. Throws ValidationError or AlreadyExists.
  std::shared_ptr<const CompiledTemplate> Register(const stageflow::core::v1::PipelineTemplate& definition);

  // Throws NotFound.
  std::shared_ptr<const CompiledTemplate> Get(const std::string& template_id, const std::string& version);

  // Most recently registered version. Throws NotFound.
  std::shared_ptr<const CompiledTemplate> Latest(const std::string& template_id);

  std::vector<std::pair<std::string, std::string>> List();

  static std::string Digest(const stageflow::core::v1::PipelineTemplate& definition);

 private:
  using Key = std::pair<std::string, std::string>;

  std::shared_ptr<const CompiledTemplate> Compile(const stageflow::core::v1::PipelineTemplate& definition) const;

  std::shared_ptr<db::Repository> repository_;

  std::mutex                                                  mutex_;
  std::map<Key, std::shared_ptr<const CompiledTemplate>>      compiled_;
};

} // namespace stageflow::pipeline
