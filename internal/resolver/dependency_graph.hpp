#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "stageflow/core/v1/pipeline.pb.h"

namespace stageflow::resolver {

/*
  Validated stage dependency graph of a pipeline template.

  Build() rejects templates with duplicate or empty stage ids, unknown
  or self dependencies, cycles, prompt references to stages that are
  not transitive dependencies, and references to undeclared inputs.
  Stage order is declaration order throughout.
*/
class DependencyGraph {
 public:
  DependencyGraph() = default;

  // Throws util::ValidationError.
  static DependencyGraph Build(const stageflow::core::v1::PipelineTemplate& definition);

  std::size_t Size() const {
    return ids_.size();
  }

  const std::vector<std::string>& StageIds() const {
    return ids_;
  }

  bool Contains(const std::string& stage_id) const;

  std::vector<std::string> DependenciesOf(const std::string& stage_id) const;
  std::vector<std::string> DependentsOf(const std::string& stage_id) const;

  std::set<std::string> TransitiveDependencies(const std::string& stage_id) const;
  std::set<std::string> TransitiveDependents(const std::string& stage_id) const;

  // Kahn order, ties broken by declaration order.
  std::vector<std::string> TopologicalOrder() const;

  // Stages grouped by depth. Stages in one group share no edges.
  std::vector<std::vector<std::string>> ExecutionGroups() const;

 private:
  std::size_t IndexOf(const std::string& stage_id) const;

  static std::optional<std::vector<std::size_t>> FindCycle(const std::vector<std::vector<std::size_t>>& deps);

  std::vector<std::string>                     ids_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<std::vector<std::size_t>>        deps_;
  std::vector<std::vector<std::size_t>>        dependents_;
};

} // namespace stageflow::resolver
