#include "internal/resolver/dependency_graph.hpp"

#include <algorithm>
#include <functional>

#include "internal/pipeline/prompt_template.hpp"
#include "internal/util/errors.hpp"

namespace stageflow::resolver {

using stageflow::core::v1::PipelineTemplate;
using stageflow::core::v1::StageDefinition;

namespace {

std::string Join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

void ValidateInputs(const PipelineTemplate& definition, std::set<std::string>& keys) {
  for (const auto& input : definition.inputs()) {
    if (input.key().empty()) throw util::ValidationError("input with empty key");
    if (!keys.insert(input.key()).second) {
      throw util::ValidationError("duplicate input '" + input.key() + "'");
    }
    if (input.type() == stageflow::core::v1::INPUT_TYPE_CHOICE && input.options_size() == 0) {
      throw util::ValidationError("choice input '" + input.key() + "' has no options");
    }
  }
}

void ValidateStageShape(const StageDefinition& stage) {
  if (stage.kind() == stageflow::core::v1::STAGE_KIND_UNSPECIFIED) {
    throw util::ValidationError("stage '" + stage.id() + "' has no kind");
  }
  if (stage.kind() != stageflow::core::v1::STAGE_KIND_USER_INPUT && stage.prompt_template().empty()) {
    throw util::ValidationError("stage '" + stage.id() + "' has an empty prompt template");
  }
  if (stage.candidate_count() > 1 && stage.kind() != stageflow::core::v1::STAGE_KIND_GENERATE) {
    throw util::ValidationError("stage '" + stage.id() + "': candidates are only supported on generate stages");
  }
  if (stage.retry_policy().backoff_multiplier() < 0) {
    throw util::ValidationError("stage '" + stage.id() + "': negative backoff multiplier");
  }
  try {
    pipeline::PromptTemplate::Validate(stage.prompt_template());
  } catch (const util::ValidationError& e) {
    throw util::ValidationError("stage '" + stage.id() + "': " + e.what());
  }
}

} // namespace

DependencyGraph DependencyGraph::Build(const PipelineTemplate& definition) {
  if (definition.stages_size() == 0) {
    throw util::ValidationError("template '" + definition.id() + "' declares no stages");
  }

  std::set<std::string> input_keys;
  ValidateInputs(definition, input_keys);

  DependencyGraph graph;

  // ------------------------------------------------------------
  // Nodes
  // ------------------------------------------------------------

  for (const auto& stage : definition.stages()) {
    if (stage.id().empty()) throw util::ValidationError("stage with empty id");
    if (graph.index_.count(stage.id())) {
      throw util::ValidationError("duplicate stage id '" + stage.id() + "'");
    }
    graph.index_.emplace(stage.id(), graph.ids_.size());
    graph.ids_.push_back(stage.id());
  }

  graph.deps_.resize(graph.ids_.size());
  graph.dependents_.resize(graph.ids_.size());

  // ------------------------------------------------------------
  // Edges
  // ------------------------------------------------------------

  for (std::size_t i = 0; i < static_cast<std::size_t>(definition.stages_size()); ++i) {
    const auto& stage = definition.stages(static_cast<int>(i));
    for (const auto& dep : stage.depends_on()) {
      if (dep == stage.id()) {
        throw util::ValidationError("cycle detected: " + dep + " -> " + dep);
      }
      auto it = graph.index_.find(dep);
      if (it == graph.index_.end()) {
        throw util::ValidationError("stage '" + stage.id() + "' depends on unknown stage '" + dep + "'");
      }
      if (std::find(graph.deps_[i].begin(), graph.deps_[i].end(), it->second) != graph.deps_[i].end()) {
        continue;
      }
      graph.deps_[i].push_back(it->second);
      graph.dependents_[it->second].push_back(i);
    }
  }

  if (auto cycle = FindCycle(graph.deps_)) {
    std::vector<std::string> names;
    for (auto idx : *cycle) names.push_back(graph.ids_[idx]);
    throw util::ValidationError("cycle detected: " + Join(names, " -> "));
  }

  // ------------------------------------------------------------
  // Stage bodies and references
  // ------------------------------------------------------------

  for (const auto& stage : definition.stages()) {
    ValidateStageShape(stage);

    const auto reachable = graph.TransitiveDependencies(stage.id());
    for (const auto& placeholder : pipeline::PromptTemplate::Placeholders(stage.prompt_template())) {
      if (placeholder.root == "steps") {
        if (!graph.Contains(placeholder.name)) {
          throw util::ValidationError("stage '" + stage.id() + "' references unknown stage '" + placeholder.name + "'");
        }
        if (!reachable.count(placeholder.name)) {
          throw util::ValidationError("stage '" + stage.id() + "' references '" + placeholder.name +
                                      "' which is not among its dependencies");
        }
      } else if (!input_keys.count(placeholder.name)) {
        throw util::ValidationError("stage '" + stage.id() + "' references undeclared input '" + placeholder.name + "'");
      }
    }

    for (const auto& key : stage.context_keys()) {
      if (!input_keys.count(key)) {
        throw util::ValidationError("stage '" + stage.id() + "' uses undeclared context key '" + key + "'");
      }
    }
  }

  return graph;
}

bool DependencyGraph::Contains(const std::string& stage_id) const {
  return index_.count(stage_id) != 0;
}

std::size_t DependencyGraph::IndexOf(const std::string& stage_id) const {
  auto it = index_.find(stage_id);
  if (it == index_.end()) throw util::NotFound("stage '" + stage_id + "'");
  return it->second;
}

std::vector<std::string> DependencyGraph::DependenciesOf(const std::string& stage_id) const {
  std::vector<std::string> out;
  for (auto idx : deps_[IndexOf(stage_id)]) out.push_back(ids_[idx]);
  return out;
}

std::vector<std::string> DependencyGraph::DependentsOf(const std::string& stage_id) const {
  std::vector<std::string> out;
  for (auto idx : dependents_[IndexOf(stage_id)]) out.push_back(ids_[idx]);
  return out;
}

std::set<std::string> DependencyGraph::TransitiveDependencies(const std::string& stage_id) const {
  std::set<std::string>    out;
  std::vector<std::size_t> stack(deps_[IndexOf(stage_id)]);
  while (!stack.empty()) {
    auto idx = stack.back();
    stack.pop_back();
    if (!out.insert(ids_[idx]).second) continue;
    for (auto next : deps_[idx]) stack.push_back(next);
  }
  return out;
}

std::set<std::string> DependencyGraph::TransitiveDependents(const std::string& stage_id) const {
  std::set<std::string>    out;
  std::vector<std::size_t> stack(dependents_[IndexOf(stage_id)]);
  while (!stack.empty()) {
    auto idx = stack.back();
    stack.pop_back();
    if (!out.insert(ids_[idx]).second) continue;
    for (auto next : dependents_[idx]) stack.push_back(next);
  }
  return out;
}

std::vector<std::string> DependencyGraph::TopologicalOrder() const {
  std::vector<std::size_t> remaining(ids_.size());
  for (std::size_t i = 0; i < ids_.size(); ++i) remaining[i] = deps_[i].size();

  std::vector<std::string> order;
  std::vector<bool>        done(ids_.size(), false);
  while (order.size() < ids_.size()) {
    // lowest declaration index with no pending deps
    std::size_t pick = ids_.size();
    for (std::size_t i = 0; i < ids_.size(); ++i) {
      if (!done[i] && remaining[i] == 0) {
        pick = i;
        break;
      }
    }
    if (pick == ids_.size()) break;
    done[pick] = true;
    order.push_back(ids_[pick]);
    for (auto dependent : dependents_[pick]) --remaining[dependent];
  }
  return order;
}

std::vector<std::vector<std::string>> DependencyGraph::ExecutionGroups() const {
  std::vector<std::size_t> depth(ids_.size(), 0);
  std::size_t              max_depth = 0;
  for (const auto& id : TopologicalOrder()) {
    auto idx = index_.at(id);
    for (auto dep : deps_[idx]) depth[idx] = std::max(depth[idx], depth[dep] + 1);
    max_depth = std::max(max_depth, depth[idx]);
  }

  std::vector<std::vector<std::string>> groups(ids_.empty() ? 0 : max_depth + 1);
  for (std::size_t i = 0; i < ids_.size(); ++i) groups[depth[i]].push_back(ids_[i]);
  return groups;
}

std::optional<std::vector<std::size_t>> DependencyGraph::FindCycle(const std::vector<std::vector<std::size_t>>& deps) {
  enum class Mark { kNone, kActive, kDone };
  std::vector<Mark>        marks(deps.size(), Mark::kNone);
  std::vector<std::size_t> path;
  std::optional<std::vector<std::size_t>> found;

  std::function<bool(std::size_t)> visit = [&](std::size_t node) {
    marks[node] = Mark::kActive;
    path.push_back(node);
    for (auto next : deps[node]) {
      if (marks[next] == Mark::kActive) {
        auto start = std::find(path.begin(), path.end(), next);
        std::vector<std::size_t> cycle(start, path.end());
        cycle.push_back(next);
        found = std::move(cycle);
        return true;
      }
      if (marks[next] == Mark::kNone && visit(next)) return true;
    }
    path.pop_back();
    marks[node] = Mark::kDone;
    return false;
  };

  for (std::size_t i = 0; i < deps.size(); ++i) {
    if (marks[i] == Mark::kNone && visit(i)) return found;
  }
  return std::nullopt;
}

} // namespace stageflow::resolver
