#include "internal/pipeline/template_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <exception>

#include "internal/util/errors.hpp"

namespace stageflow::pipeline {

using stageflow::core::v1::InputDefinition;
using stageflow::core::v1::InputType;
using stageflow::core::v1::ModelPreference;
using stageflow::core::v1::PipelineTemplate;
using stageflow::core::v1::RetryPolicy;
using stageflow::core::v1::StageDefinition;
using stageflow::core::v1::StageKind;

namespace {

template <typename T>
T Scalar(const YAML::Node& node, const char* key, T fallback) {
  const auto child = node[key];
  if (!child || child.IsNull()) return fallback;
  try {
    return child.as<T>();
  } catch (const YAML::Exception& e) {
    throw util::ValidationError(std::string("field '") + key + "': " + e.what());
  }
}

std::vector<std::string> StringList(const YAML::Node& node, const char* key) {
  std::vector<std::string> out;
  const auto               child = node[key];
  if (!child || child.IsNull()) return out;
  if (child.IsScalar()) {
    out.push_back(child.as<std::string>());
    return out;
  }
  if (!child.IsSequence()) {
    throw util::ValidationError(std::string("field '") + key + "' must be a list");
  }
  for (const auto& item : child) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

StageKind ParseKind(const std::string& type, const std::string& step_id) {
  if (type.empty() || type == "llm_generate" || type == "generate") return stageflow::core::v1::STAGE_KIND_GENERATE;
  if (type == "user_input") return stageflow::core::v1::STAGE_KIND_USER_INPUT;
  if (type == "transform") return stageflow::core::v1::STAGE_KIND_TRANSFORM;
  throw util::ValidationError("step '" + step_id + "': unknown type '" + type + "'");
}

InputType ParseInputType(const std::string& type, const std::string& key) {
  if (type.empty() || type == "text") return stageflow::core::v1::INPUT_TYPE_TEXT;
  if (type == "choice") return stageflow::core::v1::INPUT_TYPE_CHOICE;
  if (type == "number") return stageflow::core::v1::INPUT_TYPE_NUMBER;
  if (type == "boolean") return stageflow::core::v1::INPUT_TYPE_BOOLEAN;
  throw util::ValidationError("input '" + key + "': unknown type '" + type + "'");
}

std::string Slug(const std::string& name) {
  std::string out;
  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else if (!out.empty() && out.back() != '-') {
      out.push_back('-');
    }
  }
  while (!out.empty() && out.back() == '-') out.pop_back();
  return out;
}

void ParseModels(const YAML::Node& node, ModelPreference* models) {
  for (auto& model : StringList(node, "models")) {
    models->add_models(std::move(model));
  }
  for (auto& model : StringList(node, "model_preference")) {
    models->add_models(std::move(model));
  }
  models->set_max_tokens(Scalar<uint32_t>(node, "max_tokens", 0));
  models->set_temperature(Scalar<double>(node, "temperature", 0.0));
}

void ParseRetry(const YAML::Node& node, RetryPolicy* retry) {
  if (!node || node.IsNull()) return;
  if (!node.IsMap()) {
    throw util::ValidationError("retry must be a map");
  }
  retry->set_max_attempts(Scalar<uint32_t>(node, "max_attempts", 0));
  retry->set_initial_backoff_ms(Scalar<uint64_t>(node, "initial_delay_ms", 0));
  retry->set_max_backoff_ms(Scalar<uint64_t>(node, "max_delay_ms", 0));
  retry->set_backoff_multiplier(Scalar<double>(node, "backoff_factor", 0.0));
  retry->set_jitter(Scalar<bool>(node, "jitter", false));
}

void ParseInputs(const YAML::Node& node, PipelineTemplate* tpl) {
  if (!node || node.IsNull()) return;
  if (!node.IsMap()) {
    throw util::ValidationError("inputs must be a map");
  }

  for (const auto& entry : node) {
    const auto       key  = entry.first.as<std::string>();
    const auto&      body = entry.second;
    InputDefinition* def  = tpl->add_inputs();
    def->set_key(key);

    if (!body.IsMap()) {
      def->set_type(stageflow::core::v1::INPUT_TYPE_TEXT);
      def->set_required(true);
      continue;
    }

    def->set_type(ParseInputType(Scalar<std::string>(body, "type", ""), key));
    def->set_label(Scalar<std::string>(body, "label", key));
    def->set_required(Scalar<bool>(body, "required", true));
    def->set_default_value(Scalar<std::string>(body, "default", ""));
    def->set_max_length(Scalar<uint32_t>(body, "max_length", 0));
    for (auto& option : StringList(body, "options")) {
      def->add_options(std::move(option));
    }
  }
}

void ParseSteps(const YAML::Node& node, PipelineTemplate* tpl) {
  if (!node || !node.IsMap() || node.size() == 0) {
    throw util::ValidationError("template must declare at least one step");
  }

  for (const auto& entry : node) {
    const auto       id   = entry.first.as<std::string>();
    const auto&      body = entry.second;
    StageDefinition* def  = tpl->add_stages();
    def->set_id(id);

    if (!body.IsMap()) {
      throw util::ValidationError("step '" + id + "' must be a map");
    }

    def->set_name(Scalar<std::string>(body, "name", id));
    def->set_description(Scalar<std::string>(body, "description", ""));
    def->set_kind(ParseKind(Scalar<std::string>(body, "type", ""), id));
    def->set_prompt_template(Scalar<std::string>(body, "prompt_template", ""));
    for (auto& dep : StringList(body, "depends_on")) {
      def->add_depends_on(std::move(dep));
    }
    ParseModels(body, def->mutable_model_preference());
    ParseRetry(body["retry"], def->mutable_retry_policy());
    def->set_optional(Scalar<bool>(body, "optional", false));
    for (auto& key : StringList(body, "context")) {
      def->add_context_keys(std::move(key));
    }
    def->set_candidate_count(Scalar<uint32_t>(body, "candidates", 1));
    def->set_requires_selection(Scalar<bool>(body, "requires_selection", def->candidate_count() > 1));
  }
}

PipelineTemplate FromNode(const YAML::Node& root) {
  if (!root || !root.IsMap()) {
    throw util::ValidationError("template document must be a map");
  }

  PipelineTemplate tpl;
  const auto       metadata = root["metadata"];
  if (metadata && metadata.IsMap()) {
    tpl.set_name(Scalar<std::string>(metadata, "name", ""));
    tpl.set_description(Scalar<std::string>(metadata, "description", ""));
    tpl.set_version(Scalar<std::string>(metadata, "version", ""));
    tpl.set_id(Scalar<std::string>(metadata, "id", ""));
  }
  if (tpl.id().empty()) tpl.set_id(Slug(tpl.name()));
  if (tpl.id().empty()) {
    throw util::ValidationError("template needs metadata.id or metadata.name");
  }
  if (tpl.version().empty()) tpl.set_version("1");

  const auto defaults = root["defaults"];
  if (defaults && defaults.IsMap()) {
    ParseModels(defaults, tpl.mutable_default_models());
  }

  ParseInputs(root["inputs"], &tpl);
  ParseSteps(root["steps"], &tpl);
  return tpl;
}

} // namespace

PipelineTemplate TemplateLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ValidationError("Failed to load template " + path + ": " + e.what());
  }
  return FromNode(yaml);
}

PipelineTemplate TemplateLoader::ParseYaml(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw util::ValidationError(std::string("Failed to parse template: ") + e.what());
  }
  return FromNode(yaml);
}

} // namespace stageflow::pipeline
