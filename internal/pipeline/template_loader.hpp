#pragma once

#include <string>

#include "stageflow/core/v1/pipeline.pb.h"

namespace stageflow::pipeline {

/*
  Reads pipeline templates from YAML.

    metadata:  { id, name, description, version }
    defaults:  { models: [...], max_tokens, temperature }
    inputs:    { <key>: { type, label, required, default, options, max_length } }
    steps:     { <id>: { name, description, type, prompt_template, depends_on,
                         model_preference, max_tokens, temperature, retry,
                         optional, context, candidates, requires_selection } }

  Step order in the document is the declaration order. Structural checks
  only; graph validation happens at registration.
*/
class TemplateLoader {
 public:
  static stageflow::core::v1::PipelineTemplate LoadFromYaml(const std::string& path);
  static stageflow::core::v1::PipelineTemplate ParseYaml(const std::string& yaml_text);
};

} // namespace stageflow::pipeline
