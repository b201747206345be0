#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stageflow::pipeline {

/*
  Prompt templates use {{ path }} placeholders.

    inputs.<key>          run input
    steps.<id>            stage output
    steps.<id>.output     same
    steps.<id>.feedback   feedback recorded for the stage
    <key>                 shorthand for inputs.<key>

  Single braces are literal text.
*/

constexpr std::size_t kMaxPromptTemplateLength = 10000;

struct Placeholder {
  std::string path;
  std::string root;  // "inputs" or "steps"
  std::string name;  // input key or stage id
  std::string field; // "output" or "feedback" for steps
};

struct RenderContext {
  std::map<std::string, std::string> inputs;
  std::map<std::string, std::string> stage_outputs;
  std::map<std::string, std::string> stage_feedback;
};

class PromptTemplate {
 public:
  // Throws ValidationError on unbalanced or empty placeholders and bad paths.
  static void Validate(std::string_view text);

  static std::vector<Placeholder> Placeholders(std::string_view text);

  // Throws ValidationError when a referenced value is missing.
  static std::string Render(std::string_view text, const RenderContext& context);
};

} // namespace stageflow::pipeline
