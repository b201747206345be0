#include "internal/pipeline/prompt_template.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using stageflow::pipeline::PromptTemplate;
using stageflow::pipeline::RenderContext;

template <typename Fn>
bool Rejects(Fn&& fn) {
  try {
    fn();
  } catch (const stageflow::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestPlaceholderPaths() {
  const auto placeholders = PromptTemplate::Placeholders("{{topic}} {{ inputs.tone }} {{steps.outline}} {{steps.pick.feedback}}");
  assert(placeholders.size() == 4);

  assert(placeholders[0].root == "inputs" && placeholders[0].name == "topic");
  assert(placeholders[1].root == "inputs" && placeholders[1].name == "tone");
  assert(placeholders[2].root == "steps" && placeholders[2].name == "outline" && placeholders[2].field == "output");
  assert(placeholders[3].root == "steps" && placeholders[3].name == "pick" && placeholders[3].field == "feedback");
}

void TestRenderSubstitutesValues() {
  RenderContext context;
  context.inputs["topic"]          = "rust";
  context.stage_outputs["outline"] = "1. intro";
  context.stage_feedback["pick"]   = "2";

  const auto text = PromptTemplate::Render("Write about {{topic}} from {{steps.outline}} ({{steps.pick.feedback}}) {json}", context);
  assert(text == "Write about rust from 1. intro (2) {json}");
}

void TestRenderRejectsMissingValues() {
  RenderContext context;
  assert(Rejects([&] { PromptTemplate::Render("{{inputs.absent}}", context); }));
  assert(Rejects([&] { PromptTemplate::Render("{{steps.absent}}", context); }));
}

void TestMalformedTemplatesAreRejected() {
  assert(Rejects([] { PromptTemplate::Validate("{{open"); }));
  assert(Rejects([] { PromptTemplate::Validate("close}}"); }));
  assert(Rejects([] { PromptTemplate::Validate("{{ }}"); }));
  assert(Rejects([] { PromptTemplate::Validate("{{a {{b}} }}"); }));
  assert(Rejects([] { PromptTemplate::Validate("{{steps.a.b.c}}"); }));
  assert(Rejects([] { PromptTemplate::Validate("{{steps.a.tokens}}"); }));
  assert(Rejects([] { PromptTemplate::Validate("{{has space}}"); }));
  assert(Rejects([] { PromptTemplate::Validate(std::string(stageflow::pipeline::kMaxPromptTemplateLength + 1, 'x')); }));

  PromptTemplate::Validate("plain text with {single} braces");
}

} // namespace

int main() {
  TestPlaceholderPaths();
  TestRenderSubstitutesValues();
  TestRenderRejectsMissingValues();
  TestMalformedTemplatesAreRejected();

  std::cout << "stageflow_unit_prompt_template: pass\n";
  return 0;
}
