#include "internal/pipeline/run_inputs.hpp"

#include <algorithm>
#include <charconv>

#include "internal/util/errors.hpp"

namespace stageflow::pipeline {

using stageflow::core::v1::InputDefinition;

namespace {

bool IsNumber(const std::string& value) {
  double parsed = 0;
  const auto* end = value.data() + value.size();
  auto [ptr, ec]  = std::from_chars(value.data(), end, parsed);
  return ec == std::errc() && ptr == end;
}

bool IsBoolean(const std::string& value) {
  return value == "true" || value == "false";
}

void CheckValue(const InputDefinition& input, const std::string& value) {
  switch (input.type()) {
    case stageflow::core::v1::INPUT_TYPE_CHOICE:
      if (std::find(input.options().begin(), input.options().end(), value) == input.options().end()) {
        throw util::ValidationError("input " + input.key() + ": '" + value + "' is not one of the declared options");
      }
      break;
    case stageflow::core::v1::INPUT_TYPE_NUMBER:
      if (!IsNumber(value)) throw util::ValidationError("input " + input.key() + ": '" + value + "' is not a number");
      break;
    case stageflow::core::v1::INPUT_TYPE_BOOLEAN:
      if (!IsBoolean(value)) throw util::ValidationError("input " + input.key() + ": expected true or false");
      break;
    default:
      break;
  }

  if (input.max_length() > 0 && value.size() > input.max_length()) {
    throw util::ValidationError("input " + input.key() + ": longer than " + std::to_string(input.max_length()) + " characters");
  }
}

} // namespace

std::map<std::string, std::string> ResolveRunInputs(const stageflow::core::v1::PipelineTemplate& definition,
                                                    const std::map<std::string, std::string>&    supplied) {
  for (const auto& [key, _] : supplied) {
    const bool declared = std::any_of(definition.inputs().begin(), definition.inputs().end(),
                                      [&](const InputDefinition& input) { return input.key() == key; });
    if (!declared) throw util::ValidationError("input " + key + " is not declared by template " + definition.id());
  }

  std::map<std::string, std::string> resolved;
  for (const auto& input : definition.inputs()) {
    auto it = supplied.find(input.key());
    if (it != supplied.end() && !it->second.empty()) {
      CheckValue(input, it->second);
      resolved[input.key()] = it->second;
      continue;
    }
    if (!input.default_value().empty()) {
      resolved[input.key()] = input.default_value();
      continue;
    }
    if (input.required()) throw util::ValidationError("input " + input.key() + " is required");
    resolved[input.key()] = "";
  }
  return resolved;
}

} // namespace stageflow::pipeline
