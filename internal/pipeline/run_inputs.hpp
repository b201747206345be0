#pragma once

#include <map>
#include <string>

#include "stageflow/core/v1/pipeline.pb.h"

namespace stageflow::pipeline {

/*
  Checks the inputs supplied to a new run against the template's input
  declarations and fills in declared defaults.

  Throws ValidationError for an undeclared key, a missing required
  input, a value outside a choice's options, a malformed number or
  boolean, or a text longer than max_length.
*/
std::map<std::string, std::string> ResolveRunInputs(const stageflow::core::v1::PipelineTemplate& definition,
                                                    const std::map<std::string, std::string>&    supplied);

} // namespace stageflow::pipeline
