#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace stageflow::util {

// Random RFC4122 version 4 identifier.
using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase form of a fresh UUID. Used for run and
// branch ids.
std::string NewRunId();

} // namespace stageflow::util
