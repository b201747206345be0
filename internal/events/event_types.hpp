#pragma once

#include <string_view>

#include "stageflow/events/v1/event.pb.h"

namespace stageflow::events {

// Stable name of the payload, stored beside the serialized event.
std::string_view PayloadName(const stageflow::events::v1::Event& event);

// RunCompleted, RunFailed or RunCancelled.
bool IsTerminalEvent(const stageflow::events::v1::Event& event);

bool IsSnapshot(const stageflow::events::v1::Event& event);

} // namespace stageflow::events
