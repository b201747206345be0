#pragma once

#include "stageflow/core/v1/pipeline.pb.h"
#include "stageflow/core/v1/run.pb.h"

#include "stageflow/events/v1/event.pb.h"

#include "stageflow/cache/v1/cache_entry.pb.h"

#include "stageflow/service/v1/control.pb.h"

namespace stageflow::v1 {

using namespace stageflow::core::v1;
using namespace stageflow::events::v1;
using namespace stageflow::service::v1;

using stageflow::cache::v1::CacheEntry;

}
