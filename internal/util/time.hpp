#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/timestamp.pb.h"

namespace stageflow::util {

/*
  Time utilities.

  Components that care about TTLs or timestamps take a ClockSource so
  tests can drive time by hand.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public ClockSource {
 public:
  TimePoint Now() const override;
};

class ManualClock final : public ClockSource {
 public:
  explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50));

  TimePoint Now() const override;

  void Advance(std::chrono::milliseconds delta);
  void Set(TimePoint tp);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace stageflow::util
