#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace autopilot::util {

/*
  Time utilities.

  Everything that compares against "now" (embargo, cooldown, expiry)
  goes through a Clock so tests can pin time.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class WallClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Test clock; only moves when told to.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start);

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

double HoursBetween(TimePoint earlier, TimePoint later);

// 00:00:00 UTC of the day containing tp.
TimePoint StartOfDay(TimePoint tp);

std::string ToIso8601(TimePoint tp);

} // namespace autopilot::util
