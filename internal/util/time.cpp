#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace autopilot::util {

TimePoint WallClock::Now() const {
  return SystemClock::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = tp;
}

void ManualClock::Advance(std::chrono::milliseconds delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

TimePoint Now() {
  return SystemClock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<SystemClock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

double HoursBetween(TimePoint earlier, TimePoint later) {
  return std::chrono::duration<double, std::ratio<3600>>(later - earlier).count();
}

TimePoint StartOfDay(TimePoint tp) {
  const auto days = std::chrono::floor<std::chrono::days>(tp);
  return TimePoint{days.time_since_epoch()};
}

std::string ToIso8601(TimePoint tp) {
  const std::time_t t = SystemClock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace autopilot::util
