#include "time.hpp"

namespace collector::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(int64_t nanos) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos))};
}

} // namespace collector::util
