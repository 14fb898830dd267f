#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace collector::util {

/*
  Time utilities: the single place that reads the wall clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injected wherever a capture instant is taken so tests can pin it.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

int64_t  ToUnixNanos(TimePoint tp);
uint64_t ToUnixMillis(TimePoint tp);

TimePoint FromUnixNanos(int64_t nanos);

} // namespace collector::util
