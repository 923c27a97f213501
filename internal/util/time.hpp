#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace datastream::util {

/*
  Time utilities: single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Wall-clock milliseconds since the epoch; injectable for tests.
using MillisClock = std::function<uint64_t()>;

// Monotonic time for intervals and staleness; never steps backwards.
using SteadyTimePoint = std::chrono::steady_clock::time_point;
using SteadyClock     = std::function<SteadyTimePoint()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowMillis();

MillisClock SystemMillisClock();

SteadyClock SystemSteadyClock();

} // namespace datastream::util
