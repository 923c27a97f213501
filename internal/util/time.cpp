#include "time.hpp"

namespace datastream::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

MillisClock SystemMillisClock() {
  return [] { return NowMillis(); };
}

SteadyClock SystemSteadyClock() {
  return [] { return std::chrono::steady_clock::now(); };
}

} // namespace datastream::util
