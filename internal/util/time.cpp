#include "time.hpp"

namespace hsm::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace hsm::util
