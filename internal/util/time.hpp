#pragma once

#include <chrono>
#include <cstdint>

namespace hsm::util {

/*
  Time utilities. All clock reads go through here.

  Wall clock is used for persisted timestamps, the steady clock for
  lock expiry bookkeeping.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint       Now();
SteadyTimePoint SteadyNow();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace hsm::util
