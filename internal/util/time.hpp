#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mountsync::util {

/*
  Time utilities; the single place to swap the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// "2024-05-01 12:00:00" in local time, "-" for the epoch.
std::string FormatTimestamp(TimePoint tp);

} // namespace mountsync::util
