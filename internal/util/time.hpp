#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace waypoint::util {

/*
  Time utilities: single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 with microseconds and an explicit UTC offset, e.g. 2024-05-04T06:32:42.235444+00:00
std::string ToIso8601(TimePoint tp);

} // namespace waypoint::util
