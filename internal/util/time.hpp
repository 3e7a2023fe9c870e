#pragma once

#include <chrono>

namespace runvault::util {

/*
  Time utilities. Single place to control clock source later.

  Persisted timestamps are floating point seconds since the epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

double ToUnixSeconds(TimePoint tp);

// Current time as persisted.
double NowSeconds();

} // namespace runvault::util
