#pragma once

#include <chrono>
#include <string>

namespace devicefarm::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Service resources report timestamps as fractional epoch seconds.
TimePoint FromEpochSeconds(double seconds);

// 2015-08-30T12:36:00Z
std::string ToIso8601(TimePoint tp);

} // namespace devicefarm::util
