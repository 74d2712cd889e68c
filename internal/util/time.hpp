#pragma once

#include <chrono>
#include <cstdint>

namespace piecework::util {

/*
  Time utilities. Single place to control the clock source.

  Decision, close and payment stamps are persisted as epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::uint64_t ToUnixMillis(TimePoint tp);
std::uint64_t NowMillis();

} // namespace piecework::util
