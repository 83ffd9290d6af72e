#pragma once

#include <chrono>
#include <cstdint>

namespace x402::util {

/*
  Time utilities. Single place to control the clock source.

  Core predicates take `now` as an argument; only executables read the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::uint64_t ToUnixSeconds(TimePoint tp);

std::uint64_t UnixNow();

} // namespace x402::util
