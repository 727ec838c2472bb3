#pragma once

#include <chrono>
#include <cstdint>

namespace fetchbox::util {

// Wall clock; queue timestamps persist as unix milliseconds.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace fetchbox::util
