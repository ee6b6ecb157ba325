#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ctxgraph {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Injectable time source. Tests pass a lambda returning a fixed point.
using ClockFn = std::function<TimePoint()>;

inline TimePoint systemNow() { return Clock::now(); }

int64_t toEpochMillis(TimePoint tp);
TimePoint fromEpochMillis(int64_t ms);

/// UTC, millisecond precision: 2024-05-01T12:00:00.000Z
std::string toIsoString(TimePoint tp);

} // namespace ctxgraph
