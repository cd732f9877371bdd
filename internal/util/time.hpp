#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sportsledger::util {

/*
  Time utilities: single place to control clock source and the stored
  timestamp format.

  Stored timestamps are UTC with microsecond precision in fixed-width
  RFC3339 form ("2024-01-15T19:30:00.000000Z") so that text order equals
  chronological order.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Current time truncated to microseconds.
TimePoint Now();

TimePoint TruncateToMicros(TimePoint tp);

std::string FormatTimestamp(TimePoint tp);

// Accepts RFC3339 with any offset; throws std::invalid_argument otherwise.
TimePoint ParseTimestamp(const std::string& text);

int64_t ToUnixMicros(TimePoint tp);

double SecondsBetween(TimePoint from, TimePoint to);

} // namespace sportsledger::util
