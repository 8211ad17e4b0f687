#pragma once

#include <chrono>
#include <date/date.h>

using Clock = std::chrono::system_clock;
using Time = Clock::time_point;
using Seconds = std::chrono::seconds;
using Microseconds = std::chrono::microseconds;

// Sortable, parseable UTC timestamp, e.g. "2000-03-25T00:46:08.123456Z".
inline auto iso8601_time(const Time time) { return date::format("%FT%TZ", date::floor<Microseconds>(time)); }
