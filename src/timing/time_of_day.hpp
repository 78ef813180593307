#pragma once

#include <string>

#include "core/types.hpp"

namespace rules_timing {

using hub_rules::TimePoint;

// Wall-clock time of day in the local time zone
struct TimeOfDay {
  int hour = 0;
  int minute = 0;
  int second = 0;
};

// "HH:MM" or "HH:MM:SS". Throws std::invalid_argument when malformed or
// out of range.
TimeOfDay parse_time_of_day(const std::string &text);

std::string to_string(const TimeOfDay &t);

// First instant strictly after `now` whose local time of day equals `t`:
// today if still ahead, tomorrow otherwise.
TimePoint next_occurrence(TimePoint now, const TimeOfDay &t);

} // namespace rules_timing
