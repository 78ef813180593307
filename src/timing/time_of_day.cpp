#include "timing/time_of_day.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace rules_timing {

TimeOfDay parse_time_of_day(const std::string &text) {
  TimeOfDay t;
  int consumed = 0;
  const int fields = std::sscanf(text.c_str(), "%d:%d%n:%d%n", &t.hour,
                                 &t.minute, &consumed, &t.second, &consumed);
  if (fields < 2 || static_cast<size_t>(consumed) != text.size()) {
    throw std::invalid_argument("Invalid time of day '" + text +
                                "' (expected HH:MM or HH:MM:SS)");
  }
  if (t.hour < 0 || t.hour > 23 || t.minute < 0 || t.minute > 59 ||
      t.second < 0 || t.second > 59) {
    throw std::invalid_argument("Time of day out of range: '" + text + "'");
  }
  return t;
}

std::string to_string(const TimeOfDay &t) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", t.hour, t.minute,
                t.second);
  return buf;
}

TimePoint next_occurrence(TimePoint now, const TimeOfDay &t) {
  const std::time_t now_c = hub_rules::Clock::to_time_t(now);
  std::tm local{};
  localtime_r(&now_c, &local);

  local.tm_hour = t.hour;
  local.tm_min = t.minute;
  local.tm_sec = t.second;
  local.tm_isdst = -1;

  TimePoint candidate = hub_rules::Clock::from_time_t(std::mktime(&local));
  if (candidate <= now) {
    // mktime normalizes the day overflow, including across DST changes
    local.tm_mday += 1;
    local.tm_hour = t.hour;
    local.tm_min = t.minute;
    local.tm_sec = t.second;
    local.tm_isdst = -1;
    candidate = hub_rules::Clock::from_time_t(std::mktime(&local));
  }
  return candidate;
}

} // namespace rules_timing
