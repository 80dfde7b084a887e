#pragma once

#include <chrono>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::seconds>;

using LocalTimePoint = std::chrono::local_time<std::chrono::seconds>;

// Calendar date in UTC
using Date = std::chrono::sys_days;

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;

// Parses "%F %T" or a bare "%F" (midnight) as UTC. Throws on malformed input.
SysTimePoint datetime_to_utc(std::string_view datetime);

SysTimePoint now_utc_time();

inline Date utc_date(SysTimePoint tp) {
  return std::chrono::floor<days>(tp);
}

// Wall clock of `tp` in the IANA zone `timezone`. Throws if the zone is
// missing from the tz database.
LocalTimePoint to_zone_local(SysTimePoint tp, std::string_view timezone);

// "HH:MM" -> minutes since local midnight; throws on malformed input
minutes parse_time_of_day(std::string_view hhmm);

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
