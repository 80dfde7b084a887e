#include "util/times.h"

#include <format>
#include <sstream>
#include <stdexcept>

using namespace std::chrono;

SysTimePoint datetime_to_utc(std::string_view datetime) {
  if (datetime.empty())
    throw std::invalid_argument("empty datetime string");

  std::istringstream in{std::string(datetime)};
  SysTimePoint tp;
  if (datetime.size() > 10) {
    in >> parse("%F %T", tp);
  } else {
    Date date;
    in >> parse("%F", date);
    tp = date;
  }

  if (in.fail())
    throw std::invalid_argument(
        std::format("malformed datetime '{}'", datetime));

  return tp;
}

SysTimePoint now_utc_time() {
  return floor<seconds>(system_clock::now());
}

LocalTimePoint to_zone_local(SysTimePoint tp, std::string_view timezone) {
  const auto* tz = locate_zone(timezone);
  zoned_time zt{tz, tp};
  return floor<seconds>(zt.get_local_time());
}

minutes parse_time_of_day(std::string_view hhmm) {
  auto colon = hhmm.find(':');
  if (colon == std::string_view::npos || colon == 0 ||
      colon + 1 >= hhmm.size())
    throw std::invalid_argument(std::format("malformed time '{}'", hhmm));

  auto h = std::stoi(std::string(hhmm.substr(0, colon)));
  auto m = std::stoi(std::string(hhmm.substr(colon + 1)));
  if (h < 0 || h > 23 || m < 0 || m > 59)
    throw std::invalid_argument(std::format("time out of range '{}'", hhmm));

  return hours{h} + minutes{m};
}
