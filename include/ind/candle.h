#pragma once

#include "util/times.h"

#include <optional>
#include <vector>

struct Candle {
  SysTimePoint datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  std::optional<double> volume;

  double price() const { return close; }
  SysTimePoint time() const { return datetime; }
  Date date() const { return utc_date(datetime); }
};

using PriceSeries = std::vector<Candle>;

inline bool has_volume(const PriceSeries& series) {
  if (series.empty())
    return false;
  for (auto& c : series)
    if (!c.volume)
      return false;
  return true;
}
