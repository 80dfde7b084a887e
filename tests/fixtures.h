#pragma once

#include "ind/candle.h"
#include "util/times.h"

#include <optional>
#include <string_view>
#include <vector>

inline SysTimePoint at(std::string_view datetime) {
  return datetime_to_utc(datetime);
}

inline Date date_of(std::string_view day) {
  return utc_date(datetime_to_utc(day));
}

// One candle per day, the last one dated `last`. open = close - open_gap,
// high/low one unit around the body. Empty `vols` leaves volume unset.
inline PriceSeries make_series(const std::vector<double>& closes,
                               Date last,
                               double open_gap = 1.0,
                               const std::vector<double>& vols = {}) {
  PriceSeries series;
  auto n = static_cast<int>(closes.size());
  for (int i = 0; i < n; i++) {
    Candle c;
    c.datetime = SysTimePoint{last - days{n - 1 - i}};
    c.close = closes[i];
    c.open = closes[i] - open_gap;
    c.high = c.close + 1.0;
    c.low = c.open - 1.0;
    if (!vols.empty())
      c.volume = vols[i];
    series.push_back(c);
  }
  return series;
}

// 60 candles: slow decline to `turn`, then +3 a candle
inline std::vector<double> v_closes(int turn = 51, int n = 60) {
  std::vector<double> res;
  double x = 100.0;
  for (int i = 0; i < n; i++) {
    if (i > 0)
      x += i <= turn ? -0.5 : 3.0;
    res.push_back(x);
  }
  return res;
}

// flat 1000, the last five at `spike`
inline std::vector<double> spiked_volumes(double spike = 1300.0,
                                          int n = 60) {
  std::vector<double> res(n, 1000.0);
  for (int i = n - 5; i < n; i++)
    res[i] = spike;
  return res;
}

// `start` then `decl` down per candle until `turn`, `step` up after
inline std::vector<double> vshape(int n,
                                  int turn,
                                  double decl,
                                  double step,
                                  double start = 100.0) {
  std::vector<double> res;
  double x = start;
  for (int i = 0; i < n; i++) {
    if (i > 0)
      x += i <= turn ? -decl : step;
    res.push_back(x);
  }
  return res;
}

inline std::vector<double> mirrored(std::vector<double> closes,
                                    double axis) {
  for (auto& c : closes)
    c = axis - c;
  return closes;
}
