#pragma once

#include "candle.h"
#include "util/times.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

inline constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> closes(const PriceSeries& candles);
std::vector<double> volumes(const PriceSeries& candles);

struct EMA {
  std::vector<double> values;

 private:
  int period;

 public:
  EMA() noexcept = default;
  EMA(const PriceSeries& candles, int period) noexcept;
  EMA(const std::vector<double>& prices, int period) noexcept;
};

struct SMA {
  std::vector<double> values;

 private:
  int period;

 public:
  SMA() noexcept = default;
  SMA(const PriceSeries& candles, int period) noexcept;
  SMA(const std::vector<double>& prices, int period) noexcept;
};

struct RSI {
  std::vector<double> values;

 private:
  int period;

 public:
  RSI() noexcept = default;
  RSI(const PriceSeries& candles, int period = 14) noexcept;
  RSI(const std::vector<double>& prices, int period = 14) noexcept;
};

struct MACD {
  std::vector<double> macd_line;
  EMA signal_ema;
  std::vector<double> histogram;

 private:
  EMA fast_ema;
  EMA slow_ema;

 public:
  MACD() noexcept = default;
  MACD(const PriceSeries& candles,
       int fast = 12,
       int slow = 26,
       int signal = 9) noexcept;

  const std::vector<double>& signal_line() const { return signal_ema.values; }
};

// Everything the detectors read for one pass over one series. `today` is the
// evaluation date stamped on verdicts that carry their own signal date.
struct Indicators {
 public:
  Date today;

 private:
  PriceSeries candles;
  bool _has_volume;

  EMA _ema5, _ema12, _ema20, _ema26;
  SMA _sma50, _sma200;
  RSI _rsi;
  MACD _macd;
  SMA _vol5, _vol20, _vol50;

  size_t sanitize(int idx) const {
    return idx < 0 ? candles.size() + idx : idx;
  }

 public:
  Indicators(PriceSeries c, Date today) noexcept;

  Indicators(const Indicators&) = delete;
  Indicators& operator=(const Indicators&) = delete;

  auto size() const { return candles.size(); }
  bool has_volume() const { return _has_volume; }
  const PriceSeries& series() const { return candles; }

  double open(int idx) const { return candles[sanitize(idx)].open; }
  double close(int idx) const { return candles[sanitize(idx)].close; }
  double price(int idx) const { return candles[sanitize(idx)].price(); }
  double volume(int idx) const {
    return candles[sanitize(idx)].volume.value_or(NaN);
  }

  double ema5(int idx) const { return _ema5.values[sanitize(idx)]; }
  double ema12(int idx) const { return _ema12.values[sanitize(idx)]; }
  double ema20(int idx) const { return _ema20.values[sanitize(idx)]; }
  double ema26(int idx) const { return _ema26.values[sanitize(idx)]; }

  double sma50(int idx) const { return _sma50.values[sanitize(idx)]; }
  double sma200(int idx) const { return _sma200.values[sanitize(idx)]; }

  double rsi(int idx) const { return _rsi.values[sanitize(idx)]; }

  double macd(int idx) const { return _macd.macd_line[sanitize(idx)]; }
  double macd_signal(int idx) const {
    return _macd.signal_line()[sanitize(idx)];
  }

  // NaN when the series carries no volume
  double vol_avg5(int idx) const { return vol_avg(_vol5, idx); }
  double vol_avg20(int idx) const { return vol_avg(_vol20, idx); }
  double vol_avg50(int idx) const { return vol_avg(_vol50, idx); }

 private:
  double vol_avg(const SMA& sma, int idx) const {
    return _has_volume ? sma.values[sanitize(idx)] : NaN;
  }
};
