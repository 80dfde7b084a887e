#include "ind/indicators.h"

#include <numeric>

std::vector<double> closes(const PriceSeries& candles) {
  std::vector<double> res;
  res.reserve(candles.size());
  for (auto& c : candles)
    res.push_back(c.price());
  return res;
}

std::vector<double> volumes(const PriceSeries& candles) {
  std::vector<double> res;
  res.reserve(candles.size());
  for (auto& c : candles)
    res.push_back(c.volume.value_or(NaN));
  return res;
}

EMA::EMA(const PriceSeries& candles, int period) noexcept
    : EMA{closes(candles), period} {}

// Bias-corrected exponential weighting: the weight of the price k periods back
// is (1 - alpha)^k, normalised over the history seen so far.
EMA::EMA(const std::vector<double>& prices, int period) noexcept
    : values(prices.size()), period(period) {
  auto alpha = 2.0 / (period + 1);
  auto decay = 1.0 - alpha;

  double num = 0.0, den = 0.0;
  for (size_t i = 0; i < prices.size(); i++) {
    num = prices[i] + decay * num;
    den = 1.0 + decay * den;
    values[i] = num / den;
  }
}

SMA::SMA(const PriceSeries& candles, int period) noexcept
    : SMA{closes(candles), period} {}

SMA::SMA(const std::vector<double>& prices, int period) noexcept
    : values(prices.size(), NaN), period(period) {
  if (period < 1)
    return;

  auto p = static_cast<size_t>(period);
  for (size_t i = p - 1; i < prices.size(); i++) {
    auto first = prices.begin() + (i + 1 - p);
    auto last = prices.begin() + (i + 1);
    values[i] = std::accumulate(first, last, 0.0) / period;
  }
}

RSI::RSI(const PriceSeries& candles, int period) noexcept
    : RSI{closes(candles), period} {}

RSI::RSI(const std::vector<double>& prices, int period) noexcept
    : values(prices.size(), NaN), period(period) {
  if (period < 1 || prices.size() < size_t(period + 1))
    return;

  // deltas[i] is the move into candle i; deltas[0] is unused
  std::vector<double> gains(prices.size(), 0.0), losses(prices.size(), 0.0);
  for (size_t i = 1; i < prices.size(); i++) {
    double change = prices[i] - prices[i - 1];
    gains[i] = change > 0 ? change : 0.0;
    losses[i] = change < 0 ? -change : 0.0;
  }

  auto p = static_cast<size_t>(period);
  for (size_t i = p; i < prices.size(); i++) {
    auto from = i + 1 - p;
    double avg_gain =
        std::accumulate(gains.begin() + from, gains.begin() + i + 1, 0.0) / p;
    double avg_loss =
        std::accumulate(losses.begin() + from, losses.begin() + i + 1, 0.0) /
        p;

    if (avg_loss == 0.0) {
      // flat window reads neutral, a window of pure gains reads maximal
      values[i] = avg_gain == 0.0 ? 50.0 : 100.0;
      continue;
    }

    double rs = avg_gain / avg_loss;
    values[i] = 100.0 - (100.0 / (1.0 + rs));
  }
}

MACD::MACD(const PriceSeries& candles,
           int fast,
           int slow,
           int signal) noexcept
    : macd_line(candles.size()),
      fast_ema{candles, fast},
      slow_ema{candles, slow}  //
{
  size_t n = candles.size();
  for (size_t i = 0; i < n; ++i)
    macd_line[i] = fast_ema.values[i] - slow_ema.values[i];

  signal_ema = EMA(macd_line, signal);
  auto& signal_line = signal_ema.values;

  histogram.reserve(n);
  for (size_t i = 0; i < n; ++i)
    histogram.push_back(macd_line[i] - signal_line[i]);
}

Indicators::Indicators(PriceSeries c, Date today) noexcept
    : today{today},
      candles{std::move(c)},
      _has_volume{::has_volume(candles)},
      _ema5{candles, 5},
      _ema12{candles, 12},
      _ema20{candles, 20},
      _ema26{candles, 26},
      _sma50{candles, 50},
      _sma200{candles, 200},
      _rsi{candles},
      _macd{candles},
      _vol5{volumes(candles), 5},
      _vol20{volumes(candles), 20},
      _vol50{volumes(candles), 50}  //
{}
