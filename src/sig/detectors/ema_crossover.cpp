#include "ind/indicators.h"
#include "sig/detectors.h"
#include "util/config.h"

inline auto& sig_config = config.sig_config;

std::optional<Verdict> ema_crossover(const Indicators& ind) {
  if (ind.size() < static_cast<size_t>(meta_of(DetectorType::EmaCrossover).min_candles))
    return std::nullopt;

  double ema12 = ind.ema12(-1), ema26 = ind.ema26(-1);
  double prev_ema12 = ind.ema12(-2), prev_ema26 = ind.ema26(-2);
  double rsi = ind.rsi(-1);

  bool bullish = prev_ema12 <= prev_ema26 && ema12 > ema26;
  bool bearish = prev_ema12 >= prev_ema26 && ema12 < ema26;

  auto details = [&](const char* reason) {
    return nlohmann::json{
        {"type", "ema_crossover"},
        {"ema_12", ema12},
        {"ema_26", ema26},
        {"rsi", rsi},
        {"reason", reason},
    };
  };

  // Not overbought
  if (bullish && rsi < sig_config.rsi_overbought)
    return Verdict{DetectorType::EmaCrossover, SignalType::Buy,
                   Strength::Moderate, 0.70,
                   details("Bullish EMA crossover with RSI confirmation")};

  // Not oversold
  if (bearish && rsi > sig_config.rsi_oversold)
    return Verdict{DetectorType::EmaCrossover, SignalType::Sell,
                   Strength::Moderate, 0.70,
                   details("Bearish EMA crossover with RSI confirmation")};

  return std::nullopt;
}
