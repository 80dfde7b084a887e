#include "ind/indicators.h"
#include "sig/detectors.h"

std::optional<Verdict> sma_above_50(const Indicators& ind) {
  if (ind.size() < static_cast<size_t>(meta_of(DetectorType::Sma50Trend).min_candles))
    return std::nullopt;

  double price = ind.close(-1), prev_price = ind.close(-2);
  double sma50 = ind.sma50(-1), prev_sma50 = ind.sma50(-2);

  bool crossed_above = prev_price <= prev_sma50 && price > sma50;
  bool above = price > sma50;
  bool rising = price > prev_price;

  if (!crossed_above && !(above && rising))
    return std::nullopt;

  nlohmann::json details = {
      {"type", "sma_50_above"},
      {"price", price},
      {"sma_50", sma50},
      {"crossed_above", crossed_above},
      {"reason", crossed_above ? "Price crossed above SMA 50"
                               : "Price above SMA 50 and trending up"},
  };

  if (above)
    return Verdict{DetectorType::Sma50Trend, SignalType::Buy, Strength::Weak,
                   0.50, std::move(details)};
  return Verdict{DetectorType::Sma50Trend, SignalType::Buy, Strength::Moderate,
                 0.65, std::move(details)};
}
