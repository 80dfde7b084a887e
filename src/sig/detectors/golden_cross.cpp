#include "ind/indicators.h"
#include "sig/detectors.h"

std::optional<Verdict> golden_cross(const Indicators& ind) {
  if (ind.size() < static_cast<size_t>(meta_of(DetectorType::GoldenCross).min_candles))
    return std::nullopt;

  double sma50 = ind.sma50(-1), sma200 = ind.sma200(-1);
  double prev_sma50 = ind.sma50(-2), prev_sma200 = ind.sma200(-2);

  if (prev_sma50 <= prev_sma200 && sma50 > sma200) {
    nlohmann::json details = {
        {"type", "golden_cross"},
        {"sma_50", sma50},
        {"sma_200", sma200},
        {"reason", "Golden Cross - 50 SMA crossed above 200 SMA"},
    };
    return Verdict{DetectorType::GoldenCross, SignalType::Buy, Strength::Strong,
                   0.85, std::move(details)};
  }

  if (prev_sma50 >= prev_sma200 && sma50 < sma200) {
    nlohmann::json details = {
        {"type", "death_cross"},
        {"sma_50", sma50},
        {"sma_200", sma200},
        {"reason", "Death Cross - 50 SMA crossed below 200 SMA"},
    };
    return Verdict{DetectorType::GoldenCross, SignalType::Sell,
                   Strength::Strong, 0.85, std::move(details)};
  }

  return std::nullopt;
}
