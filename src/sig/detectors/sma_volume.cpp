#include "ind/indicators.h"
#include "sig/detectors.h"
#include "util/config.h"

inline auto& sig_config = config.sig_config;

// Close crossing the 200 SMA on a volume spike over the 20 candle average
std::optional<Verdict> sma_volume(const Indicators& ind) {
  if (ind.size() < static_cast<size_t>(meta_of(DetectorType::SmaVolume).min_candles))
    return std::nullopt;

  if (!ind.has_volume())
    return std::nullopt;

  double price = ind.close(-1), prev_price = ind.close(-2);
  double sma200 = ind.sma200(-1), prev_sma200 = ind.sma200(-2);
  double volume = ind.volume(-1);
  double avg_volume = ind.vol_avg20(-1);

  bool bullish = prev_price <= prev_sma200 && price > sma200;
  bool bearish = prev_price >= prev_sma200 && price < sma200;
  bool high_volume = volume > avg_volume * sig_config.volume_spike_factor;

  if (!high_volume || (!bullish && !bearish))
    return std::nullopt;

  nlohmann::json details = {
      {"type", bullish ? "sma_volume_breakout" : "sma_volume_breakdown"},
      {"price", price},
      {"sma_200", sma200},
      {"volume", volume},
      {"avg_volume", avg_volume},
      {"volume_ratio", volume / avg_volume},
      {"reason", bullish ? "Price crossed above 200 SMA with high volume"
                         : "Price crossed below 200 SMA with high volume"},
  };

  return Verdict{DetectorType::SmaVolume,
                 bullish ? SignalType::Buy : SignalType::Sell,
                 Strength::Strong, 0.80, std::move(details)};
}
