#include "ind/indicators.h"
#include "sig/detectors.h"
#include "util/config.h"

inline auto& sig_config = config.sig_config;

ConfirmedBuyCheck check_confirmed_buy(const Indicators& ind) {
  ConfirmedBuyCheck chk;

  chk.open = ind.open(-1);
  chk.close = ind.close(-1);
  chk.ema5 = ind.ema5(-1);
  chk.ema20 = ind.ema20(-1);
  chk.sma50 = ind.sma50(-1);
  chk.rsi = ind.rsi(-1);
  chk.macd = ind.macd(-1);
  chk.macd_signal = ind.macd_signal(-1);

  // Most recent 5/20 cross in [-window-1, -2], the last closed candle excluded
  const int n = static_cast<int>(ind.size());
  const int window = sig_config.crossover_window;
  for (int j = -2; j >= -(window + 1) && n + j - 1 >= 0; j--) {
    if (ind.ema5(j) > ind.ema20(j) && ind.ema5(j - 1) <= ind.ema20(j - 1)) {
      chk.cross_idx = j;
      break;
    }
  }
  chk.ema_crossover = chk.cross_idx != 0 && chk.ema5 > chk.ema20;

  chk.price_above_emas = chk.open > chk.ema5 && chk.open > chk.ema20 &&
                         chk.close > chk.ema5 && chk.close > chk.ema20;

  chk.price_above_sma50 = chk.close > chk.sma50;

  if (ind.has_volume()) {
    auto ratio = ind.vol_avg5(-1) / ind.vol_avg50(-1);
    chk.volume_ratio = std::isfinite(ratio) ? ratio : 0.0;
  }
  chk.volume_confirmation = chk.volume_ratio > sig_config.volume_ratio_floor;

  chk.rsi_bullish = chk.rsi > sig_config.rsi_floor;
  chk.macd_cross = chk.macd > chk.macd_signal;

  return chk;
}

inline nlohmann::json to_details(const ConfirmedBuyCheck& chk,
                                 const char* type,
                                 const char* reason) {
  return {
      {"type", type},
      {"price", chk.close},
      {"open_price", chk.open},
      {"ema_5", chk.ema5},
      {"ema_20", chk.ema20},
      {"sma_50", chk.sma50},
      {"rsi", chk.rsi},
      {"macd", chk.macd},
      {"macd_signal", chk.macd_signal},
      {"volume_ratio", chk.volume_ratio},
      {"crossover_offset", chk.cross_idx},
      {"conditions_met", chk.conditions_met()},
      {"ema_crossover", chk.ema_crossover},
      {"price_above_emas", chk.price_above_emas},
      {"price_above_sma50", chk.price_above_sma50},
      {"volume_confirmation", chk.volume_confirmation},
      {"rsi_bullish", chk.rsi_bullish},
      {"macd_cross", chk.macd_cross},
      {"reason", reason},
  };
}

std::optional<Verdict> confirmed_buy(const Indicators& ind) {
  if (ind.size() < static_cast<size_t>(meta_of(DetectorType::ConfirmedBuy).min_candles))
    return std::nullopt;

  auto chk = check_confirmed_buy(ind);

  std::optional<Verdict> verdict;
  if (chk.all()) {
    verdict = Verdict{
        DetectorType::ConfirmedBuy, SignalType::Buy, Strength::Strong, 0.95,
        to_details(chk, "confirmed_buy_volume",
                   "Confirmed buy - all 6 conditions met: 5/20 EMA crossover, "
                   "open and close above EMAs, close above 50 SMA, volume "
                   "spike, RSI > 50, MACD > signal line")};
  } else if (sig_config.partial_credit && chk.conditions_met() == 5 &&
             !chk.volume_confirmation) {
    verdict = Verdict{
        DetectorType::ConfirmedBuy, SignalType::Buy, Strength::Moderate, 0.85,
        to_details(chk, "confirmed_buy_no_volume",
                   "Confirmed buy without volume confirmation - 5 of 6 "
                   "conditions met")};
  } else {
    return std::nullopt;
  }

  verdict->signal_date = ind.today;
  return verdict;
}
