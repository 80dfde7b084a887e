#pragma once

#include "signal_types.h"
#include "verdict.h"

#include <optional>
#include <span>

struct Indicators;

using detector_f = std::optional<Verdict> (*)(const Indicators&);

// Gate outcomes of the confirmed buy, evaluated at the last closed candle
struct ConfirmedBuyCheck {
  bool ema_crossover = false;
  bool price_above_emas = false;
  bool price_above_sma50 = false;
  bool volume_confirmation = false;
  bool rsi_bullish = false;
  bool macd_cross = false;

  int cross_idx = 0;  // most recent crossover offset, 0 if none
  double open = 0.0, close = 0.0;
  double ema5 = 0.0, ema20 = 0.0, sma50 = 0.0;
  double rsi = 0.0, macd = 0.0, macd_signal = 0.0;
  double volume_ratio = 0.0;

  int conditions_met() const {
    return ema_crossover + price_above_emas + price_above_sma50 +
           volume_confirmation + rsi_bullish + macd_cross;
  }
  bool all() const { return conditions_met() == 6; }
};

ConfirmedBuyCheck check_confirmed_buy(const Indicators& ind);

std::optional<Verdict> sma_above_50(const Indicators& ind);
std::optional<Verdict> ema_crossover(const Indicators& ind);
std::optional<Verdict> golden_cross(const Indicators& ind);
std::optional<Verdict> sma_volume(const Indicators& ind);
std::optional<Verdict> confirmed_buy(const Indicators& ind);

// Never throws; a failing detector is logged and yields no verdict
std::optional<Verdict> run_detector(DetectorType type, const Indicators& ind);

std::span<const DetectorType> detectors_for(Mode mode);
