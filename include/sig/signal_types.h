#pragma once

#include <string>

enum class SignalType { Buy, Sell };
enum class Strength { Weak, Moderate, Strong };

enum class DetectorType {
  Sma50Trend,
  EmaCrossover,
  GoldenCross,
  SmaVolume,
  ConfirmedBuy,
};

enum class Mode {
  ConfirmedBuy,  // production path
  All,
};

struct Meta {
  std::string str;
  int min_candles;
};

const Meta& meta_of(DetectorType type);

Mode mode_from_str(const std::string& str);
