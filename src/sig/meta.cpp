#include "sig/signal_types.h"

#include <spdlog/spdlog.h>
#include <unordered_map>

inline const std::unordered_map<DetectorType, Meta> detector_meta = {
    {DetectorType::Sma50Trend, {"sma_50_above", 50}},
    {DetectorType::EmaCrossover, {"ema_crossover", 26}},
    {DetectorType::GoldenCross, {"golden_cross", 200}},
    {DetectorType::SmaVolume, {"sma_volume", 200}},
    {DetectorType::ConfirmedBuy, {"confirmed_buy", 50}},
};

const Meta& meta_of(DetectorType type) {
  return detector_meta.at(type);
}

Mode mode_from_str(const std::string& str) {
  if (str == "all")
    return Mode::All;
  if (str != "confirmed_buy")
    spdlog::warn("[config] unknown mode \"{}\", using confirmed_buy",
                 str.c_str());
  return Mode::ConfirmedBuy;
}
