#include "ind/indicators.h"
#include "sig/detectors.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

// Indexed by DetectorType
inline constexpr detector_f detector_funcs[] = {
    sma_above_50,
    ema_crossover,
    golden_cross,
    sma_volume,
    confirmed_buy,
};

inline constexpr DetectorType confirmed_buy_only[] = {
    DetectorType::ConfirmedBuy,
};

inline constexpr DetectorType all_detectors[] = {
    DetectorType::Sma50Trend,   DetectorType::EmaCrossover,
    DetectorType::GoldenCross,  DetectorType::SmaVolume,
    DetectorType::ConfirmedBuy,
};

std::span<const DetectorType> detectors_for(Mode mode) {
  if (mode == Mode::All)
    return all_detectors;
  return confirmed_buy_only;
}

std::optional<Verdict> run_detector(DetectorType type, const Indicators& ind) {
  try {
    auto verdict = detector_funcs[static_cast<size_t>(type)](ind);
    if (verdict)
      spdlog::debug("[detect] {} {} {:.2f}", to_str(type), to_str(verdict->type),
                    verdict->confidence);
    return verdict;
  } catch (const std::exception& ex) {
    spdlog::error("[detect] {} failed: {}", to_str(type), ex.what());
    return std::nullopt;
  }
}
