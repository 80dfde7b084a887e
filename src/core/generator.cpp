#include "core/generator.h"
#include "ind/indicators.h"
#include "sig/detectors.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

std::vector<Verdict> generate(const SymbolInfo& si,
                              const PriceSeries& series,
                              Mode mode,
                              SysTimePoint now,
                              const MarketHours& market) {
  std::vector<Verdict> verdicts;

  try {
    auto validated = market.validate_for_signals(series, si.exchange, now);
    spdlog::debug("[gen] ({}) {}", si.symbol.c_str(), validated.reason.c_str());

    if (validated.empty()) {
      spdlog::info("[gen] ({}) no data after validation", si.symbol.c_str());
      return verdicts;
    }

    Indicators ind{std::move(validated.series), validated.signal_date};

    double price = ind.close(-1);
    auto volume = ind.series().back().volume;

    for (auto type : detectors_for(mode)) {
      auto verdict = run_detector(type, ind);
      if (!verdict)
        continue;

      verdict->si = si;
      verdict->price = price;
      verdict->volume = volume;
      if (!verdict->signal_date)
        verdict->signal_date = validated.signal_date;
      verdict->reason = validated.reason;

      spdlog::info("[gen] ({}) {}", si.symbol.c_str(), to_str(*verdict));
      verdicts.push_back(std::move(*verdict));
    }
  } catch (const std::exception& ex) {
    spdlog::error("[gen] ({}) {}", si.symbol.c_str(), ex.what());
    verdicts.clear();
  }

  return verdicts;
}
