#pragma once

#include "core/market_hours.h"
#include "ind/candle.h"
#include "sig/signal_types.h"
#include "sig/verdict.h"
#include "util/symbols.h"
#include "util/times.h"

#include <vector>

// One detection pass over one instrument. Validates the series against the
// exchange session, runs the detectors of `mode` on what remains and stamps
// each verdict with the instrument, the as-of close and the signal date.
// Never throws; failures are logged and produce no verdicts.
std::vector<Verdict> generate(const SymbolInfo& si,
                              const PriceSeries& series,
                              Mode mode,
                              SysTimePoint now,
                              const MarketHours& market);
