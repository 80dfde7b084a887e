#pragma once

#include "ind/candle.h"
#include "util/symbols.h"

#include <string>

// Supplies daily candles for an instrument. Throws on fetch failure; an
// instrument with no history comes back as an empty series.
class CandleSource {
 public:
  virtual ~CandleSource() = default;
  virtual PriceSeries fetch_series(const SymbolInfo& si, size_t lookback) = 0;
};

// Reads <dir>/<SYMBOL>.json shaped {"values": [{"datetime", "open", "high",
// "low", "close", "volume"}, ...]} in any order, numbers quoted as the feed
// sends them. '/' in a symbol maps to '_'.
class FileCandleSource : public CandleSource {
  std::string dir;

 public:
  explicit FileCandleSource(std::string dir) : dir{std::move(dir)} {}

  std::string path_of(const SymbolInfo& si) const;
  PriceSeries fetch_series(const SymbolInfo& si, size_t lookback) override;
};

// Parses one candle payload; ascending, duplicate timestamps collapsed.
// Throws std::runtime_error on malformed json.
PriceSeries read_candles_json(const std::string& str);
