#pragma once

#include "ind/candle.h"
#include "util/config.h"
#include "util/times.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

struct ExchangeHours {
  std::string name;
  std::string timezone;
  minutes open;
  minutes close;
};

struct MarketValidation {
  PriceSeries series;  // forming candle removed where needed
  Date signal_date;
  std::string reason;

  bool empty() const { return series.empty(); }
};

// Regular session hours per exchange. Weekends are closed; public holidays
// are not modelled and read as regular sessions.
class MarketHours {
  std::unordered_map<std::string, ExchangeHours> table;

 public:
  MarketHours() : MarketHours{config.market_config} {}
  explicit MarketHours(const MarketHoursConfig& cfg);

  const ExchangeHours* find(std::string_view exchange) const;
  bool is_known(std::string_view exchange) const {
    return find(exchange) != nullptr;
  }

  // Unknown exchanges read as closed
  bool is_open(std::string_view exchange, SysTimePoint now) const;

  std::optional<SysTimePoint> close_time(std::string_view exchange,
                                         Date date) const;

  // Drops the last candle when it is dated today and the session is still
  // running, unless it is the only candle.
  std::pair<PriceSeries, std::string> validate(PriceSeries series,
                                               std::string_view exchange,
                                               SysTimePoint now) const;

  // Always the UTC date of `now`; the reason names the candle actually used.
  std::pair<Date, std::string> signal_date(const PriceSeries& series,
                                           std::string_view exchange,
                                           SysTimePoint now) const;

  MarketValidation validate_for_signals(PriceSeries series,
                                        std::string_view exchange,
                                        SysTimePoint now) const;
};
