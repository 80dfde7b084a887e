#include "core/market_hours.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <format>

using namespace std::chrono;

inline std::string to_upper(std::string_view str) {
  std::string res{str};
  std::transform(res.begin(), res.end(), res.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return res;
}

MarketHours::MarketHours(const MarketHoursConfig& cfg) {
  for (auto& ex : cfg.exchanges) {
    try {
      locate_zone(ex.timezone);
      ExchangeHours entry{ex.name, ex.timezone, parse_time_of_day(ex.open),
                          parse_time_of_day(ex.close)};
      table.insert_or_assign(to_upper(ex.name), std::move(entry));
    } catch (const std::exception& e) {
      spdlog::error("[market] skipping exchange {}: {}", ex.name.c_str(),
                    e.what());
    }
  }
}

const ExchangeHours* MarketHours::find(std::string_view exchange) const {
  auto it = table.find(to_upper(exchange));
  return it == table.end() ? nullptr : &it->second;
}

bool MarketHours::is_open(std::string_view exchange, SysTimePoint now) const {
  auto* ex = find(exchange);
  if (!ex) {
    spdlog::warn("[market] unknown exchange {}, assuming closed",
                 std::string(exchange).c_str());
    return false;
  }

  auto local = to_zone_local(now, ex->timezone);
  auto day = floor<days>(local);

  weekday wd{day};
  if (wd == Saturday || wd == Sunday)
    return false;

  auto time_of_day = local - day;
  return ex->open <= time_of_day && time_of_day <= ex->close;
}

std::optional<SysTimePoint> MarketHours::close_time(std::string_view exchange,
                                                    Date date) const {
  auto* ex = find(exchange);
  if (!ex)
    return std::nullopt;

  auto local_close = local_days{date.time_since_epoch()} + ex->close;
  zoned_time zt{locate_zone(ex->timezone), local_close, choose::latest};
  return floor<seconds>(zt.get_sys_time());
}

std::pair<PriceSeries, std::string> MarketHours::validate(
    PriceSeries series,
    std::string_view exchange,
    SysTimePoint now) const {
  if (series.empty())
    return {std::move(series), "No data provided"};

  auto last_date = series.back().date();
  auto today = utc_date(now);

  if (last_date < today) {
    auto reason = std::format("Using all data - last candle from {:%F}",
                              last_date);
    return {std::move(series), reason};
  }

  if (is_open(exchange, now)) {
    if (series.size() == 1) {
      auto reason = std::format(
          "Market open but only one candle available - using {:%F} with "
          "caution",
          last_date);
      return {std::move(series), reason};
    }

    series.pop_back();
    auto reason = std::format(
        "Market open - removed today's forming candle, using {:%F}",
        series.back().date());
    return {std::move(series), reason};
  }

  if (!is_known(exchange)) {
    auto reason = std::format(
        "Unknown exchange {} treated as closed - using {:%F}", exchange,
        last_date);
    return {std::move(series), reason};
  }

  auto close = close_time(exchange, today);
  if (close && now >= *close) {
    auto reason = std::format(
        "Market closed - using today's closed candle {:%F}", last_date);
    return {std::move(series), reason};
  }

  auto reason = std::format("Market closed (weekend/holiday?) - using {:%F}",
                            last_date);
  return {std::move(series), reason};
}

inline std::string date_reason(const PriceSeries& validated, Date today) {
  if (validated.empty())
    return "No data available - using today's date";
  return std::format("Signal date: {:%F} (based on {:%F} candle)", today,
                     validated.back().date());
}

std::pair<Date, std::string> MarketHours::signal_date(
    const PriceSeries& series,
    std::string_view exchange,
    SysTimePoint now) const {
  auto today = utc_date(now);
  auto [validated, _] = validate(series, exchange, now);
  return {today, date_reason(validated, today)};
}

MarketValidation MarketHours::validate_for_signals(PriceSeries series,
                                                   std::string_view exchange,
                                                   SysTimePoint now) const {
  auto today = utc_date(now);
  auto [validated, reason] = validate(std::move(series), exchange, now);
  auto date_msg = date_reason(validated, today);

  return {std::move(validated), today,
          std::format("{}; {}", reason, date_msg)};
}
