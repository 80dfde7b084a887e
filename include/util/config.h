#pragma once

#include "sig/signal_types.h"
#include "util/times.h"

#include <string>
#include <vector>

struct SignalConfig {
  static constexpr const char* name = "sig_config";
  static constexpr bool debug = true;

  std::string mode = "confirmed_buy";  // or "all"

  size_t lookback = 100;
  int retention_days = 10;

  // Confirmed buy
  int crossover_window = 10;  // candles before the last closed one
  double rsi_floor = 50.0;
  double volume_ratio_floor = 1.0;
  bool partial_credit = false;  // 5 of 6 without volume confirmation

  // EMA crossover
  double rsi_overbought = 70.0;
  double rsi_oversold = 30.0;

  // SMA + volume breakout
  double volume_spike_factor = 1.2;
};

struct ExchangeConfig {
  std::string name;
  std::string timezone;
  std::string open;   // "HH:MM" local
  std::string close;  // "HH:MM" local
};

struct MarketHoursConfig {
  static constexpr const char* name = "market_config";
  static constexpr bool debug = true;

  std::vector<ExchangeConfig> exchanges = {
      {"NYSE", "America/New_York", "09:30", "16:00"},
      {"NASDAQ", "America/New_York", "09:30", "16:00"},
      {"ASX", "Australia/Sydney", "10:00", "16:00"},
  };
};

struct Config {
  bool debug_en = false;
  size_t n_concurrency = 1;

  std::string config_dir = "private";
  std::string data_dir = "data";
  std::string symbols_path = "private/tickers.csv";
  std::string out_path = "data/signals.json";

  // evaluation instant override, "%F %T" UTC; empty means wall clock
  std::string now_str;
  std::string mode_str;

  SignalConfig sig_config;
  MarketHoursConfig market_config;

  Config() = default;
  void read_args(int argc, char* argv[]);
  void update();

  Mode mode() const {
    return mode_from_str(mode_str.empty() ? sig_config.mode : mode_str);
  }

  SysTimePoint now() const {
    return now_str.empty() ? now_utc_time() : datetime_to_utc(now_str);
  }
};

inline Config config;
