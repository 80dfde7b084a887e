#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

template <typename T>
T read(const std::string& path) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::info("[config] {} not found, using defaults", path.c_str());
    return t;
  }

  auto ec = glz::read_file_json(t, path, std::string{});
  if (ec) {
    spdlog::error("[config] {} error {}", path.c_str(),
                  glz::format_error(ec));
    t = T{};
  }

  if (T::debug) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer.c_str());
  }

  return t;
}

void Config::update() {
  fs::remove("logs/configs.log");

  auto dir = fs::path{config_dir};
  sig_config = read<SignalConfig>((dir / "signal.json").string());
  market_config = read<MarketHoursConfig>((dir / "market_hours.json").string());
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("sigscan");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  program.add_argument("-m", "--mode")
      .help("Detector set: confirmed_buy or all (overrides signal.json)")
      .default_value(std::string{});

  program.add_argument("--data")
      .help("Directory of <SYMBOL>.json candle files")
      .default_value(std::string{"data"});

  program.add_argument("--symbols")
      .help("Symbols csv: id,symbol,exchange,market")
      .default_value(std::string{"private/tickers.csv"});

  program.add_argument("-o", "--out")
      .help("Signal store file")
      .default_value(std::string{"data/signals.json"});

  program.add_argument("-c", "--config")
      .help("Directory holding signal.json and market_hours.json")
      .default_value(std::string{"private"});

  program.add_argument("--now")
      .help("Evaluate as of this UTC instant, \"YYYY-MM-DD HH:MM:SS\"")
      .default_value(std::string{});

  auto def_nthreads = static_cast<size_t>(std::thread::hardware_concurrency());
  program.add_argument("--nthreads")
      .help("Max number of concurrent threads")
      .default_value(def_nthreads)
      .scan<'d', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    throw;
  }

  debug_en = program.get<bool>("--debug");
  mode_str = program.get<std::string>("--mode");
  data_dir = program.get<std::string>("--data");
  symbols_path = program.get<std::string>("--symbols");
  out_path = program.get<std::string>("--out");
  config_dir = program.get<std::string>("--config");
  now_str = program.get<std::string>("--now");

  n_concurrency = std::max<size_t>(1, program.get<size_t>("--nthreads"));
}
