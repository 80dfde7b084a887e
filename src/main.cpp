#include "core/batch.h"
#include "core/market_hours.h"
#include "core/sources.h"
#include "core/store.h"
#include "util/config.h"
#include "util/format.h"
#include "util/symbols.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// Full log to logs/sigscan_<stamp>.log, linked from logs/latest.log;
// warnings and errors are echoed to stderr.
inline void init_logging(const fs::path& log_dir) {
  auto stamp = std::format("{:%Y%m%d_%H%M%S}", now_utc_time());
  auto log_path = fs::absolute(log_dir / std::format("sigscan_{}.log", stamp));
  auto link_path = log_dir / "latest.log";

  std::error_code ec;
  fs::remove(link_path, ec);
  fs::create_symlink(log_path, link_path, ec);

  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string());
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_level(spdlog::level::warn);

  auto logger = std::make_shared<spdlog::logger>(
      "sigscan", spdlog::sinks_init_list{file_sink, err_sink});
  spdlog::set_default_logger(logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(spdlog::level::warn);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

  if (ec)
    spdlog::warn("[init] no {} link: {}", link_path.string(), ec.message());
}

inline bool ensure_directories_exist(const std::vector<fs::path>& dirs) {
  for (auto& dir : dirs) {
    if (dir.empty())
      continue;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      std::cerr << "cannot create " << dir.string() << ": " << ec.message()
                << '\n';
      return false;
    }
  }
  return true;
}

inline int run() {
  auto now = config.now();
  auto mode = config.mode();
  auto& sig_config = config.sig_config;

  spdlog::info("[init] mode {} as of {}", to_str(mode), to_str(now));

  auto symbols = Symbols::read_csv(config.symbols_path);
  if (symbols.empty()) {
    std::cerr << "no symbols in " << config.symbols_path << '\n';
    return 1;
  }

  MarketHours market;
  FileCandleSource source{config.data_dir};
  JsonSignalStore store{config.out_path};

  auto res = generate_batch(symbols, source, mode, now, market,
                            config.n_concurrency, sig_config.lookback);

  auto plan = plan_persistence(std::move(res.verdicts), store.load(),
                               utc_date(now), sig_config.retention_days);
  store.apply(plan);

  for (auto& v : plan.to_insert)
    std::cout << to_str(v) << '\n';

  std::cout << std::format(
      "{} instruments: {} processed, {} no data, {} failed; {} buy, {} sell "
      "({:.0f}ms)\n",
      res.n_instruments, res.n_processed, res.n_no_data, res.n_failed,
      res.n_buy, res.n_sell, res.elapsed_ms);

  for (auto& err : res.errors)
    std::cerr << err << '\n';

  return 0;
}

int main(int argc, char* argv[]) {
  try {
    config.read_args(argc, argv);
  } catch (const std::exception&) {
    return 1;
  }

  auto out_dir = fs::path{config.out_path}.parent_path();
  if (!ensure_directories_exist({"logs", config.data_dir, out_dir}))
    return 1;

  init_logging("logs");
  config.update();

  try {
    auto rc = run();
    std::cout << "[exit] main" << std::endl;
    return rc;
  } catch (const std::exception& ex) {
    spdlog::error("[main] {}", ex.what());
    std::cerr << ex.what() << '\n';
    return 1;
  }
}
