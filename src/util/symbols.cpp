#include "util/symbols.h"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

inline MarketType market_from_str(const std::string& str) {
  return (str == "crypto" || str == "CRYPTO") ? MarketType::Crypto
                                              : MarketType::Stock;
}

Symbols Symbols::read_csv(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    spdlog::error("[init] cannot open {}", path.c_str());
    return {};
  }

  Symbols symbols;
  std::string line;

  std::getline(file, line);

  size_t line_no = 1;
  while (std::getline(file, line)) {
    line_no++;
    if (line.empty())
      continue;

    std::istringstream ss(line);
    std::string id_str, symbol, exchange, market;

    if (std::getline(ss, id_str, ',') && std::getline(ss, symbol, ',') &&
        std::getline(ss, exchange, ',')) {
      std::getline(ss, market, ',');
      try {
        symbols.arr.push_back(
            {std::stoi(id_str), symbol, exchange, market_from_str(market)});
      } catch (const std::exception& ex) {
        spdlog::warn("[init] {}:{} skipped: {}", path.c_str(), line_no,
                     ex.what());
      }
    }
  }

  spdlog::info("[init] {} symbols", symbols.size());
  return symbols;
}
