#pragma once

#include <string>
#include <vector>

enum class MarketType { Stock, Crypto };

struct SymbolInfo {
  int id = 0;
  std::string symbol;
  std::string exchange;
  MarketType market = MarketType::Stock;
};

struct Symbols {
  std::vector<SymbolInfo> arr;

  Symbols() noexcept = default;
  Symbols(std::vector<SymbolInfo> arr) noexcept : arr{std::move(arr)} {}

  // csv with header: id,symbol,exchange,market
  static Symbols read_csv(const std::string& path);

  auto size() const { return arr.size(); }
  bool empty() const { return arr.empty(); }

  auto begin() { return arr.begin(); }
  auto begin() const { return arr.begin(); }

  auto end() { return arr.end(); }
  auto end() const { return arr.end(); }
};
