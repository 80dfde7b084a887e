#include "core/sources.h"
#include "util/format.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <glaze/glaze.hpp>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

template <>
struct glz::meta<SysTimePoint> {
  using T = SysTimePoint;

  static constexpr auto write = [](const T& time_point) {
    return std::format("{:%F %T}", time_point);
  };

  static constexpr auto read = [](T& t, const std::string& str) {
    t = datetime_to_utc(str);
  };

  static constexpr auto value = custom<read, write>;
};

struct CandleFile {
  std::vector<Candle> values;
};

PriceSeries read_candles_json(const std::string& str) {
  constexpr auto opts = glz::opts{
      .error_on_unknown_keys = false,
      .quoted_num = true,
  };

  CandleFile file;
  auto ec = glz::read<opts>(file, str);
  if (ec)
    throw std::runtime_error(glz::format_error(ec, str));

  auto& candles = file.values;
  std::stable_sort(candles.begin(), candles.end(),
                   [](auto& a, auto& b) { return a.datetime < b.datetime; });

  // keep the last of any repeated timestamp
  PriceSeries series;
  series.reserve(candles.size());
  for (auto& c : candles) {
    if (!series.empty() && series.back().datetime == c.datetime)
      series.back() = c;
    else
      series.push_back(c);
  }

  return series;
}

std::string FileCandleSource::path_of(const SymbolInfo& si) const {
  auto name = si.symbol;
  std::replace(name.begin(), name.end(), '/', '_');
  return (fs::path{dir} / (name + ".json")).string();
}

PriceSeries FileCandleSource::fetch_series(const SymbolInfo& si,
                                           size_t lookback) {
  auto path = path_of(si);

  std::ifstream file{path};
  if (!file)
    throw std::runtime_error(std::format("cannot open {}", path));

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto series = read_candles_json(buffer.str());
  if (lookback > 0 && series.size() > lookback)
    series.erase(series.begin(),
                 series.end() - static_cast<ptrdiff_t>(lookback));

  if (!series.empty())
    spdlog::debug("[source] ({}) {} candles from {}, last {}",
                  si.symbol.c_str(), series.size(), path.c_str(),
                  to_str(series.back()));
  return series;
}
