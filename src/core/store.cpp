#include "core/store.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

inline DetectorType detector_from_str(const std::string& str) {
  for (auto type : {DetectorType::Sma50Trend, DetectorType::EmaCrossover,
                    DetectorType::GoldenCross, DetectorType::SmaVolume,
                    DetectorType::ConfirmedBuy})
    if (meta_of(type).str == str)
      return type;
  throw std::runtime_error(std::format("unknown detector {}", str));
}

inline Strength strength_from_str(const std::string& str) {
  if (str == "STRONG")
    return Strength::Strong;
  if (str == "MODERATE")
    return Strength::Moderate;
  return Strength::Weak;
}

nlohmann::json verdict_to_json(const Verdict& v) {
  nlohmann::json j = {
      {"symbol_id", v.si.id},
      {"symbol", v.si.symbol},
      {"exchange", v.si.exchange},
      {"market", to_str(v.si.market)},
      {"detector", to_str(v.detector)},
      {"signal_type", to_str(v.type)},
      {"strength", to_str(v.strength)},
      {"confidence", v.confidence},
      {"price", v.price},
      {"volume", nullptr},
      {"signal_date", nullptr},
      {"details", v.details},
      {"reason", v.reason},
  };

  if (v.volume)
    j["volume"] = *v.volume;
  if (v.signal_date)
    j["signal_date"] = to_str(*v.signal_date);

  return j;
}

Verdict verdict_from_json(const nlohmann::json& j) {
  Verdict v;
  v.si.id = j.at("symbol_id").get<int>();
  v.si.symbol = j.at("symbol").get<std::string>();
  v.si.exchange = j.value("exchange", "");
  v.si.market = j.value("market", "stock") == "crypto" ? MarketType::Crypto
                                                       : MarketType::Stock;

  v.detector = detector_from_str(j.at("detector").get<std::string>());
  v.type = j.at("signal_type").get<std::string>() == "SELL" ? SignalType::Sell
                                                            : SignalType::Buy;
  v.strength = strength_from_str(j.value("strength", "WEAK"));
  v.confidence = j.value("confidence", 0.0);
  v.price = j.value("price", 0.0);

  if (j.contains("volume") && j["volume"].is_number())
    v.volume = j["volume"].get<double>();
  if (j.contains("signal_date") && j["signal_date"].is_string())
    v.signal_date =
        utc_date(datetime_to_utc(j["signal_date"].get<std::string>()));

  v.details = j.value("details", nlohmann::json::object());
  v.reason = j.value("reason", "");
  return v;
}

std::vector<StoredSignal> JsonSignalStore::read_file() const {
  std::vector<StoredSignal> signals;
  if (!fs::exists(path))
    return signals;

  std::ifstream file{path};
  if (!file)
    throw std::runtime_error(std::format("cannot open {}", path));

  nlohmann::json arr;
  file >> arr;
  for (auto& j : arr) {
    try {
      signals.push_back({j.at("id").get<int64_t>(), verdict_from_json(j)});
    } catch (const std::exception& ex) {
      spdlog::warn("[store] skipping malformed row: {}", ex.what());
    }
  }

  return signals;
}

void JsonSignalStore::write_file(
    const std::vector<StoredSignal>& signals) const {
  auto arr = nlohmann::json::array();
  for (auto& s : signals) {
    auto j = verdict_to_json(s.verdict);
    j["id"] = s.id;
    arr.push_back(std::move(j));
  }

  auto parent = fs::path{path}.parent_path();
  if (!parent.empty())
    fs::create_directories(parent);

  auto tmp = path + ".tmp";
  {
    std::ofstream file{tmp, std::ios::trunc};
    if (!file)
      throw std::runtime_error(std::format("cannot write {}", tmp));
    file << arr.dump(2) << "\n";
  }
  fs::rename(tmp, path);
}

std::vector<StoredSignal> JsonSignalStore::load() {
  std::lock_guard lk{mtx};
  return read_file();
}

void JsonSignalStore::apply(const PersistPlan& plan) {
  std::lock_guard lk{mtx};

  auto signals = read_file();

  std::unordered_set<int64_t> removed{plan.expired.begin(),
                                      plan.expired.end()};
  removed.insert(plan.superseded.begin(), plan.superseded.end());

  std::erase_if(signals,
                [&](const StoredSignal& s) { return removed.contains(s.id); });

  int64_t next_id = 1;
  for (auto& s : signals)
    next_id = std::max(next_id, s.id + 1);

  for (auto& v : plan.to_insert)
    signals.push_back({next_id++, v});

  write_file(signals);

  spdlog::info("[store] {}: {} removed, {} inserted, {} stored", path.c_str(),
               removed.size(), plan.to_insert.size(), signals.size());
}
