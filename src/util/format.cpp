#include "util/format.h"
#include "ind/candle.h"
#include "sig/signal_types.h"
#include "sig/verdict.h"
#include "util/symbols.h"
#include "util/times.h"

#include <string>

template <>
std::string to_str(const int& v) {
  return std::to_string(v);
}

template <>
std::string to_str(const size_t& v) {
  return std::to_string(v);
}

template <>
std::string to_str(const double& v) {
  return std::format("{:.2f}", v);
}

template <>
std::string to_str(const std::string& str) {
  return str;
}

template <>
std::string to_str(const SysTimePoint& datetime) {
  return std::format("{:%F %T}", datetime);
}

template <>
std::string to_str(const Date& date) {
  return std::format("{:%F}", date);
}

template <>
std::string to_str(const Candle& candle) {
  auto vol = candle.volume ? std::format("{:.0f}", *candle.volume) : "-";
  return std::format("{} {:.2f} {:.2f} {:.2f} {:.2f} {}",  //
                     candle.time(), candle.open, candle.high, candle.low,
                     candle.close, vol);
}

template <>
std::string to_str(const SignalType& type) {
  return type == SignalType::Buy ? "BUY" : "SELL";
}

template <>
std::string to_str(const Strength& strength) {
  switch (strength) {
    case Strength::Strong:
      return "STRONG";
    case Strength::Moderate:
      return "MODERATE";
    default:
      return "WEAK";
  }
}

template <>
std::string to_str(const DetectorType& type) {
  return meta_of(type).str;
}

template <>
std::string to_str(const Mode& mode) {
  return mode == Mode::All ? "all" : "confirmed_buy";
}

template <>
std::string to_str(const MarketType& market) {
  return market == MarketType::Crypto ? "crypto" : "stock";
}

template <>
std::string to_str(const Verdict& v) {
  return std::format("{} {} {} {:.2f} @ {:.2f} [{}]",  //
                     v.si.symbol.c_str(), to_str(v.detector), to_str(v.type),
                     v.confidence, v.price, to_str(v.strength));
}
