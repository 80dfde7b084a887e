#pragma once

#include "signal_types.h"
#include "util/symbols.h"
#include "util/times.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

struct Verdict {
  DetectorType detector = DetectorType::ConfirmedBuy;
  SignalType type = SignalType::Buy;
  Strength strength = Strength::Weak;
  double confidence = 0.0;

  double price = 0.0;
  std::optional<double> volume;
  std::optional<Date> signal_date;

  // named condition values that produced the verdict
  nlohmann::json details = nlohmann::json::object();

  // attached by the generator
  SymbolInfo si;
  std::string reason;

  Verdict() = default;
  Verdict(DetectorType detector,
          SignalType type,
          Strength strength,
          double confidence,
          nlohmann::json details = nlohmann::json::object())
      : detector{detector},
        type{type},
        strength{strength},
        confidence{confidence},
        details{std::move(details)} {}

  bool is_buy() const { return type == SignalType::Buy; }
};
