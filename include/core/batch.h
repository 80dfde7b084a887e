#pragma once

#include "core/market_hours.h"
#include "core/sources.h"
#include "sig/signal_types.h"
#include "sig/verdict.h"
#include "util/symbols.h"
#include "util/times.h"

#include <cstdint>
#include <string>
#include <vector>

struct BatchResult {
  std::vector<Verdict> verdicts;  // ordered by symbol id, then detector

  size_t n_instruments = 0;
  size_t n_processed = 0;
  size_t n_no_data = 0;
  size_t n_failed = 0;

  size_t n_buy = 0;
  size_t n_sell = 0;

  std::vector<std::string> errors;  // "<symbol>: <what>"
  double elapsed_ms = 0.0;
};

// `source` is called from `n_threads` workers at once. A failing instrument
// is counted and listed in `errors`; it never stops the batch.
BatchResult generate_batch(const Symbols& symbols,
                           CandleSource& source,
                           Mode mode,
                           SysTimePoint now,
                           const MarketHours& market,
                           size_t n_threads,
                           size_t lookback);

struct StoredSignal {
  int64_t id = 0;
  Verdict verdict;
};

struct PersistPlan {
  std::vector<Verdict> to_insert;
  std::vector<int64_t> expired;     // older than the retention window
  std::vector<int64_t> superseded;  // same (si.id, signal_date) as an insert
  size_t n_duplicates = 0;          // batch verdicts dropped by dedup

  bool empty() const {
    return to_insert.empty() && expired.empty() && superseded.empty();
  }
};

// At most one verdict per (si.id, signal_date) survives: highest
// confidence, the earlier one on ties. Two listings of one ticker are
// different instruments. Stored signals dated before `today - retention_days`
// expire.
PersistPlan plan_persistence(std::vector<Verdict> batch,
                             const std::vector<StoredSignal>& existing,
                             Date today,
                             int retention_days);
