#include "core/batch.h"
#include "core/generator.h"
#include "mt/thread_pool.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <mutex>
#include <utility>

BatchResult generate_batch(const Symbols& symbols,
                           CandleSource& source,
                           Mode mode,
                           SysTimePoint now,
                           const MarketHours& market,
                           size_t n_threads,
                           size_t lookback) {
  Timer timer;

  BatchResult res;
  res.n_instruments = symbols.size();

  std::mutex mtx;

  auto process = [&](SymbolInfo&& si) {
    PriceSeries series;
    try {
      series = source.fetch_series(si, lookback);
    } catch (const std::exception& ex) {
      spdlog::error("[batch] ({}) fetch failed: {}", si.symbol.c_str(),
                    ex.what());
      std::lock_guard lk{mtx};
      res.n_failed++;
      res.errors.push_back(std::format("{}: {}", si.symbol, ex.what()));
      return;
    }

    if (series.empty()) {
      spdlog::warn("[batch] ({}) no data", si.symbol.c_str());
      std::lock_guard lk{mtx};
      res.n_no_data++;
      return;
    }

    auto verdicts = generate(si, series, mode, now, market);

    std::lock_guard lk{mtx};
    res.n_processed++;
    std::move(verdicts.begin(), verdicts.end(),
              std::back_inserter(res.verdicts));
  };

  {
    thread_pool<SymbolInfo> pool{n_threads, process, symbols.arr};
    pool.drain();
  }

  std::stable_sort(res.verdicts.begin(), res.verdicts.end(),
                   [](const Verdict& a, const Verdict& b) {
                     return std::pair{a.si.id, a.detector} <
                            std::pair{b.si.id, b.detector};
                   });

  for (auto& v : res.verdicts)
    (v.is_buy() ? res.n_buy : res.n_sell)++;

  res.elapsed_ms = timer.diff_ms();

  spdlog::info(
      "[batch] {} instruments, {} processed, {} no data, {} failed, {} buy, "
      "{} sell in {:.0f}ms",
      res.n_instruments, res.n_processed, res.n_no_data, res.n_failed,
      res.n_buy, res.n_sell, res.elapsed_ms);

  return res;
}

// (instrument id, signal date)
using SignalKey = std::pair<int, Date>;

inline SignalKey key_of(const Verdict& v, Date today) {
  return {v.si.id, v.signal_date.value_or(today)};
}

PersistPlan plan_persistence(std::vector<Verdict> batch,
                             const std::vector<StoredSignal>& existing,
                             Date today,
                             int retention_days) {
  PersistPlan plan;

  auto cutoff = today - days{retention_days};

  std::map<SignalKey, size_t> best;
  for (size_t i = 0; i < batch.size(); i++) {
    auto [it, inserted] = best.try_emplace(key_of(batch[i], today), i);
    if (!inserted && batch[i].confidence > batch[it->second].confidence)
      it->second = i;
  }

  for (size_t i = 0; i < batch.size(); i++) {
    auto key = key_of(batch[i], today);
    if (best.at(key) != i)
      continue;
    batch[i].signal_date = key.second;
    plan.to_insert.push_back(std::move(batch[i]));
  }
  plan.n_duplicates = batch.size() - plan.to_insert.size();

  for (auto& stored : existing) {
    auto key = key_of(stored.verdict, today);
    if (key.second < cutoff)
      plan.expired.push_back(stored.id);
    else if (best.contains(key))
      plan.superseded.push_back(stored.id);
  }

  spdlog::info("[store] plan: {} insert, {} duplicate, {} expired, {} "
               "superseded",
               plan.to_insert.size(), plan.n_duplicates, plan.expired.size(),
               plan.superseded.size());

  return plan;
}
