#pragma once

#include "core/batch.h"

#include <mutex>
#include <string>
#include <vector>

class SignalStore {
 public:
  virtual ~SignalStore() = default;

  virtual std::vector<StoredSignal> load() = 0;

  // Deletes then inserts; throws if the plan cannot be written
  virtual void apply(const PersistPlan& plan) = 0;
};

// Stored signals as one json array in a file, rewritten on every apply
class JsonSignalStore : public SignalStore {
  std::string path;
  std::mutex mtx;

  std::vector<StoredSignal> read_file() const;
  void write_file(const std::vector<StoredSignal>& signals) const;

 public:
  explicit JsonSignalStore(std::string path) : path{std::move(path)} {}

  std::vector<StoredSignal> load() override;
  void apply(const PersistPlan& plan) override;
};

nlohmann::json verdict_to_json(const Verdict& v);
Verdict verdict_from_json(const nlohmann::json& j);
