#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "mini_flow/errors.hpp"
#include "mini_flow/execution.hpp"

namespace miniflow {

// ==========================================
// Execution store
// ==========================================

// Holds every run's state. A terminal execution is history: Update() on it
// throws.
class ExecutionStore {
 public:
  virtual ~ExecutionStore() = default;

  // Throws std::runtime_error if the id is taken.
  virtual void Create(Execution execution) = 0;
  virtual std::optional<Execution> Get(const std::string& run_id) const = 0;
  // Throws FlowError(kUnknownRun) for an unknown id and std::runtime_error
  // for a terminal run.
  virtual void Update(const std::string& run_id,
                      const std::function<void(Execution&)>& fn) = 0;
  virtual std::vector<std::string> List() const = 0;
  // Drops terminal runs that ended before `before`; returns how many.
  virtual size_t Prune(std::chrono::system_clock::time_point before) = 0;
};

class InMemoryExecutionStore : public ExecutionStore {
 public:
  void Create(Execution execution) override {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (runs_.count(execution.id)) {
      throw std::runtime_error("Execution already exists: " + execution.id);
    }
    std::string id = execution.id;
    runs_[id] = std::move(execution);
  }

  std::optional<Execution> Get(const std::string& run_id) const override {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return std::nullopt;
    return it->second;
  }

  void Update(const std::string& run_id,
              const std::function<void(Execution&)>& fn) override {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
      throw FlowError(ErrorKind::kUnknownRun, "no run with id '" + run_id + "'");
    }
    if (it->second.IsTerminal()) {
      throw std::runtime_error("Execution is terminal and read-only: " + run_id);
    }
    fn(it->second);
  }

  std::vector<std::string> List() const override {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<std::string> ids;
    ids.reserve(runs_.size());
    for (const auto& [k, _] : runs_) ids.push_back(k);
    return ids;
  }

  size_t Prune(std::chrono::system_clock::time_point before) override {
    std::unique_lock<std::shared_mutex> lock(mu_);
    size_t removed = 0;
    for (auto it = runs_.begin(); it != runs_.end();) {
      const Execution& e = it->second;
      if (e.IsTerminal() && e.ended_at && *e.ended_at < before) {
        it = runs_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

 private:
  std::map<std::string, Execution> runs_;
  mutable std::shared_mutex mu_;
};

}  // namespace miniflow
