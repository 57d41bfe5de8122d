#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mini_flow/compiled_workflow.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/execution.hpp"
#include "mini_flow/execution_store.hpp"
#include "mini_flow/interfaces.hpp"
#include "mini_flow/logging.hpp"
#include "mini_flow/run_executor.hpp"
#include "mini_flow/thread_pool.hpp"

namespace miniflow {

struct EngineOptions {
  size_t thread_pool_size = std::thread::hardware_concurrency();
  LogFn log;                              // empty = silent
  std::shared_ptr<ExecutionStore> store;  // empty = in-memory
};

struct KindMetric {
  int64_t count = 0;
  int64_t total_us = 0;
  int64_t max_us = 0;

  int64_t AverageUs() const { return count ? total_us / count : 0; }
};

using Observer = std::function<void(const TransitionEvent&)>;

// ==========================================
// Workflow engine
// ==========================================
//
// Owns the worker pool, the timer queue, the store and the registry of named
// definitions. Runs are started from a definition or a registered name and
// driven to a terminal status in the background.
class WorkflowEngine {
 public:
  explicit WorkflowEngine(EngineOptions options = {},
                          std::shared_ptr<TaskExecutor> executor = nullptr,
                          std::shared_ptr<ExternalService> service = nullptr)
      : log_(std::move(options.log)),
        store_(options.store ? std::move(options.store)
                             : std::make_shared<InMemoryExecutionStore>()),
        executor_(std::move(executor)),
        service_(std::move(service)),
        timers_(std::make_unique<TimerQueue>()),
        pool_(std::make_unique<ThreadPool>(options.thread_pool_size)) {
    LogMsg(LogLevel::kInfo,
           "[Engine] started with " + std::to_string(pool_->Size()) +
               " workers");
  }

  ~WorkflowEngine() {
    std::vector<std::shared_ptr<RunExecutor>> runs;
    {
      std::lock_guard<std::mutex> lock(runs_mu_);
      for (auto& [_, r] : runs_) runs.push_back(r);
    }
    for (auto& r : runs) r->Cancel("engine shutdown");
    timers_.reset();
    pool_.reset();
  }

  WorkflowEngine(const WorkflowEngine&) = delete;
  WorkflowEngine& operator=(const WorkflowEngine&) = delete;

  // ---- registry ----

  void RegisterWorkflow(const std::string& name, DefinitionPtr def) {
    auto compiled = CompiledWorkflow::Compile(std::move(def), log_);
    std::unique_lock<std::shared_mutex> lock(registry_mu_);
    if (workflows_.count(name)) {
      throw std::runtime_error("Workflow already registered: " + name);
    }
    workflows_[name] = std::move(compiled);
  }

  void ReplaceWorkflow(const std::string& name, DefinitionPtr def) {
    auto compiled = CompiledWorkflow::Compile(std::move(def), log_);
    std::unique_lock<std::shared_mutex> lock(registry_mu_);
    if (!workflows_.count(name)) {
      throw std::runtime_error("Cannot replace unknown workflow: " + name);
    }
    workflows_[name] = std::move(compiled);
  }

  bool HasWorkflow(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    return workflows_.count(name) > 0;
  }

  std::vector<std::string> ListWorkflows() const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    std::vector<std::string> names;
    names.reserve(workflows_.size());
    for (const auto& [k, _] : workflows_) names.push_back(k);
    return names;
  }

  DefinitionPtr Workflow(const std::string& name) const {
    return Registered(name)->DefinitionRef();
  }

  // ---- runs ----

  // Throws FlowError(kInvalidDefinition) if the definition does not validate.
  std::string Start(DefinitionPtr def, Variables variables = {}) {
    return Launch(CompiledWorkflow::Compile(std::move(def), log_),
                  std::move(variables));
  }

  std::string Start(const std::string& name, Variables variables = {}) {
    return Launch(Registered(name), std::move(variables));
  }

  std::shared_future<RunStatus> Completion(const std::string& run_id) const {
    return Run(run_id)->Completion();
  }

  RunStatus Wait(const std::string& run_id) const {
    return Completion(run_id).get();
  }

  // Empty if the run is still going after `timeout`.
  std::optional<RunStatus> WaitFor(const std::string& run_id,
                                   std::chrono::milliseconds timeout) const {
    auto f = Completion(run_id);
    if (f.wait_for(timeout) != std::future_status::ready) return std::nullopt;
    return f.get();
  }

  // False if the run already finished.
  bool Cancel(const std::string& run_id, const std::string& reason = "") {
    return Run(run_id)->Cancel(reason.empty() ? "cancelled" : reason);
  }

  // False unless the run was running.
  bool Pause(const std::string& run_id) { return Run(run_id)->Pause(); }

  // False unless the run was paused.
  bool Resume(const std::string& run_id) { return Run(run_id)->Resume(); }

  bool Approve(const std::string& run_id, const std::string& node_id) {
    return Run(run_id)->Approve(node_id);
  }

  bool Reject(const std::string& run_id, const std::string& node_id,
              const std::string& reason = "") {
    return Run(run_id)->Reject(node_id, reason);
  }

  std::vector<PendingApproval> PendingApprovals() const {
    std::vector<PendingApproval> out;
    for (const auto& r : Runs()) {
      auto pending = r->PendingApprovals();
      out.insert(out.end(), pending.begin(), pending.end());
    }
    return out;
  }

  std::optional<Execution> Inspect(const std::string& run_id) const {
    return store_->Get(run_id);
  }

  std::vector<std::string> ListRuns() const { return store_->List(); }

  // Drops finished runs that ended more than `older_than` ago.
  size_t Prune(std::chrono::milliseconds older_than) {
    auto cutoff = std::chrono::system_clock::now() - older_than;
    size_t removed = store_->Prune(cutoff);
    std::lock_guard<std::mutex> lock(runs_mu_);
    for (auto it = runs_.begin(); it != runs_.end();) {
      if (it->second->IsFinished() && !store_->Get(it->first)) {
        it = runs_.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  }

  std::map<NodeKind, KindMetric> Metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mu_);
    return metrics_;
  }

  // ---- observers ----

  int Subscribe(Observer observer) {
    std::unique_lock<std::shared_mutex> lock(observers_mu_);
    int id = ++next_observer_;
    observers_[id] = std::move(observer);
    return id;
  }

  void Unsubscribe(int id) {
    std::unique_lock<std::shared_mutex> lock(observers_mu_);
    observers_.erase(id);
  }

  ExecutionStore& Store() { return *store_; }

 private:
  LogFn log_;
  std::shared_ptr<ExecutionStore> store_;
  std::shared_ptr<TaskExecutor> executor_;
  std::shared_ptr<ExternalService> service_;

  std::unordered_map<std::string, CompiledWorkflowPtr> workflows_;
  mutable std::shared_mutex registry_mu_;

  std::map<std::string, std::shared_ptr<RunExecutor>> runs_;
  mutable std::mutex runs_mu_;
  std::atomic<uint64_t> next_run_{0};

  std::map<int, Observer> observers_;
  mutable std::shared_mutex observers_mu_;
  int next_observer_ = 0;

  std::map<NodeKind, KindMetric> metrics_;
  mutable std::mutex metrics_mu_;

  std::unique_ptr<TimerQueue> timers_;
  std::unique_ptr<ThreadPool> pool_;

  void LogMsg(LogLevel level, const std::string& msg) const {
    if (log_) log_(level, msg);
  }

  CompiledWorkflowPtr Registered(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    auto it = workflows_.find(name);
    if (it == workflows_.end()) {
      throw std::runtime_error("Unknown workflow: " + name);
    }
    return it->second;
  }

  std::shared_ptr<RunExecutor> Run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(runs_mu_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
      throw FlowError(ErrorKind::kUnknownRun, "no run with id '" + run_id + "'");
    }
    return it->second;
  }

  std::vector<std::shared_ptr<RunExecutor>> Runs() const {
    std::lock_guard<std::mutex> lock(runs_mu_);
    std::vector<std::shared_ptr<RunExecutor>> out;
    out.reserve(runs_.size());
    for (const auto& [_, r] : runs_) out.push_back(r);
    return out;
  }

  std::string Launch(CompiledWorkflowPtr wf, Variables variables) {
    std::string id = "run-" + std::to_string(++next_run_);
    RunServices svc;
    svc.pool = pool_.get();
    svc.timers = timers_.get();
    svc.store = store_;
    svc.executor = executor_;
    svc.service = service_;
    svc.log = log_;
    svc.notify = [this](const TransitionEvent& e) { Notify(e); };
    svc.record_metric = [this](NodeKind kind, int64_t us) {
      std::lock_guard<std::mutex> lock(metrics_mu_);
      KindMetric& m = metrics_[kind];
      ++m.count;
      m.total_us += us;
      m.max_us = std::max(m.max_us, us);
    };
    auto run = std::make_shared<RunExecutor>(id, std::move(wf),
                                             std::move(variables), std::move(svc));
    {
      std::lock_guard<std::mutex> lock(runs_mu_);
      runs_[id] = run;
    }
    try {
      run->Start();
    } catch (...) {
      std::lock_guard<std::mutex> lock(runs_mu_);
      runs_.erase(id);
      throw;
    }
    return id;
  }

  void Notify(const TransitionEvent& e) const {
    std::vector<Observer> observers;
    {
      std::shared_lock<std::shared_mutex> lock(observers_mu_);
      for (const auto& [_, o] : observers_) observers.push_back(o);
    }
    for (const auto& o : observers) {
      try {
        o(e);
      } catch (const std::exception& ex) {
        LogMsg(LogLevel::kWarn,
               std::string("[Engine] observer threw: ") + ex.what());
      }
    }
  }
};

}  // namespace miniflow
