#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "mini_flow/compiled_workflow.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/execution.hpp"
#include "mini_flow/execution_store.hpp"
#include "mini_flow/interfaces.hpp"
#include "mini_flow/logging.hpp"
#include "mini_flow/thread_pool.hpp"

namespace miniflow {

struct PendingApproval {
  std::string run_id;
  std::string node_id;
  std::string message;
  std::chrono::system_clock::time_point since;
};

// What a run needs from the engine that owns it.
struct RunServices {
  ThreadPool* pool = nullptr;
  TimerQueue* timers = nullptr;
  std::shared_ptr<ExecutionStore> store;
  std::shared_ptr<TaskExecutor> executor;
  std::shared_ptr<ExternalService> service;
  LogFn log;
  std::function<void(const TransitionEvent&)> notify;
  std::function<void(NodeKind, int64_t)> record_metric;
};

// ==========================================
// Per-run executor
// ==========================================
//
// Every forward edge resolves once to FIRED, SKIPPED or FAILED. A node is
// READY when all its forward in-edges are resolved and one of them FIRED; if
// none FIRED it is SKIPPED and passes the outcome on. All state changes
// happen under mu_; transition events are queued and delivered after the
// lock is released, so observers may call back into the engine.
class RunExecutor : public std::enable_shared_from_this<RunExecutor> {
 public:
  RunExecutor(std::string run_id, CompiledWorkflowPtr wf, Variables variables,
              RunServices services)
      : wf_(std::move(wf)),
        svc_(std::move(services)),
        edges_(wf_->Edges().size(), EdgeState::kPending),
        rt_(wf_->Nodes().size()) {
    const auto& def = wf_->Definition();
    exec_.id = std::move(run_id);
    exec_.workflow_id = def.id();
    exec_.workflow_name = def.name();
    exec_.definition = wf_->DefinitionRef();
    exec_.started_at = std::chrono::system_clock::now();
    exec_.variables = def.variables();
    for (auto& [k, v] : variables) exec_.variables[k] = std::move(v);
    for (const auto& n : wf_->Nodes()) {
      exec_.nodes[n.name] = NodeState{};
    }
    for (const auto& n : wf_->Nodes()) {
      states_.push_back(&exec_.nodes.at(n.name));
    }
    future_ = promise_.get_future().share();
  }

  const std::string& Id() const { return exec_.id; }
  std::shared_future<RunStatus> Completion() const { return future_; }

  // Stores the new execution and schedules the start node.
  void Start() {
    svc_.store->Create(exec_);
    Mutate([this] {
      SetRun(RunStatus::kRunning);
      LogMsg(LogLevel::kInfo, "started workflow '" + exec_.workflow_id + "'");
      int64_t timeout = wf_->Definition().timeout_ms();
      if (timeout > 0) {
        std::weak_ptr<RunExecutor> weak = shared_from_this();
        run_timer_ = svc_.timers->Schedule(
            std::chrono::milliseconds(timeout), [weak, timeout] {
              if (auto self = weak.lock()) {
                self->Mutate([&] {
                  self->FailRun("", ErrorKind::kTimeoutExceeded,
                                "run exceeded " + std::to_string(timeout) +
                                    "ms");
                });
              }
            });
      }
      MakeReady(wf_->Start());
    });
  }

  bool Cancel(const std::string& reason) {
    bool done = false;
    Mutate([&] {
      if (!IsLive(exec_.status)) return;
      exec_.cancel_reason = reason;
      LogMsg(LogLevel::kInfo, "cancelled: " + reason);
      StopActive();
      SetRun(RunStatus::kCancelled);
      Finish();
      done = true;
    });
    return done;
  }

  // A paused run lets in-flight work land but dispatches nothing new.
  bool Pause() {
    bool done = false;
    Mutate([&] {
      if (exec_.status != RunStatus::kRunning) return;
      SetRun(RunStatus::kPaused);
      LogMsg(LogLevel::kInfo, "paused");
      done = true;
    });
    return done;
  }

  bool Resume() {
    bool done = false;
    Mutate([&] {
      if (exec_.status != RunStatus::kPaused) return;
      SetRun(RunStatus::kRunning);
      LogMsg(LogLevel::kInfo, "resumed");
      done = true;
    });
    return done;
  }

  // False if the node is not awaiting approval.
  bool Approve(const std::string& node_id) {
    bool done = false;
    Mutate([&] {
      int i = AwaitingNode(node_id);
      if (i < 0) return;
      GrantApproval(i);
      done = true;
    });
    return done;
  }

  bool Reject(const std::string& node_id, const std::string& reason) {
    bool done = false;
    Mutate([&] {
      int i = AwaitingNode(node_id);
      if (i < 0) return;
      FailNode(i, ErrorKind::kApprovalRejected,
               reason.empty() ? "approval rejected" : reason);
      done = true;
    });
    return done;
  }

  std::vector<PendingApproval> PendingApprovals() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<PendingApproval> out;
    if (!IsLive(exec_.status)) return out;
    for (const auto& n : wf_->Nodes()) {
      if (states_[n.id]->status != NodeStatus::kAwaitingApproval) continue;
      out.push_back({exec_.id, n.name, std::get<ApprovalSpec>(n.spec).message,
                     rt_[n.id].awaiting_since});
    }
    return out;
  }

  bool IsFinished() const {
    std::lock_guard<std::mutex> lock(mu_);
    return finished_;
  }

 private:
  enum class EdgeState { kPending, kFired, kSkipped, kFailed };

  struct NodeRuntime {
    uint64_t gen = 0;  // bumped per attempt; stale callbacks compare it
    CancelTokenPtr token;
    std::vector<TimerQueue::TimerId> timers;
    std::chrono::steady_clock::time_point started;
    std::chrono::system_clock::time_point awaiting_since;
  };

  // One exhaustive dispatch over the per-kind specs.
  struct Dispatcher {
    RunExecutor* self;
    int i;
    void operator()(const StartSpec&) const { self->CompleteAndFire(i, Value()); }
    void operator()(const EndSpec&) const { self->RunEnd(i); }
    void operator()(const AgentSpec& s) const { self->RunAgent(i, s); }
    void operator()(const ConditionSpec&) const { self->RunCondition(i); }
    void operator()(const ParallelSpec&) const {
      self->CompleteAndFire(i, Value());
    }
    void operator()(const JoinSpec&) const { self->RunJoin(i); }
    void operator()(const LoopSpec&) const { self->RunLoop(i); }
    void operator()(const DelaySpec& s) const { self->RunDelay(i, s); }
    void operator()(const ServiceSpec& s) const { self->RunService(i, s); }
    void operator()(const ApprovalSpec& s) const { self->RunApproval(i, s); }
    void operator()(const TransformSpec& s) const { self->RunTransform(i, s); }
  };

  CompiledWorkflowPtr wf_;
  RunServices svc_;

  mutable std::mutex mu_;
  Execution exec_;
  std::vector<NodeState*> states_;
  std::vector<EdgeState> edges_;
  std::vector<NodeRuntime> rt_;
  std::map<int, int> loop_done_;
  std::map<int, std::vector<Value>> loop_items_;  // foreach snapshots
  std::map<int, std::map<int, EdgeState>> deferred_;  // loop -> edge -> state
  std::deque<int> ready_;
  std::vector<TransitionEvent> pending_events_;
  TimerQueue::TimerId run_timer_ = 0;
  bool finished_ = false;
  bool promise_set_ = false;
  bool delivering_ = false;
  bool persisted_terminal_ = false;

  std::promise<RunStatus> promise_;
  std::shared_future<RunStatus> future_;

  // ---- locking / delivery ----

  void Mutate(const std::function<void()>& fn) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      fn();
      Pump();
      CheckDone();
      Persist();
    }
    Deliver();
  }

  // One thread at a time drains the event queue, in order. Re-entrant calls
  // from observers leave their events to the thread already delivering.
  void Deliver() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (delivering_) return;
      delivering_ = true;
    }
    while (true) {
      std::vector<TransitionEvent> batch;
      bool complete = false;
      RunStatus status = RunStatus::kPending;
      {
        std::lock_guard<std::mutex> lock(mu_);
        batch.swap(pending_events_);
        if (batch.empty()) {
          delivering_ = false;
          if (finished_ && !promise_set_) {
            promise_set_ = true;
            complete = true;
            status = exec_.status;
          }
        }
      }
      if (batch.empty()) {
        if (complete) promise_.set_value(status);
        return;
      }
      if (svc_.notify) {
        for (const auto& e : batch) svc_.notify(e);
      }
    }
  }

  void Persist() {
    if (persisted_terminal_) return;
    try {
      svc_.store->Update(exec_.id, [this](Execution& e) { e = exec_; });
    } catch (const std::exception& e) {
      LogMsg(LogLevel::kError, std::string("store update failed: ") + e.what());
    }
    if (exec_.IsTerminal()) persisted_terminal_ = true;
  }

  void LogMsg(LogLevel level, const std::string& msg) const {
    if (svc_.log) svc_.log(level, "[Run " + exec_.id + "] " + msg);
  }

  // ---- transitions ----

  void SetNode(int i, NodeStatus status) {
    NodeState& st = *states_[i];
    if (st.status == status) return;
    NodeStatus old = st.status;
    st.status = status;
    pending_events_.push_back({exec_.id, wf_->Nodes()[i].name, ToString(old),
                               ToString(status),
                               std::chrono::system_clock::now()});
    LogMsg(LogLevel::kDebug, wf_->Nodes()[i].name + ": " + ToString(old) +
                                 " -> " + ToString(status));
  }

  void SetRun(RunStatus status) {
    if (exec_.status == status) return;
    RunStatus old = exec_.status;
    exec_.status = status;
    pending_events_.push_back({exec_.id, "", ToString(old), ToString(status),
                               std::chrono::system_clock::now()});
  }

  void Finish() {
    exec_.ended_at = std::chrono::system_clock::now();
    if (run_timer_) svc_.timers->Cancel(run_timer_);
    run_timer_ = 0;
    finished_ = true;
  }

  void CheckDone() {
    if (!IsLive(exec_.status) || !ready_.empty()) return;
    for (const NodeState* st : states_) {
      if (IsActive(st->status)) return;
    }
    SetRun(RunStatus::kSucceeded);
    if (exec_.end_node.empty()) {
      LogMsg(LogLevel::kWarn, "finished without reaching an end node");
    } else {
      LogMsg(LogLevel::kInfo, "succeeded at '" + exec_.end_node + "'");
    }
    Finish();
  }

  void FailRun(const std::string& node_id, ErrorKind kind,
               const std::string& message) {
    if (!IsLive(exec_.status)) return;
    exec_.failures.push_back({node_id, kind, message});
    LogMsg(LogLevel::kError,
           (node_id.empty() ? std::string("run") : "node '" + node_id + "'") +
               " failed: " + ToString(kind) + ": " + message);
    StopActive();
    SetRun(RunStatus::kFailed);
    Finish();
  }

  // READY, RUNNING and AWAITING nodes become CANCELLED; outstanding calls are
  // signalled and their late results ignored.
  void StopActive() {
    for (size_t i = 0; i < states_.size(); ++i) {
      if (!IsActive(states_[i]->status)) continue;
      ClearTimers(static_cast<int>(i));
      if (rt_[i].token) rt_[i].token->Cancel();
      ++rt_[i].gen;
      SetNode(static_cast<int>(i), NodeStatus::kCancelled);
    }
    ready_.clear();
  }

  // ---- scheduling ----

  void MakeReady(int i) {
    SetNode(i, NodeStatus::kReady);
    ready_.push_back(i);
  }

  void Pump() {
    while (exec_.status == RunStatus::kRunning && !ready_.empty()) {
      int i = ready_.front();
      ready_.pop_front();
      if (states_[i]->status != NodeStatus::kReady) continue;
      Dispatch(i);
    }
  }

  void Dispatch(int i) {
    NodeRuntime& rt = rt_[i];
    ++states_[i]->attempts;
    ++rt.gen;
    rt.started = std::chrono::steady_clock::now();
    SetNode(i, NodeStatus::kRunning);
    std::visit(Dispatcher{this, i}, wf_->Nodes()[i].spec);
  }

  void ResolveEdge(int eid, EdgeState state) {
    if (!IsLive(exec_.status)) return;
    if (edges_[eid] != EdgeState::kPending) return;
    const auto& ed = wf_->Edges()[eid];
    if (state == EdgeState::kFired) {
      for (auto& [_, held] : deferred_) held.erase(eid);
    } else {
      int loop = DeferringLoop(ed);
      if (loop >= 0) {
        deferred_[loop][eid] = state;
        return;
      }
    }
    edges_[eid] = state;
    if (ed.loop_back) {
      OnBackEdge(ed.to);
      return;
    }
    const auto& target = wf_->Nodes()[ed.to];
    const auto* join = std::get_if<JoinSpec>(&target.spec);
    if (state == EdgeState::kFailed && join && join->fail_fast &&
        states_[ed.to]->status == NodeStatus::kPending) {
      FailNode(ed.to, ErrorKind::kJoinedBranchFailed,
               "branch from '" + wf_->Nodes()[ed.from].name + "' failed");
      return;
    }
    CheckNode(ed.to);
  }

  // While a loop iterates, a body edge that leaves the body unfired may
  // still fire in a later iteration; hold it until the loop finishes.
  int DeferringLoop(const CompiledWorkflow::EdgeDef& ed) const {
    int best = -1;
    for (int loop : wf_->Loops()) {
      if (states_[loop]->status != NodeStatus::kRunning) continue;
      const auto& body = wf_->Nodes()[loop].body;
      if (!body.count(ed.from) || body.count(ed.to) || ed.to == loop) continue;
      if (best < 0 || body.size() < wf_->Nodes()[best].body.size()) best = loop;
    }
    return best;
  }

  void CheckNode(int n) {
    if (states_[n]->status != NodeStatus::kPending) return;
    bool fired = false;
    bool failed = false;
    for (int eid : wf_->Nodes()[n].in_edges) {
      EdgeState s = edges_[eid];
      if (s == EdgeState::kPending) return;
      fired = fired || s == EdgeState::kFired;
      failed = failed || s == EdgeState::kFailed;
    }
    const auto* join = std::get_if<JoinSpec>(&wf_->Nodes()[n].spec);
    if (fired || (failed && join && !join->fail_fast)) {
      MakeReady(n);
    } else {
      SkipNode(n, failed);
    }
  }

  void SkipNode(int n, bool failed) {
    SetNode(n, NodeStatus::kSkipped);
    for (int eid : wf_->Nodes()[n].out_edges) {
      ResolveEdge(eid, failed ? EdgeState::kFailed : EdgeState::kSkipped);
    }
  }

  bool Holds(int eid) const {
    const Edge* e = wf_->Edges()[eid].edge;
    return !e->condition || e->condition->Evaluate(exec_.variables);
  }

  // Fired edges go first: a skipped sibling can end a loop, and the loop
  // would otherwise settle this node's held exits before they fire.
  void ResolveOutgoing(const std::vector<std::pair<int, EdgeState>>& outcome) {
    for (const auto& [eid, state] : outcome) {
      if (state == EdgeState::kFired) ResolveEdge(eid, state);
    }
    for (const auto& [eid, state] : outcome) {
      if (state != EdgeState::kFired) ResolveEdge(eid, state);
    }
  }

  void FireOutgoing(int i) {
    std::vector<std::pair<int, EdgeState>> outcome;
    for (int eid : wf_->Nodes()[i].out_edges) {
      outcome.emplace_back(eid,
                           Holds(eid) ? EdgeState::kFired : EdgeState::kSkipped);
    }
    ResolveOutgoing(outcome);
  }

  // ---- completion / failure ----

  void ClearTimers(int i) {
    for (auto id : rt_[i].timers) svc_.timers->Cancel(id);
    rt_[i].timers.clear();
  }

  void RecordDuration(int i) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  std::chrono::steady_clock::now() - rt_[i].started)
                  .count();
    states_[i]->duration_us = us;
    if (svc_.record_metric) svc_.record_metric(wf_->Nodes()[i].node->kind, us);
  }

  void Complete(int i, Value output) {
    ClearTimers(i);
    RecordDuration(i);
    states_[i]->output = std::move(output);
    SetNode(i, NodeStatus::kSucceeded);
  }

  void CompleteAndFire(int i, Value output) {
    Complete(i, std::move(output));
    FireOutgoing(i);
  }

  // Retries recoverable failures within the node's policy, otherwise fails
  // the node.
  void HandleFailure(int i, ErrorKind kind, const std::string& message) {
    const Node& node = *wf_->Nodes()[i].node;
    NodeState& st = *states_[i];
    ClearTimers(i);
    if (!IsRetryable(kind) || st.attempts >= node.MaxAttempts()) {
      FailNode(i, kind, message);
      return;
    }
    RecordDuration(i);
    st.last_error = NodeError{kind, message};
    int64_t delay = node.retry ? node.retry->DelayAfter(st.attempts) : 0;
    LogMsg(LogLevel::kWarn, "node '" + node.id + "' attempt " +
                                std::to_string(st.attempts) + " failed (" +
                                message + "), retrying in " +
                                std::to_string(delay) + "ms");
    SetNode(i, NodeStatus::kReady);
    if (delay <= 0) {
      ready_.push_back(i);
      return;
    }
    uint64_t gen = rt_[i].gen;
    ArmTimer(i, delay, [i, gen](RunExecutor* self) {
      if (self->rt_[i].gen != gen ||
          self->states_[i]->status != NodeStatus::kReady) {
        return;
      }
      self->ready_.push_back(i);
    });
  }

  void FailNode(int i, ErrorKind kind, const std::string& message) {
    const auto& def = wf_->Nodes()[i];
    NodeState& st = *states_[i];
    ClearTimers(i);
    if (st.status == NodeStatus::kRunning ||
        st.status == NodeStatus::kAwaitingApproval) {
      RecordDuration(i);
    }
    st.last_error = NodeError{kind, message};
    SetNode(i, NodeStatus::kFailed);
    if (!def.node->optional) {
      FailRun(def.name, kind, message);
      return;
    }
    LogMsg(LogLevel::kWarn, "optional node '" + def.name + "' failed: " +
                                ToString(kind) + ": " + message);
    exec_.variables[def.name + "_error"] = Value::String(message);
    // Only fallback edges whose condition holds fire.
    std::vector<std::pair<int, EdgeState>> outcome;
    for (int eid : def.out_edges) {
      const Edge* e = wf_->Edges()[eid].edge;
      bool fallback = e->condition && e->condition->Evaluate(exec_.variables);
      outcome.emplace_back(eid,
                           fallback ? EdgeState::kFired : EdgeState::kFailed);
    }
    ResolveOutgoing(outcome);
    if (std::holds_alternative<LoopSpec>(def.spec)) FinalizeDeferred(i);
  }

  // ---- timers ----

  void ArmTimer(int i, int64_t delay_ms,
                std::function<void(RunExecutor*)> on_fire) {
    std::weak_ptr<RunExecutor> weak = shared_from_this();
    auto id = svc_.timers->Schedule(
        std::chrono::milliseconds(delay_ms), [weak, on_fire] {
          if (auto self = weak.lock()) {
            self->Mutate([&] {
              if (!IsLive(self->exec_.status)) return;
              on_fire(self.get());
            });
          }
        });
    if (id) rt_[i].timers.push_back(id);
  }

  // ---- node kinds ----

  void RunEnd(int i) {
    if (exec_.end_node.empty()) exec_.end_node = wf_->Nodes()[i].name;
    CompleteAndFire(i, Value());
  }

  void RunCondition(int i) {
    const auto& def = wf_->Nodes()[i];
    int chosen = -1;
    for (int eid : def.out_edges) {
      if (Holds(eid)) {
        chosen = eid;
        break;
      }
    }
    if (chosen < 0) {
      FailNode(i, ErrorKind::kNoMatchingBranch,
               "no outgoing condition of '" + def.name + "' holds");
      return;
    }
    const std::string& target = wf_->Nodes()[wf_->Edges()[chosen].to].name;
    exec_.variables[def.name + "_branch"] = Value::String(target);
    Complete(i, Value::String(target));
    std::vector<std::pair<int, EdgeState>> outcome;
    for (int eid : def.out_edges) {
      outcome.emplace_back(
          eid, eid == chosen ? EdgeState::kFired : EdgeState::kSkipped);
    }
    ResolveOutgoing(outcome);
  }

  void RunJoin(int i) {
    int arrived = 0;
    int failed = 0;
    for (int eid : wf_->Nodes()[i].in_edges) {
      if (edges_[eid] == EdgeState::kFired) ++arrived;
      if (edges_[eid] == EdgeState::kFailed) ++failed;
    }
    Value out = Value::Map();
    out.Set("arrived", Value::Int(arrived));
    out.Set("failed", Value::Int(failed));
    CompleteAndFire(i, std::move(out));
  }

  void RunTransform(int i, const TransformSpec& spec) {
    const auto& def = wf_->Nodes()[i];
    std::vector<Value> inputs;
    for (const auto& name : spec.inputs) {
      auto it = exec_.variables.find(name);
      inputs.push_back(it == exec_.variables.end() ? Value() : it->second);
    }
    Value out;
    try {
      out = spec.transform->Apply(
          TransformArgs{def.node->config, std::move(inputs), exec_.variables});
    } catch (const std::exception& e) {
      FailNode(i, ErrorKind::kTransformFailed,
               spec.transform->Name() + ": " + e.what());
      return;
    }
    exec_.variables[spec.output] = out;
    CompleteAndFire(i, std::move(out));
  }

  void RunDelay(int i, const DelaySpec& spec) {
    uint64_t gen = rt_[i].gen;
    ArmTimer(i, spec.duration_ms, [i, gen](RunExecutor* self) {
      if (self->rt_[i].gen != gen ||
          self->states_[i]->status != NodeStatus::kRunning) {
        return;
      }
      self->CompleteAndFire(i, Value());
    });
  }

  void RunApproval(int i, const ApprovalSpec& spec) {
    rt_[i].awaiting_since = std::chrono::system_clock::now();
    SetNode(i, NodeStatus::kAwaitingApproval);
    LogMsg(LogLevel::kInfo,
           "awaiting approval at '" + wf_->Nodes()[i].name + "'");
    if (spec.timeout_ms <= 0) return;
    uint64_t gen = rt_[i].gen;
    bool approve = spec.approve_on_timeout;
    ArmTimer(i, spec.timeout_ms, [i, gen, approve](RunExecutor* self) {
      if (self->rt_[i].gen != gen ||
          self->states_[i]->status != NodeStatus::kAwaitingApproval) {
        return;
      }
      self->rt_[i].timers.clear();
      if (approve) {
        self->GrantApproval(i);
      } else {
        self->FailNode(i, ErrorKind::kApprovalRejected,
                       "approval timed out");
      }
    });
  }

  int AwaitingNode(const std::string& node_id) const {
    if (!IsLive(exec_.status)) return -1;
    int i = wf_->IndexOf(node_id);
    if (i < 0 || states_[i]->status != NodeStatus::kAwaitingApproval) return -1;
    return i;
  }

  void GrantApproval(int i) {
    exec_.variables[wf_->Nodes()[i].name + "_approved"] = Value::Bool(true);
    CompleteAndFire(i, Value::Bool(true));
  }

  // ---- loops ----

  void RunLoop(int i) {
    loop_done_[i] = 0;
    deferred_.erase(i);
    const auto& spec = std::get<LoopSpec>(wf_->Nodes()[i].spec);
    if (spec.IsForEach()) {
      // Snapshot the items; later writes to the variable do not change them.
      std::vector<Value> items;
      auto it = exec_.variables.find(spec.over);
      if (it != exec_.variables.end() && !it->second.IsNull()) {
        if (it->second.IsSequence()) {
          items = it->second.Items();
        } else {
          items.push_back(it->second);
        }
      }
      loop_items_[i] = std::move(items);
    }
    EvaluateLoop(i);
  }

  void OnBackEdge(int loop) {
    if (states_[loop]->status != NodeStatus::kRunning) return;
    bool fired = false;
    for (int eid : wf_->Nodes()[loop].back_edges) {
      if (edges_[eid] == EdgeState::kPending) return;
      fired = fired || edges_[eid] == EdgeState::kFired;
    }
    if (fired) {
      EvaluateLoop(loop);
    } else {
      // The body broke out of the loop.
      ExitLoop(loop, false);
    }
  }

  void EvaluateLoop(int loop) {
    const auto& def = wf_->Nodes()[loop];
    const auto& spec = std::get<LoopSpec>(def.spec);
    int& done = loop_done_[loop];
    const auto& items = loop_items_[loop];
    if (!spec.WantsAnother(done, exec_.variables, items.size())) {
      ExitLoop(loop, true);
      return;
    }
    if (done >= spec.max_iterations) {
      FailNode(loop, ErrorKind::kLoopBoundExceeded,
               "loop '" + def.name + "' exceeded max_iterations " +
                   std::to_string(spec.max_iterations));
      return;
    }
    int iteration = done++;
    exec_.variables[spec.index_variable] = Value::Int(iteration);
    if (spec.IsForEach()) exec_.variables[spec.item_variable] = items[iteration];
    states_[loop]->iteration = iteration;
    LogMsg(LogLevel::kDebug,
           "loop '" + def.name + "' iteration " + std::to_string(iteration));
    ResetBody(loop, iteration);
    edges_[def.body_edge] = EdgeState::kPending;
    ResolveEdge(def.body_edge, EdgeState::kFired);
  }

  // Body nodes get fresh states; edges inside the body and the back-edges
  // become unresolved again. Edges leaving the body keep their outcome.
  void ResetBody(int loop, int iteration) {
    const auto& body = wf_->Nodes()[loop].body;
    if (iteration > 0) {
      for (int n : body) {
        ClearTimers(n);
        ++rt_[n].gen;
        NodeStatus prev = states_[n]->status;
        *states_[n] = NodeState{};
        states_[n]->status = prev;
        SetNode(n, NodeStatus::kPending);
        loop_done_.erase(n);
        loop_items_.erase(n);
        deferred_.erase(n);
      }
      for (const auto& ed : wf_->Edges()) {
        if (!body.count(ed.from)) continue;
        if (body.count(ed.to) || ed.to == loop) edges_[ed.id] = EdgeState::kPending;
      }
    }
    for (int n : body) states_[n]->iteration = iteration;
  }

  void ExitLoop(int loop, bool fire_exits) {
    const auto& def = wf_->Nodes()[loop];
    int done = loop_done_[loop];
    Value out = Value::Map();
    out.Set("iterations", Value::Int(done));
    Complete(loop, std::move(out));
    loop_items_.erase(loop);
    std::vector<std::pair<int, EdgeState>> outcome;
    for (int eid : def.out_edges) {
      if (eid == def.body_edge) {
        if (done == 0) outcome.emplace_back(eid, EdgeState::kSkipped);
        continue;
      }
      bool fire = fire_exits && Holds(eid);
      outcome.emplace_back(eid, fire ? EdgeState::kFired : EdgeState::kSkipped);
    }
    ResolveOutgoing(outcome);
    FinalizeDeferred(loop);
  }

  void FinalizeDeferred(int loop) {
    auto it = deferred_.find(loop);
    if (it == deferred_.end()) return;
    auto held = std::move(it->second);
    deferred_.erase(it);
    for (const auto& [eid, state] : held) ResolveEdge(eid, state);
  }

  // ---- external work ----

  void RunAgent(int i, const AgentSpec& spec) {
    const auto& def = wf_->Nodes()[i];
    if (!svc_.executor) {
      HandleFailure(i, ErrorKind::kExecutorFailure,
                    "no task executor configured");
      return;
    }
    TaskRequest req;
    req.run_id = exec_.id;
    req.node_id = def.name;
    req.kind = def.node->kind;
    req.config = def.node->config;
    req.variables = exec_.variables;
    req.attempt = states_[i]->attempts;
    req.cancel = NewToken(i);
    auto executor = svc_.executor;
    Submit(i, ErrorKind::kExecutorFailure,
           [executor, req] { return executor->Execute(req); },
           [spec](RunExecutor* self, const Value& result) {
             auto& vars = self->exec_.variables;
             vars[spec.output_key] = result;
             if (spec.output_mapping.IsMap() && result.IsMap()) {
               for (const auto& [key, var] : spec.output_mapping.Entries()) {
                 if (result.Has(key)) vars[var.ToString()] = result[key];
               }
             }
           });
  }

  void RunService(int i, const ServiceSpec& spec) {
    const auto& def = wf_->Nodes()[i];
    if (!svc_.service) {
      HandleFailure(i, ErrorKind::kServiceFailure,
                    "no external service configured");
      return;
    }
    ServiceRequest req;
    req.run_id = exec_.id;
    req.node_id = def.name;
    req.kind = def.node->kind;
    req.target = spec.target;
    req.payload = spec.payload;
    for (const auto& [param, var] : spec.input_mapping.Entries()) {
      auto it = exec_.variables.find(var.ToString());
      if (it != exec_.variables.end()) req.payload.Set(param, it->second);
    }
    req.timeout_ms = def.node->timeout_ms;
    req.attempt = states_[i]->attempts;
    req.cancel = NewToken(i);
    auto service = svc_.service;
    std::string key = spec.output_key;
    Submit(i, ErrorKind::kServiceFailure,
           [service, req] { return service->Call(req); },
           [key](RunExecutor* self, const Value& result) {
             self->exec_.variables[key] = result;
           });
  }

  CancelTokenPtr NewToken(int i) {
    rt_[i].token = std::make_shared<CancelToken>();
    return rt_[i].token;
  }

  using StoreFn = std::function<void(RunExecutor*, const Value&)>;

  // Runs `call` on the pool; arms the node timeout if there is one.
  void Submit(int i, ErrorKind failure_kind, std::function<Value()> call,
              StoreFn store) {
    const Node& node = *wf_->Nodes()[i].node;
    uint64_t gen = rt_[i].gen;
    if (node.timeout_ms > 0) {
      int64_t timeout = node.timeout_ms;
      ArmTimer(i, timeout, [i, gen, timeout](RunExecutor* self) {
        if (self->rt_[i].gen != gen ||
            self->states_[i]->status != NodeStatus::kRunning) {
          return;
        }
        if (self->rt_[i].token) self->rt_[i].token->Cancel();
        ++self->rt_[i].gen;
        self->HandleFailure(i, ErrorKind::kTimeoutExceeded,
                            "attempt exceeded " + std::to_string(timeout) +
                                "ms");
      });
    }
    auto self = shared_from_this();
    try {
      svc_.pool->Enqueue([self, i, gen, failure_kind, call, store] {
        self->RunTask(i, gen, failure_kind, call, store);
      });
    } catch (const std::runtime_error& e) {
      HandleFailure(i, failure_kind, e.what());
    }
  }

  // Pool thread: no lock held while the collaborator runs.
  void RunTask(int i, uint64_t gen, ErrorKind failure_kind,
               const std::function<Value()>& call, const StoreFn& store) {
    std::optional<Value> result;
    NodeError error{failure_kind, ""};
    try {
      result = call();
    } catch (const FlowError& e) {
      error = NodeError{e.kind(), e.what()};
    } catch (const std::exception& e) {
      error.message = e.what();
    } catch (...) {
      error.message = "unknown exception";
    }
    Mutate([&] {
      if (!IsLive(exec_.status) || rt_[i].gen != gen ||
          states_[i]->status != NodeStatus::kRunning) {
        LogMsg(LogLevel::kDebug,
               "ignoring late result for '" + wf_->Nodes()[i].name + "'");
        return;
      }
      if (!result) {
        HandleFailure(i, error.kind, error.message);
        return;
      }
      store(this, *result);
      CompleteAndFire(i, *result);
    });
  }
};

}  // namespace miniflow
