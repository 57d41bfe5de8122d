#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "mini_flow/condition.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/graph.hpp"
#include "mini_flow/logging.hpp"
#include "mini_flow/transforms.hpp"
#include "mini_flow/validate.hpp"

namespace miniflow {

// ==========================================
// Per-kind node specs
// ==========================================

struct StartSpec {};
struct EndSpec {};

// AGENT_SPAWN and AGENT_EXECUTE
struct AgentSpec {
  std::string output_key;
  ConfigNode output_mapping;  // result key -> variable
};

struct ConditionSpec {};

struct ParallelSpec {
  std::string join_group;
};

struct JoinSpec {
  std::string join_group;
  bool fail_fast = true;
};

struct LoopSpec {
  int max_iterations = 1;
  std::optional<Condition> condition;
  std::optional<int> iterations;
  std::string body;
  std::string index_variable;
  // foreach: iterate the items of variable `over`, binding each to item_variable.
  std::string over;
  std::string item_variable;

  bool IsForEach() const { return !over.empty(); }

  // Whether another iteration is wanted after `done` iterations. `items` is
  // the snapshot size for foreach loops.
  bool WantsAnother(int done, const Variables& vars, size_t items = 0) const {
    if (IsForEach() && static_cast<size_t>(done) >= items) return false;
    if (iterations && done >= *iterations) return false;
    if (condition && !condition->Evaluate(vars)) return false;
    return true;
  }
};

struct DelaySpec {
  int64_t duration_ms = 0;
};

// MCP_CALL and WEBHOOK
struct ServiceSpec {
  std::string target;
  ConfigNode payload;
  ConfigNode input_mapping;  // payload key -> variable
  std::string output_key;
};

struct ApprovalSpec {
  std::string message;
  int64_t timeout_ms = 0;
  bool approve_on_timeout = false;
};

struct TransformSpec {
  std::shared_ptr<const Transform> transform;
  std::vector<std::string> inputs;
  std::string output;
};

using NodeSpec =
    std::variant<StartSpec, EndSpec, AgentSpec, ConditionSpec, ParallelSpec,
                 JoinSpec, LoopSpec, DelaySpec, ServiceSpec, ApprovalSpec,
                 TransformSpec>;

// ==========================================
// Compiled workflow (immutable, shared by runs)
// ==========================================
class CompiledWorkflow {
  // Only Compile() can name the tag.
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  CompiledWorkflow(PrivateTag, DefinitionPtr def) : def_(std::move(def)) {}

  struct EdgeDef {
    int id;
    int from;
    int to;
    const Edge* edge;
    bool loop_back = false;
  };

  struct NodeDef {
    int id;
    std::string name;
    const Node* node;
    NodeSpec spec;
    std::vector<int> in_edges;   // forward edges only
    std::vector<int> out_edges;  // declaration order
    // LOOP only
    std::vector<int> back_edges;
    int body_edge = -1;
    std::set<int> body;
  };

  // Throws FlowError(kInvalidDefinition) with every violation.
  static std::shared_ptr<const CompiledWorkflow> Compile(DefinitionPtr def,
                                                         LogFn log = {}) {
    auto result = Validate(*def);
    if (!result.ok()) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "workflow '" + def->id() + "' is invalid",
                      result.violations);
    }
    auto wf = std::make_shared<CompiledWorkflow>(PrivateTag{}, std::move(def));
    wf->Build();
    if (log) {
      log(LogLevel::kDebug, "[CompiledWorkflow] " + wf->def_->id() +
                                " nodes: " + std::to_string(wf->nodes_.size()) +
                                ", edges: " + std::to_string(wf->edges_.size()));
    }
    return wf;
  }

  const WorkflowDefinition& Definition() const { return *def_; }
  const DefinitionPtr& DefinitionRef() const { return def_; }
  const std::vector<NodeDef>& Nodes() const { return nodes_; }
  const std::vector<EdgeDef>& Edges() const { return edges_; }
  int Start() const { return start_; }
  std::vector<int> Loops() const { return loops_; }

  int IndexOf(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? -1 : it->second;
  }

 private:
  DefinitionPtr def_;
  std::vector<NodeDef> nodes_;
  std::vector<EdgeDef> edges_;
  std::map<std::string, int> index_;
  std::vector<int> loops_;
  int start_ = -1;

  void Build() {
    const auto& order = def_->node_order();
    nodes_.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
      const Node& n = def_->nodes().at(order[i]);
      index_[n.id] = static_cast<int>(i);
      nodes_.push_back(NodeDef{static_cast<int>(i), n.id, &n, MakeSpec(n)});
      if (n.kind == NodeKind::kStart) start_ = static_cast<int>(i);
      if (n.kind == NodeKind::kLoop) loops_.push_back(static_cast<int>(i));
    }

    const auto& edges = def_->edges();
    for (size_t i = 0; i < edges.size(); ++i) {
      EdgeDef e{static_cast<int>(i), index_.at(edges[i].from),
                index_.at(edges[i].to), &edges[i], edges[i].loop_back};
      nodes_[e.from].out_edges.push_back(e.id);
      if (e.loop_back) {
        nodes_[e.to].back_edges.push_back(e.id);
      } else {
        nodes_[e.to].in_edges.push_back(e.id);
      }
      edges_.push_back(e);
    }

    for (int loop : loops_) BuildLoopBody(nodes_[loop]);
  }

  // Body: nodes reachable from the body entry (not through the loop node)
  // that can reach a back-edge source. A nested loop's own back-edges count
  // as paths, so its body belongs to the enclosing one.
  void BuildLoopBody(NodeDef& loop) {
    const auto& spec = std::get<LoopSpec>(loop.spec);
    int entry = index_.at(spec.body);
    for (int eid : loop.out_edges) {
      if (edges_[eid].to == entry && !edges_[eid].loop_back) {
        loop.body_edge = eid;
        break;
      }
    }

    std::set<int> forward{entry};
    std::queue<int> q;
    q.push(entry);
    while (!q.empty()) {
      int cur = q.front();
      q.pop();
      for (int eid : nodes_[cur].out_edges) {
        const auto& e = edges_[eid];
        if (e.loop_back || e.to == loop.id) continue;
        if (forward.insert(e.to).second) q.push(e.to);
      }
    }

    std::set<int> backward;
    for (int eid : loop.back_edges) {
      int src = edges_[eid].from;
      if (backward.insert(src).second) q.push(src);
    }
    while (!q.empty()) {
      int cur = q.front();
      q.pop();
      for (int eid : nodes_[cur].in_edges) {
        int src = edges_[eid].from;
        if (src == loop.id) continue;
        if (backward.insert(src).second) q.push(src);
      }
      if (cur == loop.id || !std::holds_alternative<LoopSpec>(nodes_[cur].spec)) {
        continue;
      }
      for (int eid : nodes_[cur].back_edges) {
        int src = edges_[eid].from;
        if (backward.insert(src).second) q.push(src);
      }
    }

    for (int n : forward) {
      if (backward.count(n)) loop.body.insert(n);
    }
  }

  NodeSpec MakeSpec(const Node& n) const {
    const ConfigNode& c = n.config;
    switch (n.kind) {
      case NodeKind::kStart:
        return StartSpec{};
      case NodeKind::kEnd:
        return EndSpec{};
      case NodeKind::kAgentSpawn:
      case NodeKind::kAgentExecute:
        return AgentSpec{c["output_key"].As<std::string>(n.id + "_output"),
                         c["output_mapping"]};
      case NodeKind::kCondition:
        return ConditionSpec{};
      case NodeKind::kParallel:
        return ParallelSpec{c["join_group"].ToString()};
      case NodeKind::kJoin:
        return JoinSpec{c["join_group"].ToString(),
                        c["on_branch_failure"].ToString() == "fail_fast"};
      case NodeKind::kLoop: {
        LoopSpec spec;
        spec.max_iterations = c["max_iterations"].As<int>(1);
        if (c.Has("condition")) {
          spec.condition = Condition::Parse(c["condition"].ToString());
        }
        if (c.Has("iterations")) spec.iterations = c["iterations"].As<int>(0);
        spec.body = c["body"].ToString();
        spec.over = c.Has("over") ? c["over"].ToString()
                                  : c["iterable_variable"].As<std::string>();
        if (spec.IsForEach()) {
          spec.index_variable = n.id + "_index";
          spec.item_variable =
              c["iteration_variable"].As<std::string>(n.id + "_item");
        } else {
          spec.index_variable =
              c["iteration_variable"].As<std::string>(n.id + "_index");
        }
        return spec;
      }
      case NodeKind::kDelay:
        return DelaySpec{c["duration_ms"].As<int64_t>(0)};
      case NodeKind::kMcpCall:
      case NodeKind::kWebhook:
        return ServiceSpec{c["target"].ToString(),
                           c["payload"].IsMap() ? c["payload"] : ConfigNode::Map(),
                           c["input_mapping"],
                           c["output_key"].As<std::string>(n.id + "_output")};
      case NodeKind::kHumanApproval: {
        ApprovalSpec spec;
        spec.message = c["message"].As<std::string>();
        spec.timeout_ms =
            n.timeout_ms > 0 ? n.timeout_ms : c["timeout_ms"].As<int64_t>(0);
        spec.approve_on_timeout =
            c["default_action"].As<std::string>("reject") == "approve";
        return spec;
      }
      case NodeKind::kDataTransform: {
        TransformSpec spec;
        spec.transform =
            TransformFactory::Get().Create(c["operation"].ToString());
        const ConfigNode& inputs = c["inputs"];
        if (inputs.IsSequence()) {
          for (const auto& in : inputs) spec.inputs.push_back(in.ToString());
        } else if (inputs.IsScalar()) {
          spec.inputs.push_back(inputs.Text());
        }
        spec.output = c["output"].ToString();
        return spec;
      }
    }
    return StartSpec{};
  }
};

using CompiledWorkflowPtr = std::shared_ptr<const CompiledWorkflow>;

}  // namespace miniflow
