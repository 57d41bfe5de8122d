#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "mini_flow/errors.hpp"
#include "mini_flow/graph.hpp"
#include "mini_flow/validate.hpp"

namespace miniflow {

// ==========================================
// Fluent definition builder
// ==========================================
//
//   auto def = WorkflowBuilder("wf", "Review")
//                  .AddStart()
//                  .ExecuteAgent("review", "review the patch")
//                  .WithRetry({3, Backoff::kExponential, 100})
//                  .AddEnd()
//                  .Connect("start", "review")
//                  .Connect("review", "end")
//                  .Build();
//
// WithRetry / WithTimeout / WithLabel / Optional / WithConfig apply to the
// node added last. Problems are collected and reported together by Build().
class WorkflowBuilder {
 public:
  WorkflowBuilder(std::string id, std::string name)
      : id_(std::move(id)), name_(std::move(name)) {}

  WorkflowBuilder& AddNode(const std::string& id, NodeKind kind,
                           ConfigNode config = ConfigNode::Map()) {
    if (!ids_.insert(id).second) {
      problems_.push_back({id, "duplicate node id"});
      current_ = -1;
      return *this;
    }
    if (id.empty()) {
      problems_.push_back({id_, "node id must not be empty"});
    }
    Node node;
    node.id = id;
    node.kind = kind;
    node.config = config.IsMap() ? std::move(config) : ConfigNode::Map();
    nodes_.push_back(std::move(node));
    current_ = static_cast<int>(nodes_.size()) - 1;
    return *this;
  }

  WorkflowBuilder& AddStart(const std::string& id = "start") {
    return AddNode(id, NodeKind::kStart);
  }

  WorkflowBuilder& AddEnd(const std::string& id = "end") {
    return AddNode(id, NodeKind::kEnd);
  }

  WorkflowBuilder& SpawnAgent(const std::string& id,
                              const std::string& agent_type,
                              ConfigNode config = ConfigNode::Map()) {
    config.Set("agent_type", ConfigNode(agent_type));
    return AddNode(id, NodeKind::kAgentSpawn, std::move(config));
  }

  WorkflowBuilder& ExecuteAgent(const std::string& id, const std::string& task,
                                ConfigNode config = ConfigNode::Map()) {
    config.Set("task", ConfigNode(task));
    return AddNode(id, NodeKind::kAgentExecute, std::move(config));
  }

  WorkflowBuilder& AddCondition(const std::string& id) {
    return AddNode(id, NodeKind::kCondition);
  }

  WorkflowBuilder& AddParallel(const std::string& id,
                               const std::string& join_group) {
    return AddNode(id, NodeKind::kParallel,
                   ConfigNode::Map().Set("join_group", ConfigNode(join_group)));
  }

  // policy: "fail_fast" or "tolerate_partial"
  WorkflowBuilder& AddJoin(const std::string& id, const std::string& join_group,
                           const std::string& policy) {
    ConfigNode config = ConfigNode::Map();
    config.Set("join_group", ConfigNode(join_group));
    config.Set("on_branch_failure", ConfigNode(policy));
    return AddNode(id, NodeKind::kJoin, std::move(config));
  }

  // Runs `body` while `condition` holds; pass iterations >= 0 for a counted
  // loop (both may be given).
  WorkflowBuilder& AddLoop(const std::string& id, const std::string& body,
                           int max_iterations,
                           const std::string& condition = "",
                           int iterations = -1) {
    ConfigNode config = ConfigNode::Map();
    config.Set("body", ConfigNode(body));
    config.Set("max_iterations", ConfigNode::Int(max_iterations));
    if (!condition.empty()) config.Set("condition", ConfigNode(condition));
    if (iterations >= 0) config.Set("iterations", ConfigNode::Int(iterations));
    return AddNode(id, NodeKind::kLoop, std::move(config));
  }

  // Runs `body` once per item of variable `over`, binding the item to
  // `item_variable` (default "<id>_item").
  WorkflowBuilder& AddForEach(const std::string& id, const std::string& body,
                              const std::string& over, int max_iterations,
                              const std::string& item_variable = "") {
    ConfigNode config = ConfigNode::Map();
    config.Set("body", ConfigNode(body));
    config.Set("over", ConfigNode(over));
    config.Set("max_iterations", ConfigNode::Int(max_iterations));
    if (!item_variable.empty()) {
      config.Set("iteration_variable", ConfigNode(item_variable));
    }
    return AddNode(id, NodeKind::kLoop, std::move(config));
  }

  WorkflowBuilder& AddDelay(const std::string& id, int64_t duration_ms) {
    return AddNode(id, NodeKind::kDelay,
                   ConfigNode::Map().Set("duration_ms",
                                         ConfigNode::Int(duration_ms)));
  }

  WorkflowBuilder& CallMcp(const std::string& id, const std::string& target,
                           ConfigNode payload = ConfigNode::Map()) {
    return AddService(id, NodeKind::kMcpCall, target, std::move(payload));
  }

  WorkflowBuilder& CallWebhook(const std::string& id, const std::string& target,
                               ConfigNode payload = ConfigNode::Map()) {
    return AddService(id, NodeKind::kWebhook, target, std::move(payload));
  }

  WorkflowBuilder& AddHumanApproval(const std::string& id,
                                    const std::string& message = "") {
    ConfigNode config = ConfigNode::Map();
    if (!message.empty()) config.Set("message", ConfigNode(message));
    return AddNode(id, NodeKind::kHumanApproval, std::move(config));
  }

  WorkflowBuilder& AddTransform(const std::string& id,
                                const std::string& operation,
                                const std::vector<std::string>& inputs,
                                const std::string& output,
                                ConfigNode config = ConfigNode::Map()) {
    config.Set("operation", ConfigNode(operation));
    config.Set("inputs", ConfigNode::StringList(inputs));
    config.Set("output", ConfigNode(output));
    return AddNode(id, NodeKind::kDataTransform, std::move(config));
  }

  // ---- modifiers for the last node ----

  WorkflowBuilder& WithRetry(const RetryPolicy& policy) {
    if (Node* n = Current("WithRetry")) n->retry = policy;
    return *this;
  }

  WorkflowBuilder& WithTimeout(int64_t timeout_ms) {
    if (Node* n = Current("WithTimeout")) n->timeout_ms = timeout_ms;
    return *this;
  }

  WorkflowBuilder& WithLabel(const std::string& label) {
    if (Node* n = Current("WithLabel")) n->label = label;
    return *this;
  }

  WorkflowBuilder& Optional(bool optional = true) {
    if (Node* n = Current("Optional")) n->optional = optional;
    return *this;
  }

  WorkflowBuilder& WithConfig(const std::string& key, ConfigNode value) {
    if (Node* n = Current("WithConfig")) n->config.Set(key, std::move(value));
    return *this;
  }

  // ---- edges ----

  WorkflowBuilder& Connect(const std::string& from, const std::string& to,
                           const std::string& condition = "") {
    Edge edge;
    edge.from = from;
    edge.to = to;
    if (!condition.empty()) {
      try {
        edge.condition = Condition::Parse(condition);
      } catch (const FlowError& e) {
        problems_.push_back({edge.Name(), e.what()});
        return *this;
      }
    }
    edges_.push_back(std::move(edge));
    return *this;
  }

  WorkflowBuilder& Connect(const std::string& from, const std::string& to,
                           Condition condition) {
    Edge edge;
    edge.from = from;
    edge.to = to;
    if (!condition.empty()) edge.condition = std::move(condition);
    edges_.push_back(std::move(edge));
    return *this;
  }

  WorkflowBuilder& ConnectBack(const std::string& from,
                               const std::string& loop) {
    Edge edge;
    edge.from = from;
    edge.to = loop;
    edge.loop_back = true;
    edges_.push_back(std::move(edge));
    return *this;
  }

  // ---- definition-level ----

  WorkflowBuilder& SetVariable(const std::string& name, Value value) {
    variables_[name] = std::move(value);
    return *this;
  }

  WorkflowBuilder& SetDescription(const std::string& description) {
    description_ = description;
    return *this;
  }

  WorkflowBuilder& SetVersion(const std::string& version) {
    version_ = version;
    return *this;
  }

  WorkflowBuilder& SetTimeout(int64_t timeout_ms) {
    timeout_ms_ = timeout_ms;
    return *this;
  }

  WorkflowBuilder& SetMetadata(ConfigNode metadata) {
    metadata_ = std::move(metadata);
    return *this;
  }

  WorkflowBuilder& AddTag(const std::string& tag) {
    tags_.push_back(tag);
    return *this;
  }

  bool HasNode(const std::string& id) const { return ids_.count(id) > 0; }

  // Throws FlowError(kInvalidDefinition) listing every violation.
  DefinitionPtr Build() const {
    auto def = std::make_shared<WorkflowDefinition>(id_, name_, description_,
                                                    nodes_, edges_);
    def->version_ = version_;
    def->variables_ = variables_;
    def->tags_ = tags_;
    def->metadata_ = metadata_.IsMap() ? metadata_ : ConfigNode::Map();
    def->timeout_ms_ = timeout_ms_;

    std::vector<Violation> all = problems_;
    auto result = Validate(*def);
    all.insert(all.end(), result.violations.begin(), result.violations.end());
    if (!all.empty()) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "workflow '" + id_ + "' is invalid", std::move(all));
    }
    return def;
  }

 private:
  std::string id_;
  std::string name_;
  std::string description_;
  std::string version_ = "1.0.0";
  std::vector<Node> nodes_;
  std::set<std::string> ids_;
  std::vector<Edge> edges_;
  Variables variables_;
  std::vector<std::string> tags_;
  ConfigNode metadata_ = ConfigNode::Map();
  int64_t timeout_ms_ = 0;
  int current_ = -1;
  std::vector<Violation> problems_;

  WorkflowBuilder& AddService(const std::string& id, NodeKind kind,
                              const std::string& target, ConfigNode payload) {
    ConfigNode config = ConfigNode::Map();
    config.Set("target", ConfigNode(target));
    if (payload.size() > 0) config.Set("payload", std::move(payload));
    return AddNode(id, kind, std::move(config));
  }

  Node* Current(const std::string& what) {
    if (current_ < 0) {
      problems_.push_back({id_, what + " called with no node to apply it to"});
      return nullptr;
    }
    return &nodes_[current_];
  }
};

}  // namespace miniflow
