#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mini_flow/condition.hpp"
#include "mini_flow/config_node.hpp"

namespace miniflow {

// ==========================================
// Graph Model
// ==========================================

enum class NodeKind {
  kStart,
  kEnd,
  kAgentSpawn,
  kAgentExecute,
  kCondition,
  kParallel,
  kJoin,
  kLoop,
  kDelay,
  kMcpCall,
  kWebhook,
  kHumanApproval,
  kDataTransform,
};

inline const char* ToString(NodeKind kind) {
  switch (kind) {
    case NodeKind::kStart:
      return "start";
    case NodeKind::kEnd:
      return "end";
    case NodeKind::kAgentSpawn:
      return "agent_spawn";
    case NodeKind::kAgentExecute:
      return "agent_execute";
    case NodeKind::kCondition:
      return "condition";
    case NodeKind::kParallel:
      return "parallel";
    case NodeKind::kJoin:
      return "join";
    case NodeKind::kLoop:
      return "loop";
    case NodeKind::kDelay:
      return "delay";
    case NodeKind::kMcpCall:
      return "mcp_call";
    case NodeKind::kWebhook:
      return "webhook";
    case NodeKind::kHumanApproval:
      return "human_approval";
    case NodeKind::kDataTransform:
      return "data_transform";
  }
  return "unknown";
}

inline const std::vector<NodeKind>& AllNodeKinds() {
  static const std::vector<NodeKind> kinds = {
      NodeKind::kStart,         NodeKind::kEnd,
      NodeKind::kAgentSpawn,    NodeKind::kAgentExecute,
      NodeKind::kCondition,     NodeKind::kParallel,
      NodeKind::kJoin,          NodeKind::kLoop,
      NodeKind::kDelay,         NodeKind::kMcpCall,
      NodeKind::kWebhook,       NodeKind::kHumanApproval,
      NodeKind::kDataTransform,
  };
  return kinds;
}

inline std::optional<NodeKind> ParseNodeKind(const std::string& name) {
  for (NodeKind kind : AllNodeKinds()) {
    if (name == ToString(kind)) return kind;
  }
  return std::nullopt;
}

// ------------------------------------------
// Retry policy
// ------------------------------------------
enum class Backoff { kNone, kFixed, kLinear, kExponential };

inline const char* ToString(Backoff b) {
  switch (b) {
    case Backoff::kNone:
      return "none";
    case Backoff::kFixed:
      return "fixed";
    case Backoff::kLinear:
      return "linear";
    case Backoff::kExponential:
      return "exponential";
  }
  return "none";
}

inline std::optional<Backoff> ParseBackoff(const std::string& name) {
  for (Backoff b : {Backoff::kNone, Backoff::kFixed, Backoff::kLinear,
                    Backoff::kExponential}) {
    if (name == ToString(b)) return b;
  }
  return std::nullopt;
}

struct RetryPolicy {
  int max_attempts = 1;
  Backoff backoff = Backoff::kNone;
  int64_t initial_delay_ms = 0;
  int64_t max_delay_ms = 300000;
  double multiplier = 2.0;

  // Wait before the attempt that follows failed attempt `attempt` (1-based).
  int64_t DelayAfter(int attempt) const {
    if (attempt < 1) attempt = 1;
    double delay = 0;
    switch (backoff) {
      case Backoff::kNone:
        return 0;
      case Backoff::kFixed:
        delay = static_cast<double>(initial_delay_ms);
        break;
      case Backoff::kLinear:
        delay = static_cast<double>(initial_delay_ms) * attempt;
        break;
      case Backoff::kExponential:
        delay = static_cast<double>(initial_delay_ms) *
                std::pow(multiplier, attempt - 1);
        break;
    }
    return std::min(static_cast<int64_t>(delay), max_delay_ms);
  }

  bool operator==(const RetryPolicy& o) const {
    return max_attempts == o.max_attempts && backoff == o.backoff &&
           initial_delay_ms == o.initial_delay_ms &&
           max_delay_ms == o.max_delay_ms && multiplier == o.multiplier;
  }
};

// ------------------------------------------
// Node / Edge / Definition
// ------------------------------------------
struct Node {
  std::string id;
  NodeKind kind = NodeKind::kStart;
  ConfigNode config = ConfigNode::Map();
  std::optional<RetryPolicy> retry;
  int64_t timeout_ms = 0;  // 0 = no timeout
  std::string label;
  bool optional = false;  // best-effort: failure does not fail the run

  int MaxAttempts() const { return retry ? std::max(1, retry->max_attempts) : 1; }

  bool operator==(const Node& o) const {
    return id == o.id && kind == o.kind && config == o.config &&
           retry == o.retry && timeout_ms == o.timeout_ms &&
           label == o.label && optional == o.optional;
  }
};

struct Edge {
  std::string from;
  std::string to;
  std::optional<Condition> condition;
  bool loop_back = false;  // closes a LOOP body

  std::string Name() const { return from + "->" + to; }

  bool operator==(const Edge& o) const {
    return from == o.from && to == o.to && condition == o.condition &&
           loop_back == o.loop_back;
  }
};

// Immutable once built; share it as shared_ptr<const WorkflowDefinition>.
class WorkflowDefinition {
 public:
  WorkflowDefinition() = default;
  WorkflowDefinition(std::string id, std::string name, std::string description,
                     std::vector<Node> nodes, std::vector<Edge> edges)
      : id_(std::move(id)),
        name_(std::move(name)),
        description_(std::move(description)),
        edges_(std::move(edges)) {
    // The first node with a given id wins; repeats are kept for validation.
    for (auto& node : nodes) {
      if (nodes_.count(node.id)) {
        duplicate_ids_.push_back(node.id);
        continue;
      }
      order_.push_back(node.id);
      nodes_[node.id] = std::move(node);
    }
  }

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  const std::string& description() const { return description_; }
  const std::string& version() const { return version_; }
  const std::map<std::string, Node>& nodes() const { return nodes_; }
  const std::vector<Edge>& edges() const { return edges_; }
  const Variables& variables() const { return variables_; }
  const std::vector<std::string>& tags() const { return tags_; }
  const ConfigNode& metadata() const { return metadata_; }
  int64_t timeout_ms() const { return timeout_ms_; }

  // Node ids in the order they were added.
  const std::vector<std::string>& node_order() const { return order_; }
  const std::vector<std::string>& duplicate_ids() const { return duplicate_ids_; }

  const Node* FindNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
  }

  bool operator==(const WorkflowDefinition& o) const {
    return id_ == o.id_ && name_ == o.name_ &&
           description_ == o.description_ && version_ == o.version_ &&
           nodes_ == o.nodes_ && edges_ == o.edges_ &&
           variables_ == o.variables_ && tags_ == o.tags_ &&
           metadata_ == o.metadata_ && timeout_ms_ == o.timeout_ms_;
  }
  bool operator!=(const WorkflowDefinition& o) const { return !(*this == o); }

 private:
  friend class WorkflowBuilder;

  std::string id_;
  std::string name_;
  std::string description_;
  std::string version_ = "1.0.0";
  std::map<std::string, Node> nodes_;
  std::vector<std::string> order_;
  std::vector<std::string> duplicate_ids_;
  std::vector<Edge> edges_;
  Variables variables_;
  std::vector<std::string> tags_;
  ConfigNode metadata_ = ConfigNode::Map();
  int64_t timeout_ms_ = 0;
};

using DefinitionPtr = std::shared_ptr<const WorkflowDefinition>;

}  // namespace miniflow
