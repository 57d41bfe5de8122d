#pragma once

#include <map>
#include <queue>
#include <set>
#include <string>
#include <vector>

#include "mini_flow/errors.hpp"
#include "mini_flow/graph.hpp"
#include "mini_flow/transforms.hpp"

namespace miniflow {

// ==========================================
// Structural validation
// ==========================================

struct ValidationResult {
  std::vector<Violation> violations;

  bool ok() const { return violations.empty(); }

  std::string ToString() const {
    std::string out;
    for (const auto& v : violations) {
      if (!out.empty()) out += "\n";
      out += v.element + ": " + v.message;
    }
    return out;
  }
};

namespace detail {

inline std::map<std::string, std::vector<std::string>> ForwardAdjacency(
    const WorkflowDefinition& def) {
  std::map<std::string, std::vector<std::string>> adj;
  for (const auto& e : def.edges()) {
    if (e.loop_back) continue;
    if (!def.FindNode(e.from) || !def.FindNode(e.to)) continue;
    adj[e.from].push_back(e.to);
  }
  return adj;
}

inline std::set<std::string> ReachableFrom(
    const std::string& root,
    const std::map<std::string, std::vector<std::string>>& adj) {
  std::set<std::string> seen{root};
  std::queue<std::string> q;
  q.push(root);
  while (!q.empty()) {
    std::string cur = q.front();
    q.pop();
    auto it = adj.find(cur);
    if (it == adj.end()) continue;
    for (const auto& next : it->second) {
      if (seen.insert(next).second) q.push(next);
    }
  }
  return seen;
}

inline bool IsNonNegativeNumber(const ConfigNode& v) {
  double d = 0;
  return v.ToDouble(&d) && d >= 0;
}

inline bool IsPositiveInteger(const ConfigNode& v) {
  double d = 0;
  return v.ToDouble(&d) && d >= 1 && d == static_cast<double>(static_cast<int64_t>(d));
}

inline void CheckNodeConfig(const Node& node, std::vector<Violation>& out) {
  const ConfigNode& c = node.config;
  auto require = [&](const std::string& key) {
    if (!c.Has(key) || c[key].IsNull()) {
      out.push_back({node.id, std::string(ToString(node.kind)) +
                                  " node requires config '" + key + "'"});
      return false;
    }
    return true;
  };

  switch (node.kind) {
    case NodeKind::kStart:
    case NodeKind::kEnd:
    case NodeKind::kCondition:
      break;
    case NodeKind::kParallel:
      require("join_group");
      break;
    case NodeKind::kAgentSpawn:
      require("agent_type");
      break;
    case NodeKind::kAgentExecute:
      require("task");
      break;
    case NodeKind::kJoin:
      require("join_group");
      if (require("on_branch_failure")) {
        std::string policy = c["on_branch_failure"].ToString();
        if (policy != "fail_fast" && policy != "tolerate_partial") {
          out.push_back({node.id, "on_branch_failure must be fail_fast or "
                                  "tolerate_partial, got '" +
                                      policy + "'"});
        }
      }
      break;
    case NodeKind::kLoop:
      if (require("max_iterations") && !IsPositiveInteger(c["max_iterations"])) {
        out.push_back({node.id, "max_iterations must be a positive integer"});
      }
      require("body");
      if (!c.Has("condition") && !c.Has("iterations") && !c.Has("over") &&
          !c.Has("iterable_variable")) {
        out.push_back({node.id, "loop node requires config 'condition', "
                                "'iterations' or 'over'"});
      }
      if (c.Has("over") && c["over"].ToString().empty()) {
        out.push_back({node.id, "over must name a variable"});
      }
      if (c.Has("iterations") && !IsNonNegativeNumber(c["iterations"])) {
        out.push_back({node.id, "iterations must be a non-negative number"});
      }
      if (c.Has("condition")) {
        try {
          Condition::Parse(c["condition"].ToString());
        } catch (const FlowError& e) {
          out.push_back({node.id, e.what()});
        }
      }
      break;
    case NodeKind::kDelay:
      if (require("duration_ms") && !IsNonNegativeNumber(c["duration_ms"])) {
        out.push_back({node.id, "duration_ms must be a non-negative number"});
      }
      break;
    case NodeKind::kMcpCall:
    case NodeKind::kWebhook:
      require("target");
      break;
    case NodeKind::kHumanApproval:
      if (c.Has("default_action")) {
        std::string action = c["default_action"].ToString();
        if (action != "approve" && action != "reject") {
          out.push_back({node.id, "default_action must be approve or reject"});
        }
      }
      break;
    case NodeKind::kDataTransform:
      if (require("operation")) {
        std::string op = c["operation"].ToString();
        if (!TransformFactory::Get().Has(op)) {
          out.push_back({node.id, "unknown transform operation '" + op + "'"});
        }
      }
      require("output");
      break;
  }

  if (node.retry) {
    const RetryPolicy& r = *node.retry;
    if (r.max_attempts < 1) {
      out.push_back({node.id, "retry max_attempts must be at least 1"});
    }
    if (r.initial_delay_ms < 0 || r.max_delay_ms < 0) {
      out.push_back({node.id, "retry delays must be non-negative"});
    }
    if (r.multiplier <= 0) {
      out.push_back({node.id, "retry multiplier must be positive"});
    }
  }
  if (node.timeout_ms < 0) {
    out.push_back({node.id, "timeout_ms must be non-negative"});
  }
}

}  // namespace detail

// Reports every violation, not just the first.
inline ValidationResult Validate(const WorkflowDefinition& def) {
  ValidationResult result;
  auto& out = result.violations;
  const auto& nodes = def.nodes();
  const auto& edges = def.edges();

  if (def.timeout_ms() < 0) {
    out.push_back({def.id(), "timeout_ms must be non-negative"});
  }
  for (const auto& id : def.duplicate_ids()) {
    out.push_back({id, "duplicate node id"});
  }

  // Dangling edges
  std::map<std::string, std::vector<const Edge*>> outgoing;
  std::map<std::string, std::vector<const Edge*>> incoming;
  for (const auto& e : edges) {
    bool ok = true;
    if (!def.FindNode(e.from)) {
      out.push_back({e.Name(), "edge source '" + e.from + "' does not exist"});
      ok = false;
    }
    if (!def.FindNode(e.to)) {
      out.push_back({e.Name(), "edge target '" + e.to + "' does not exist"});
      ok = false;
    }
    if (!ok) continue;
    outgoing[e.from].push_back(&e);
    incoming[e.to].push_back(&e);
  }

  // START / END
  std::vector<std::string> starts, ends;
  for (const auto& id : def.node_order()) {
    const Node& n = nodes.at(id);
    if (n.kind == NodeKind::kStart) starts.push_back(id);
    if (n.kind == NodeKind::kEnd) ends.push_back(id);
  }
  if (starts.empty()) {
    out.push_back({def.id(), "workflow has no start node"});
  } else if (starts.size() > 1) {
    std::string names;
    for (const auto& s : starts) names += (names.empty() ? "" : ", ") + s;
    out.push_back({def.id(), "workflow has more than one start node: " + names});
  }
  for (const auto& s : starts) {
    if (!incoming[s].empty()) {
      out.push_back({s, "start node must not have incoming edges"});
    }
    const auto& outs = outgoing[s];
    if (outs.size() != 1 || outs[0]->condition) {
      out.push_back(
          {s, "start node must have exactly one unconditioned outgoing edge"});
    }
  }
  if (ends.empty()) {
    out.push_back({def.id(), "workflow has no end node"});
  }
  for (const auto& e : ends) {
    if (!outgoing[e].empty()) {
      out.push_back({e, "end node must not have outgoing edges"});
    }
  }

  // Reachability
  auto adj = detail::ForwardAdjacency(def);
  if (starts.size() == 1) {
    std::map<std::string, std::vector<std::string>> all_adj = adj;
    for (const auto& e : edges) {
      if (e.loop_back && def.FindNode(e.from) && def.FindNode(e.to)) {
        all_adj[e.from].push_back(e.to);
      }
    }
    auto reached = detail::ReachableFrom(starts[0], all_adj);
    bool end_reached = false;
    for (const auto& id : def.node_order()) {
      if (!reached.count(id)) {
        out.push_back({id, "node is unreachable from start"});
      } else if (nodes.at(id).kind == NodeKind::kEnd) {
        end_reached = true;
      }
    }
    if (!ends.empty() && !end_reached) {
      out.push_back({def.id(), "no end node is reachable from start"});
    }
  }

  // Cycles among forward edges (Kahn's algorithm)
  {
    std::map<std::string, int> in;
    for (const auto& [id, _] : nodes) in[id] = 0;
    for (const auto& [from, tos] : adj) {
      for (const auto& to : tos) ++in[to];
    }
    std::queue<std::string> q;
    for (const auto& [id, deg] : in) {
      if (deg == 0) q.push(id);
    }
    size_t processed = 0;
    while (!q.empty()) {
      std::string cur = q.front();
      q.pop();
      ++processed;
      auto it = adj.find(cur);
      if (it == adj.end()) continue;
      for (const auto& child : it->second) {
        if (--in[child] == 0) q.push(child);
      }
    }
    if (processed != nodes.size()) {
      std::string cycle_nodes;
      for (const auto& id : def.node_order()) {
        if (in[id] > 0) {
          if (!cycle_nodes.empty()) cycle_nodes += ", ";
          cycle_nodes += id;
        }
      }
      out.push_back({def.id(), "cycle detected involving nodes: " + cycle_nodes +
                                   " (mark loop edges as loop_back)"});
    }
  }

  // Back-edges
  for (const auto& e : edges) {
    if (!e.loop_back) continue;
    const Node* target = def.FindNode(e.to);
    if (!target || !def.FindNode(e.from)) continue;
    if (target->kind != NodeKind::kLoop) {
      out.push_back({e.Name(), "loop_back edge must target a loop node"});
      continue;
    }
    if (e.condition) {
      out.push_back({e.Name(), "loop_back edge must not carry a condition"});
    }
    auto body = detail::ReachableFrom(e.to, adj);
    if (e.from == e.to || !body.count(e.from)) {
      out.push_back({e.Name(), "loop_back edge must originate inside the body "
                               "of loop '" + e.to + "'"});
    }
  }

  // Per-kind configuration and edge layout
  std::set<std::string> parallel_groups;
  std::map<std::string, std::set<std::string>> group_reach;
  for (const auto& id : def.node_order()) {
    const Node& n = nodes.at(id);
    if (n.kind == NodeKind::kParallel && n.config.Has("join_group")) {
      std::string group = n.config["join_group"].ToString();
      parallel_groups.insert(group);
      auto reach = detail::ReachableFrom(id, adj);
      group_reach[group].insert(reach.begin(), reach.end());
    }
  }
  for (const auto& id : def.node_order()) {
    const Node& n = nodes.at(id);
    detail::CheckNodeConfig(n, out);

    if (n.kind == NodeKind::kCondition) {
      const auto& outs = outgoing[id];
      if (outs.empty()) {
        out.push_back({id, "condition node has no outgoing edges"});
      }
      int defaults = 0;
      for (size_t i = 0; i < outs.size(); ++i) {
        if (outs[i]->condition) continue;
        ++defaults;
        if (i + 1 != outs.size()) {
          out.push_back({outs[i]->Name(),
                         "default branch must be the last outgoing edge"});
        }
      }
      if (defaults > 1) {
        out.push_back({id, "condition node has more than one default branch"});
      }
    }
    if (n.kind == NodeKind::kJoin && n.config.Has("join_group")) {
      std::string group = n.config["join_group"].ToString();
      if (!parallel_groups.count(group)) {
        out.push_back({id, "join_group '" + group +
                               "' does not match any parallel node"});
      } else {
        // Every input must descend from a fan-out of the same group.
        const auto& reach = group_reach[group];
        for (const Edge* e : incoming[id]) {
          if (e->loop_back || reach.count(e->from)) continue;
          out.push_back({e->Name(), "join input '" + e->from +
                                        "' is not downstream of a parallel "
                                        "node in group '" + group + "'"});
        }
      }
    }
    if (n.kind == NodeKind::kLoop) {
      bool has_back = false;
      for (const Edge* e : incoming[id]) {
        if (e->loop_back) has_back = true;
      }
      if (!has_back) {
        out.push_back({id, "loop node has no loop_back edge closing its body"});
      }
    }
    if (n.kind == NodeKind::kLoop && n.config.Has("body")) {
      std::string body = n.config["body"].ToString();
      bool found = false;
      for (const Edge* e : outgoing[id]) {
        if (e->to == body && !e->loop_back) found = true;
      }
      if (!found) {
        out.push_back({id, "loop body '" + body +
                               "' is not the target of an outgoing edge"});
      }
    }
  }
  return result;
}

}  // namespace miniflow
