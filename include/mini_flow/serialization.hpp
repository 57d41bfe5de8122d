#pragma once

#include <string>

#include "mini_flow/builder.hpp"
#include "mini_flow/config_node.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/graph.hpp"

namespace miniflow {

// ==========================================
// Definition <-> value tree
// ==========================================
//
// {id, name, description, version, tags, timeout_ms, variables, metadata,
//  nodes: [{id, kind, label, config, retry, timeout_ms, optional}],
//  edges: [{from, to, condition, loop_back}]}

inline ConfigNode RetryToTree(const RetryPolicy& r) {
  ConfigNode t = ConfigNode::Map();
  t.Set("max_attempts", ConfigNode::Int(r.max_attempts));
  t.Set("backoff", ConfigNode(ToString(r.backoff)));
  t.Set("initial_delay_ms", ConfigNode::Int(r.initial_delay_ms));
  t.Set("max_delay_ms", ConfigNode::Int(r.max_delay_ms));
  t.Set("multiplier", ConfigNode::Number(r.multiplier));
  return t;
}

inline ConfigNode ToTree(const WorkflowDefinition& def) {
  ConfigNode root = ConfigNode::Map();
  root.Set("id", ConfigNode(def.id()));
  root.Set("name", ConfigNode(def.name()));
  root.Set("description", ConfigNode(def.description()));
  root.Set("version", ConfigNode(def.version()));
  root.Set("tags", ConfigNode::StringList(def.tags()));
  root.Set("timeout_ms", ConfigNode::Int(def.timeout_ms()));

  ConfigNode vars = ConfigNode::Map();
  for (const auto& [k, v] : def.variables()) vars.Set(k, v);
  root.Set("variables", std::move(vars));
  root.Set("metadata", def.metadata());

  ConfigNode nodes = ConfigNode::Sequence();
  for (const auto& id : def.node_order()) {
    const Node& n = def.nodes().at(id);
    ConfigNode t = ConfigNode::Map();
    t.Set("id", ConfigNode(n.id));
    t.Set("kind", ConfigNode(ToString(n.kind)));
    t.Set("label", ConfigNode(n.label));
    t.Set("config", n.config);
    if (n.retry) t.Set("retry", RetryToTree(*n.retry));
    t.Set("timeout_ms", ConfigNode::Int(n.timeout_ms));
    t.Set("optional", ConfigNode::Bool(n.optional));
    nodes.Append(std::move(t));
  }
  root.Set("nodes", std::move(nodes));

  ConfigNode edges = ConfigNode::Sequence();
  for (const auto& e : def.edges()) {
    ConfigNode t = ConfigNode::Map();
    t.Set("from", ConfigNode(e.from));
    t.Set("to", ConfigNode(e.to));
    if (e.condition) t.Set("condition", ConfigNode(e.condition->ToText()));
    t.Set("loop_back", ConfigNode::Bool(e.loop_back));
    edges.Append(std::move(t));
  }
  root.Set("edges", std::move(edges));
  return root;
}

namespace detail {

inline std::string RequiredText(const ConfigNode& t, const std::string& key,
                                const std::string& where) {
  if (!t[key].IsScalar() || t[key].Text().empty()) {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    where + " is missing '" + key + "'");
  }
  return t[key].Text();
}

inline RetryPolicy RetryFromTree(const ConfigNode& t, const std::string& where) {
  if (!t.IsMap()) {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    where + ": retry must be a map");
  }
  RetryPolicy r;
  r.max_attempts = t["max_attempts"].As<int>(r.max_attempts);
  if (t.Has("backoff")) {
    auto b = ParseBackoff(t["backoff"].ToString());
    if (!b) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      where + ": unknown backoff '" + t["backoff"].ToString() +
                          "'");
    }
    r.backoff = *b;
  }
  r.initial_delay_ms = t["initial_delay_ms"].As<int64_t>(r.initial_delay_ms);
  r.max_delay_ms = t["max_delay_ms"].As<int64_t>(r.max_delay_ms);
  r.multiplier = t["multiplier"].As<double>(r.multiplier);
  return r;
}

}  // namespace detail

// Throws FlowError(kInvalidDefinition) for malformed trees and for
// definitions that fail validation.
inline DefinitionPtr FromTree(const ConfigNode& root) {
  if (!root.IsMap()) {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    "workflow tree must be a map");
  }
  std::string id = detail::RequiredText(root, "id", "workflow");
  WorkflowBuilder b(id, root["name"].As<std::string>(id));
  b.SetDescription(root["description"].As<std::string>());
  if (root["version"].IsScalar()) b.SetVersion(root["version"].Text());
  b.SetTimeout(root["timeout_ms"].As<int64_t>(0));
  for (const auto& tag : root["tags"]) b.AddTag(tag.ToString());
  for (const auto& [k, v] : root["variables"].Entries()) b.SetVariable(k, v);
  if (root["metadata"].IsMap()) b.SetMetadata(root["metadata"]);

  if (!root["nodes"].IsSequence()) {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    "workflow '" + id + "' must contain a 'nodes' list");
  }
  for (const auto& t : root["nodes"]) {
    std::string node_id = detail::RequiredText(t, "id", "node");
    std::string kind_name =
        detail::RequiredText(t, "kind", "node '" + node_id + "'");
    auto kind = ParseNodeKind(kind_name);
    if (!kind) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "node '" + node_id + "' has unknown kind '" + kind_name +
                          "'");
    }
    b.AddNode(node_id, *kind,
              t["config"].IsMap() ? t["config"] : ConfigNode::Map());
    if (t.Has("retry")) {
      b.WithRetry(detail::RetryFromTree(t["retry"], "node '" + node_id + "'"));
    }
    b.WithTimeout(t["timeout_ms"].As<int64_t>(0));
    b.WithLabel(t["label"].As<std::string>());
    b.Optional(t["optional"].As<bool>(false));
  }

  for (const auto& t : root["edges"]) {
    std::string from = detail::RequiredText(t, "from", "edge");
    std::string to = detail::RequiredText(t, "to", "edge from '" + from + "'");
    if (t["loop_back"].As<bool>(false)) {
      b.ConnectBack(from, to);
    } else if (t["condition"].IsScalar() && !t["condition"].Text().empty()) {
      // Surfaces malformed condition text as its own error.
      b.Connect(from, to, Condition::Parse(t["condition"].Text()));
    } else {
      b.Connect(from, to);
    }
  }
  return b.Build();
}

}  // namespace miniflow
