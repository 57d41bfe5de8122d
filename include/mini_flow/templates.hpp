#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "mini_flow/builder.hpp"
#include "mini_flow/config_node.hpp"
#include "mini_flow/errors.hpp"

namespace miniflow {

// ==========================================
// Template library
// ==========================================

struct TemplateParameter {
  std::string name;
  bool required = false;
  ConfigNode default_value;
  std::string description;
};

// The factory receives the caller's parameters with defaults filled in.
using TemplateFactory = std::function<DefinitionPtr(const ConfigNode& params)>;

struct WorkflowTemplate {
  std::string name;
  std::string category;
  std::string description;
  std::vector<TemplateParameter> parameters;
  TemplateFactory factory;
};

class TemplateLibrary {
 public:
  // Starts with the built-in templates.
  TemplateLibrary();

  void Register(WorkflowTemplate tmpl) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (templates_.count(tmpl.name)) {
      throw std::runtime_error("Template already registered: " + tmpl.name);
    }
    std::string name = tmpl.name;
    templates_[name] = std::move(tmpl);
  }

  bool Has(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return templates_.count(name) > 0;
  }

  std::vector<WorkflowTemplate> List() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<WorkflowTemplate> out;
    for (const auto& [_, t] : templates_) out.push_back(t);
    return out;
  }

  std::vector<WorkflowTemplate> List(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<WorkflowTemplate> out;
    for (const auto& [_, t] : templates_) {
      if (t.category == category) out.push_back(t);
    }
    return out;
  }

  std::vector<std::string> Categories() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::set<std::string> cats;
    for (const auto& [_, t] : templates_) cats.insert(t.category);
    return {cats.begin(), cats.end()};
  }

  // Throws TemplateNotFound, MissingParameter, or InvalidDefinition when the
  // parameters produce a bad graph.
  DefinitionPtr Instantiate(const std::string& name,
                            const ConfigNode& params = ConfigNode::Map()) const {
    WorkflowTemplate tmpl;
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      auto it = templates_.find(name);
      if (it == templates_.end()) {
        throw FlowError(ErrorKind::kTemplateNotFound,
                        "no template named '" + name + "'");
      }
      tmpl = it->second;
    }
    ConfigNode filled = params.IsMap() ? params : ConfigNode::Map();
    for (const auto& p : tmpl.parameters) {
      if (filled.Has(p.name) && !filled[p.name].IsNull()) continue;
      if (p.required) {
        throw FlowError(ErrorKind::kMissingParameter,
                        "template '" + name + "' requires parameter '" +
                            p.name + "'");
      }
      filled.Set(p.name, p.default_value);
    }
    return tmpl.factory(filled);
  }

 private:
  std::map<std::string, WorkflowTemplate> templates_;
  mutable std::shared_mutex mu_;
};

namespace builtin_templates {

inline std::vector<std::string> StringItems(const ConfigNode& params,
                                            const std::string& key) {
  std::vector<std::string> out;
  const ConfigNode& v = params[key];
  if (v.IsSequence()) {
    for (const auto& item : v) out.push_back(item.ToString());
  } else if (v.IsScalar()) {
    out.push_back(v.Text());
  }
  if (out.empty()) {
    throw FlowError(ErrorKind::kMissingParameter,
                    "parameter '" + key + "' must list at least one item");
  }
  return out;
}

inline std::string IdFor(const ConfigNode& params, const std::string& fallback) {
  return params["id"].As<std::string>(fallback);
}

inline DefinitionPtr Sequential(const ConfigNode& p) {
  auto steps = StringItems(p, "steps");
  WorkflowBuilder b(IdFor(p, "sequential"), p["name"].As<std::string>("Sequential"));
  b.SetDescription("Runs each step after the previous one").AddTag("sequential");
  b.AddStart();
  std::string prev = "start";
  for (size_t i = 0; i < steps.size(); ++i) {
    std::string id = "step_" + std::to_string(i + 1);
    b.ExecuteAgent(id, steps[i]).Connect(prev, id);
    prev = id;
  }
  b.AddEnd().Connect(prev, "end");
  return b.Build();
}

// failure_tolerance: none -> the join fails on the first failed branch;
// partial -> the join collects whatever arrived.
inline DefinitionPtr FanOutFanIn(const ConfigNode& p) {
  auto tasks = StringItems(p, "tasks");
  std::string tolerance = p["failure_tolerance"].As<std::string>("partial");
  std::string policy;
  if (tolerance == "none" || tolerance == "fail_fast") {
    policy = "fail_fast";
  } else if (tolerance == "partial" || tolerance == "tolerate_partial") {
    policy = "tolerate_partial";
  } else {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    "failure_tolerance must be none or partial, got '" +
                        tolerance + "'");
  }

  WorkflowBuilder b(IdFor(p, "fan_out_fan_in"),
                    p["name"].As<std::string>("Fan-out / fan-in"));
  b.SetDescription("Runs the tasks in parallel and gathers their results")
      .AddTag("parallel");
  b.AddStart().AddParallel("fan_out", "fan").Connect("start", "fan_out");
  b.AddJoin("fan_in", "fan", policy);
  std::vector<std::string> outputs;
  for (size_t i = 0; i < tasks.size(); ++i) {
    std::string id = "task_" + std::to_string(i + 1);
    b.ExecuteAgent(id, tasks[i]).Optional();
    b.Connect("fan_out", id).Connect(id, "fan_in");
    outputs.push_back(id + "_output");
  }
  b.AddTransform("aggregate", "collect", outputs, "results")
      .Connect("fan_in", "aggregate");
  b.AddEnd().Connect("aggregate", "end");
  return b.Build();
}

inline DefinitionPtr ConditionalReview(const ConfigNode& p) {
  std::string task = p["task"].ToString();
  std::string variable = p["variable"].ToString();
  const ConfigNode& threshold = p["threshold"];
  std::string literal =
      threshold.IsString() ? "\"" + threshold.Text() + "\"" : threshold.Text();

  WorkflowBuilder b(IdFor(p, "conditional_review"),
                    p["name"].As<std::string>("Conditional review"));
  b.SetDescription("Accepts the work when " + variable +
                   " reaches the threshold, otherwise revises it")
      .AddTag("review");
  b.AddStart()
      .ExecuteAgent("work", task)
      .AddCondition("review")
      .AddTransform("accept", "set", {}, "review_status",
                    ConfigNode::Map().Set("value", ConfigNode("accepted")))
      .ExecuteAgent("revise", "Revise: " + task)
      .AddEnd()
      .Connect("start", "work")
      .Connect("work", "review")
      .Connect("review", "accept", variable + " >= " + literal)
      .Connect("review", "revise")
      .Connect("accept", "end")
      .Connect("revise", "end");
  return b.Build();
}

inline DefinitionPtr ApprovalGate(const ConfigNode& p) {
  WorkflowBuilder b(IdFor(p, "approval_gate"),
                    p["name"].As<std::string>("Approval gate"));
  b.SetDescription("Prepares the work and waits for a human decision")
      .AddTag("approval");
  b.AddStart()
      .ExecuteAgent("prepare", p["task"].ToString())
      .AddHumanApproval("approval", p["approval_message"].ToString())
      .WithTimeout(p["timeout_ms"].As<int64_t>(0))
      .WithConfig("default_action",
                  ConfigNode(p["default_action"].As<std::string>("reject")))
      .AddEnd()
      .Connect("start", "prepare")
      .Connect("prepare", "approval")
      .Connect("approval", "end");
  return b.Build();
}

// Refines the work up to max_iterations times; with `continue_while` the
// loop also stops as soon as that condition no longer holds.
inline DefinitionPtr IterativeRefinement(const ConfigNode& p) {
  int max_iterations = p["max_iterations"].As<int>(0);
  std::string condition = p["continue_while"].As<std::string>();
  WorkflowBuilder b(IdFor(p, "iterative_refinement"),
                    p["name"].As<std::string>("Iterative refinement"));
  b.SetDescription("Refines the work in a bounded loop").AddTag("loop");
  b.AddStart()
      .AddLoop("iterate", "refine", max_iterations, condition, max_iterations)
      .ExecuteAgent("refine", p["task"].ToString())
      .AddTransform("record", "collect", {"refine_output"}, "history")
      .AddEnd()
      .Connect("start", "iterate")
      .Connect("iterate", "refine")
      .Connect("iterate", "end")
      .Connect("refine", "record")
      .ConnectBack("record", "iterate");
  return b.Build();
}

inline DefinitionPtr DataPipeline(const ConfigNode& p) {
  auto steps = StringItems(p, "steps");
  WorkflowBuilder b(IdFor(p, "data_pipeline"),
                    p["name"].As<std::string>("Data pipeline"));
  b.SetDescription("Extracts from the source and runs each processing step")
      .AddTag("data");
  b.AddStart()
      .CallMcp("extract", p["source"].ToString())
      .WithRetry({3, Backoff::kExponential, 500, 10000, 2.0})
      .Connect("start", "extract");
  std::string prev = "extract";
  for (size_t i = 0; i < steps.size(); ++i) {
    std::string id = "process_" + std::to_string(i + 1);
    ConfigNode config = ConfigNode::Map();
    config.Set("input", ConfigNode(prev + "_output"));
    b.ExecuteAgent(id, steps[i], config).Connect(prev, id);
    prev = id;
  }
  b.AddEnd().Connect(prev, "end");
  return b.Build();
}

}  // namespace builtin_templates

inline TemplateLibrary::TemplateLibrary() {
  auto param = [](const std::string& name, bool required,
                  const std::string& description,
                  ConfigNode default_value = ConfigNode()) {
    return TemplateParameter{name, required, std::move(default_value),
                             description};
  };

  Register({"sequential", "general", "Run a list of agent tasks one by one",
            {param("steps", true, "tasks to run in order")},
            builtin_templates::Sequential});
  Register({"fan_out_fan_in", "general",
            "Run tasks in parallel and gather the results",
            {param("tasks", true, "tasks to run in parallel"),
             param("failure_tolerance", false, "none or partial",
                   ConfigNode("partial"))},
            builtin_templates::FanOutFanIn});
  Register({"conditional_review", "development",
            "Route work to acceptance or revision by a score",
            {param("task", true, "the work to produce"),
             param("variable", true, "variable holding the score"),
             param("threshold", true, "minimum score to accept")},
            builtin_templates::ConditionalReview});
  Register({"approval_gate", "process",
            "Prepare work and pause for human approval",
            {param("task", true, "the work to prepare"),
             param("approval_message", true, "shown to the approver"),
             param("timeout_ms", false, "approval timeout", ConfigNode::Int(0)),
             param("default_action", false, "approve or reject on timeout",
                   ConfigNode("reject"))},
            builtin_templates::ApprovalGate});
  Register({"iterative_refinement", "development",
            "Refine work in a bounded loop",
            {param("task", true, "the refinement task"),
             param("max_iterations", true, "upper bound on iterations"),
             param("continue_while", false,
                   "condition that must hold for another iteration")},
            builtin_templates::IterativeRefinement});
  Register({"data_pipeline", "data",
            "Extract from a source and run processing steps",
            {param("source", true, "service target to extract from"),
             param("steps", true, "processing tasks in order")},
            builtin_templates::DataPipeline});
}

}  // namespace miniflow
