#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "mini_flow.hpp"

#include <gtest/gtest.h>

using namespace miniflow;

// Silent logger: suppress stdout/stderr noise in tests
static LogFn silent = SilentLogger();

// ============================================================
// Test Helpers
// ============================================================

// Answers "<node> done" unless a script is installed for the node.
class ScriptedExecutor : public TaskExecutor {
 public:
  using Script = std::function<Value(const TaskRequest&)>;

  void On(const std::string& node_id, Script script) {
    std::lock_guard<std::mutex> lock(mu_);
    scripts_[node_id] = std::move(script);
  }

  Value Execute(const TaskRequest& req) override {
    Script script;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++calls_[req.node_id];
      auto it = scripts_.find(req.node_id);
      if (it != scripts_.end()) script = it->second;
    }
    if (script) return script(req);
    return Value::String(req.node_id + " done");
  }

  int Calls(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_[node_id];
  }

 private:
  std::mutex mu_;
  std::map<std::string, Script> scripts_;
  std::map<std::string, int> calls_;
};

class ScriptedService : public ExternalService {
 public:
  using Script = std::function<Value(const ServiceRequest&)>;

  void On(const std::string& node_id, Script script) {
    std::lock_guard<std::mutex> lock(mu_);
    scripts_[node_id] = std::move(script);
  }

  Value Call(const ServiceRequest& req) override {
    Script script;
    {
      std::lock_guard<std::mutex> lock(mu_);
      requests_.push_back(req);
      auto it = scripts_.find(req.node_id);
      if (it != scripts_.end()) script = it->second;
    }
    if (script) return script(req);
    return Value::String(req.target);
  }

  std::vector<ServiceRequest> Requests() {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

 private:
  std::mutex mu_;
  std::map<std::string, Script> scripts_;
  std::vector<ServiceRequest> requests_;
};

// Records every transition it sees.
class EventLog {
 public:
  Observer Observe() {
    return [this](const TransitionEvent& e) {
      std::lock_guard<std::mutex> lock(mu_);
      events_.push_back(e);
    };
  }

  std::vector<TransitionEvent> Events() {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

  // Position of the first `node` -> `to` transition, or -1.
  int IndexOf(const std::string& node, const std::string& to) {
    std::lock_guard<std::mutex> lock(mu_);
    for (size_t i = 0; i < events_.size(); ++i) {
      if (events_[i].node_id == node && events_[i].to == to) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

 private:
  std::mutex mu_;
  std::vector<TransitionEvent> events_;
};

static bool WaitUntil(const std::function<bool()>& pred, int timeout_ms = 2000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

static bool HasViolation(const ValidationResult& r, const std::string& element) {
  for (const auto& v : r.violations) {
    if (v.element == element) return true;
  }
  return false;
}

static bool HasViolationContaining(const ValidationResult& r,
                                   const std::string& text) {
  for (const auto& v : r.violations) {
    if (v.message.find(text) != std::string::npos) return true;
  }
  return false;
}

static Node MakeNode(const std::string& id, NodeKind kind,
                     ConfigNode config = ConfigNode::Map()) {
  Node n;
  n.id = id;
  n.kind = kind;
  n.config = std::move(config);
  return n;
}

static Edge MakeEdge(const std::string& from, const std::string& to,
                     bool loop_back = false) {
  Edge e;
  e.from = from;
  e.to = to;
  e.loop_back = loop_back;
  return e;
}

// start -> greet -> end
static DefinitionPtr GreetFlow() {
  return WorkflowBuilder("greet_flow", "Greet")
      .AddStart()
      .ExecuteAgent("greet", "say hello")
      .AddEnd()
      .Connect("start", "greet")
      .Connect("greet", "end")
      .Build();
}

static DefinitionPtr ApprovalFlow(int64_t timeout_ms = 0,
                                  const std::string& default_action = "") {
  WorkflowBuilder b("approval_flow", "Approval");
  b.AddStart().AddHumanApproval("approval", "ship it?");
  if (timeout_ms > 0) b.WithTimeout(timeout_ms);
  if (!default_action.empty()) {
    b.WithConfig("default_action", ConfigNode(default_action));
  }
  return b.AddEnd()
      .Connect("start", "approval")
      .Connect("approval", "end")
      .Build();
}

class ReverseTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    std::string s = args.inputs.at(0).ToString();
    std::reverse(s.begin(), s.end());
    return Value::String(s);
  }
  std::string Name() const override { return "reverse"; }
};
MINIFLOW_REGISTER_TRANSFORM("reverse", ReverseTransform);

// ============================================================
// A. ThreadPool / TimerQueue Tests
// ============================================================

TEST(ThreadPool, BasicEnqueueAndComplete) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(4);
    for (int i = 0; i < 10; ++i) {
      pool.Enqueue([&counter] { counter.fetch_add(1); });
    }
  }  // destructor joins
  EXPECT_EQ(counter.load(), 10);
}

TEST(ThreadPool, ZeroThreadsStillRuns) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(0);
    EXPECT_EQ(pool.Size(), 1u);
    pool.Enqueue([&counter] { counter.fetch_add(1); });
  }
  EXPECT_EQ(counter.load(), 1);
}

TEST(TimerQueue, FiresInDeadlineOrder) {
  std::vector<int> order;
  std::mutex mu;
  std::atomic<int> fired{0};
  TimerQueue timers;
  timers.Schedule(std::chrono::milliseconds(30), [&] {
    std::lock_guard<std::mutex> lock(mu);
    order.push_back(2);
    fired.fetch_add(1);
  });
  timers.Schedule(std::chrono::milliseconds(5), [&] {
    std::lock_guard<std::mutex> lock(mu);
    order.push_back(1);
    fired.fetch_add(1);
  });
  ASSERT_TRUE(WaitUntil([&] { return fired.load() == 2; }));
  std::lock_guard<std::mutex> lock(mu);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(TimerQueue, CancelledTimerNeverFires) {
  std::atomic<bool> fired{false};
  TimerQueue timers;
  auto id = timers.Schedule(std::chrono::milliseconds(20),
                            [&fired] { fired.store(true); });
  EXPECT_TRUE(timers.Cancel(id));
  EXPECT_FALSE(timers.Cancel(id));
  EXPECT_EQ(timers.Pending(), 0u);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(fired.load());
}

// ============================================================
// B. ConfigNode Tests
// ============================================================

TEST(ConfigNode, DefaultIsNull) {
  ConfigNode node;
  EXPECT_TRUE(node.IsNull());
  EXPECT_EQ(node.size(), 0u);
}

TEST(ConfigNode, ScalarKinds) {
  EXPECT_TRUE(ConfigNode::Int(3).IsNumber());
  EXPECT_EQ(ConfigNode::Int(3).As<int>(), 3);
  EXPECT_TRUE(ConfigNode::Bool(true).As<bool>());
  EXPECT_TRUE(ConfigNode("3").IsString());
  EXPECT_FALSE(ConfigNode("3") == ConfigNode::Int(3));
}

TEST(ConfigNode, MissingKeyFallsBackToDefault) {
  ConfigNode node = ConfigNode::Map().Set("a", ConfigNode::Int(1));
  EXPECT_EQ(node["missing"].As<int>(7), 7);
  EXPECT_TRUE(node["a"]["nested"].IsNull());
  EXPECT_THROW(node["missing"].AsRequired<int>(), std::runtime_error);
}

TEST(ConfigNode, DumpRendersJsonLikeText) {
  ConfigNode node = ConfigNode::Map();
  node.Set("name", ConfigNode("x"));
  node.Set("items", ConfigNode::Sequence()
                        .Append(ConfigNode::Int(1))
                        .Append(ConfigNode::Bool(false)));
  EXPECT_EQ(node.Dump(), R"({"items":[1,false],"name":"x"})");
}

// ============================================================
// C. Condition Tests
// ============================================================

TEST(Condition, NumericComparison) {
  auto cond = Condition::Parse("x > 5");
  EXPECT_TRUE(cond.Evaluate({{"x", Value::Int(10)}}));
  EXPECT_FALSE(cond.Evaluate({{"x", Value::Int(2)}}));
  EXPECT_FALSE(cond.Evaluate({}));
}

TEST(Condition, StringEqualityAndLogic) {
  Variables vars{{"status", Value::String("done")}, {"retries", Value::Int(1)}};
  EXPECT_TRUE(Condition::Parse(R"(status == "done" && retries < 3)")
                  .Evaluate(vars));
  EXPECT_FALSE(Condition::Parse(R"(status == "open" && retries < 3)")
                   .Evaluate(vars));
  EXPECT_TRUE(Condition::Parse(R"(status == "open" || retries < 3)")
                  .Evaluate(vars));
  EXPECT_FALSE(Condition::Parse(R"(status == "done" ^^ retries < 3)")
                   .Evaluate(vars));
}

TEST(Condition, ContainsRegexAndExistence) {
  Variables vars;
  vars["tags"] = Value::StringList({"urgent", "billing"});
  vars["reply"] = Value::String("LGTM, ship it");
  EXPECT_TRUE(Condition::Parse(R"(tags contains "billing")").Evaluate(vars));
  EXPECT_TRUE(Condition::Parse(R"(tags not_contains "sales")").Evaluate(vars));
  EXPECT_TRUE(Condition::Parse(R"(reply contains "LGTM")").Evaluate(vars));
  EXPECT_TRUE(Condition::Parse(R"(reply regex "LG[A-Z]+")").Evaluate(vars));
  EXPECT_TRUE(Condition::Parse("reply exists").Evaluate(vars));
  EXPECT_TRUE(Condition::Parse("forced not_exists").Evaluate(vars));
}

TEST(Condition, MalformedTextThrows) {
  EXPECT_THROW(Condition::Parse("x >"), FlowError);
  EXPECT_THROW(Condition::Parse("x ~ 3"), FlowError);
  EXPECT_THROW(Condition::Parse(R"(x == "open)"), FlowError);
  EXPECT_THROW(Condition::Parse("a > 1 && b > 2 || c > 3"), FlowError);
  EXPECT_THROW(Condition::Parse(R"(x regex "(")"), FlowError);
  try {
    Condition::Parse("== 3");
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidDefinition);
  }
}

TEST(Condition, TextFormReparses) {
  auto cond = Condition::Parse(R"(status == "done" || score >= 7.5)");
  EXPECT_TRUE(Condition::Parse(cond.ToText()) == cond);
}

// ============================================================
// D. RetryPolicy Tests
// ============================================================

TEST(RetryPolicy, BackoffArithmetic) {
  RetryPolicy fixed{3, Backoff::kFixed, 100};
  EXPECT_EQ(fixed.DelayAfter(1), 100);
  EXPECT_EQ(fixed.DelayAfter(2), 100);

  RetryPolicy linear{3, Backoff::kLinear, 100};
  EXPECT_EQ(linear.DelayAfter(1), 100);
  EXPECT_EQ(linear.DelayAfter(3), 300);

  RetryPolicy exponential{5, Backoff::kExponential, 100, 250, 2.0};
  EXPECT_EQ(exponential.DelayAfter(1), 100);
  EXPECT_EQ(exponential.DelayAfter(2), 200);
  EXPECT_EQ(exponential.DelayAfter(3), 250);  // capped

  RetryPolicy none{3, Backoff::kNone, 100};
  EXPECT_EQ(none.DelayAfter(2), 0);
}

TEST(RetryPolicy, NodeWithoutPolicyHasOneAttempt) {
  Node n = MakeNode("a", NodeKind::kAgentExecute);
  EXPECT_EQ(n.MaxAttempts(), 1);
  n.retry = RetryPolicy{4, Backoff::kNone};
  EXPECT_EQ(n.MaxAttempts(), 4);
}

// ============================================================
// E. Validation Tests
// ============================================================

TEST(Validate, ValidDefinitionHasNoViolations) {
  auto def = GreetFlow();
  auto result = Validate(*def);
  EXPECT_TRUE(result.ok()) << result.ToString();
}

TEST(Validate, DanglingEdgeNamesTheEdge) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart), MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "end"), MakeEdge("end", "ghost")});
  auto result = Validate(def);
  EXPECT_TRUE(HasViolation(result, "end->ghost"));
}

TEST(Validate, StartCountIsChecked) {
  WorkflowDefinition none("wf", "wf", "", {MakeNode("end", NodeKind::kEnd)},
                          {});
  EXPECT_TRUE(HasViolationContaining(Validate(none), "no start node"));

  WorkflowDefinition two(
      "wf", "wf", "",
      {MakeNode("s1", NodeKind::kStart), MakeNode("s2", NodeKind::kStart),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("s1", "end"), MakeEdge("s2", "end")});
  auto result = Validate(two);
  EXPECT_TRUE(HasViolationContaining(result, "more than one start node"));
  EXPECT_TRUE(HasViolation(result, "wf"));
}

TEST(Validate, UnmarkedCycleIsReported) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("a", NodeKind::kAgentExecute,
                ConfigNode::Map().Set("task", ConfigNode("a"))),
       MakeNode("b", NodeKind::kAgentExecute,
                ConfigNode::Map().Set("task", ConfigNode("b"))),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "a"), MakeEdge("a", "b"), MakeEdge("b", "a"),
       MakeEdge("b", "end")});
  auto result = Validate(def);
  ASSERT_TRUE(HasViolationContaining(result, "cycle detected"));
  for (const auto& v : result.violations) {
    if (v.message.find("cycle") != std::string::npos) {
      EXPECT_NE(v.message.find("a, b"), std::string::npos);
    }
  }
}

TEST(Validate, UnreachableNodeIsReported) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart), MakeNode("end", NodeKind::kEnd),
       MakeNode("island", NodeKind::kDelay,
                ConfigNode::Map().Set("duration_ms", ConfigNode::Int(1)))},
      {MakeEdge("start", "end")});
  EXPECT_TRUE(HasViolation(Validate(def), "island"));
}

TEST(Validate, LoopBackMustTargetLoop) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("a", NodeKind::kAgentExecute,
                ConfigNode::Map().Set("task", ConfigNode("a"))),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "a"), MakeEdge("a", "end"),
       MakeEdge("a", "a", true)});
  EXPECT_TRUE(HasViolation(Validate(def), "a->a"));
}

TEST(Validate, PerKindConfigIsChecked) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("fan", NodeKind::kParallel,
                ConfigNode::Map().Set("join_group", ConfigNode("g"))),
       MakeNode("join", NodeKind::kJoin,
                ConfigNode::Map().Set("join_group", ConfigNode("g"))),
       MakeNode("calc", NodeKind::kDataTransform,
                ConfigNode::Map()
                    .Set("operation", ConfigNode("no_such_op"))
                    .Set("output", ConfigNode("x"))),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "fan"), MakeEdge("fan", "join"),
       MakeEdge("join", "calc"), MakeEdge("calc", "end")});
  auto result = Validate(def);
  EXPECT_TRUE(HasViolation(result, "join"));  // no on_branch_failure
  EXPECT_TRUE(HasViolationContaining(result, "unknown transform operation"));
}

TEST(Validate, DefaultBranchMustBeLast) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("route", NodeKind::kCondition),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "route"), MakeEdge("route", "end"),
       [] {
         Edge e = MakeEdge("route", "end");
         e.condition = Condition::Parse("x > 1");
         return e;
       }()});
  EXPECT_TRUE(HasViolationContaining(Validate(def), "default branch"));
}

TEST(Validate, DuplicateNodeId) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("a", NodeKind::kAgentExecute,
                ConfigNode::Map().Set("task", ConfigNode("x"))),
       MakeNode("a", NodeKind::kAgentExecute,
                ConfigNode::Map().Set("task", ConfigNode("y"))),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "a"), MakeEdge("a", "end")});
  auto result = Validate(def);
  EXPECT_TRUE(HasViolation(result, "a"));
  EXPECT_TRUE(HasViolationContaining(result, "duplicate node id"));
  ASSERT_NE(def.FindNode("a"), nullptr);
  EXPECT_EQ(def.FindNode("a")->config["task"].ToString(), "x");
  EXPECT_EQ(def.node_order().size(), 3u);
}

TEST(Validate, JoinInputMustDescendFromParallel) {
  auto agent = [](const std::string& id) {
    return MakeNode(id, NodeKind::kAgentExecute,
                    ConfigNode::Map().Set("task", ConfigNode(id)));
  };
  Edge high = MakeEdge("route", "fan");
  high.condition = Condition::Parse("x > 1");
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("route", NodeKind::kCondition),
       MakeNode("fan", NodeKind::kParallel,
                ConfigNode::Map().Set("join_group", ConfigNode("g"))),
       agent("a"), agent("b"), agent("side"),
       MakeNode("join", NodeKind::kJoin,
                ConfigNode::Map()
                    .Set("join_group", ConfigNode("g"))
                    .Set("on_branch_failure", ConfigNode("fail_fast"))),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "route"), high, MakeEdge("route", "side"),
       MakeEdge("fan", "a"), MakeEdge("fan", "b"), MakeEdge("a", "join"),
       MakeEdge("b", "join"), MakeEdge("side", "join"),
       MakeEdge("join", "end")});
  auto result = Validate(def);
  EXPECT_TRUE(HasViolation(result, "side->join"));
  EXPECT_TRUE(HasViolationContaining(result, "not downstream of a parallel"));
  EXPECT_FALSE(HasViolation(result, "a->join"));
  EXPECT_FALSE(HasViolation(result, "b->join"));
}

TEST(Validate, ForEachLoopNeedsNoCondition) {
  WorkflowDefinition def(
      "wf", "wf", "",
      {MakeNode("start", NodeKind::kStart),
       MakeNode("each", NodeKind::kLoop,
                ConfigNode::Map()
                    .Set("body", ConfigNode("work"))
                    .Set("over", ConfigNode("items"))
                    .Set("max_iterations", ConfigNode::Int(10))),
       MakeNode("work", NodeKind::kAgentExecute,
                ConfigNode::Map().Set("task", ConfigNode("w"))),
       MakeNode("end", NodeKind::kEnd)},
      {MakeEdge("start", "each"), MakeEdge("each", "work"),
       MakeEdge("each", "end"), MakeEdge("work", "each", true)});
  auto result = Validate(def);
  EXPECT_TRUE(result.ok()) << result.ToString();
}

// ============================================================
// F. WorkflowBuilder Tests
// ============================================================

TEST(WorkflowBuilder, BuildsNodesInOrder) {
  auto def = WorkflowBuilder("wf", "Flow")
                 .SetDescription("demo")
                 .SetVariable("x", Value::Int(1))
                 .AddTag("demo")
                 .AddStart()
                 .ExecuteAgent("work", "do it")
                 .WithRetry({3, Backoff::kLinear, 10})
                 .WithTimeout(500)
                 .WithLabel("Work")
                 .AddEnd()
                 .Connect("start", "work")
                 .Connect("work", "end")
                 .Build();
  EXPECT_EQ(def->node_order(),
            (std::vector<std::string>{"start", "work", "end"}));
  const Node* work = def->FindNode("work");
  ASSERT_NE(work, nullptr);
  EXPECT_EQ(work->config["task"].ToString(), "do it");
  ASSERT_TRUE(work->retry.has_value());
  EXPECT_EQ(work->retry->max_attempts, 3);
  EXPECT_EQ(work->timeout_ms, 500);
  EXPECT_EQ(work->label, "Work");
  EXPECT_EQ(def->variables().at("x").As<int>(), 1);
  EXPECT_EQ(def->version(), "1.0.0");
}

TEST(WorkflowBuilder, DuplicateNodeIdFailsBuild) {
  WorkflowBuilder b("wf", "Flow");
  b.AddStart().ExecuteAgent("a", "x").ExecuteAgent("a", "y").AddEnd();
  b.Connect("start", "a").Connect("a", "end");
  try {
    b.Build();
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidDefinition);
    bool named = false;
    for (const auto& v : e.violations()) named = named || v.element == "a";
    EXPECT_TRUE(named);
  }
}

TEST(WorkflowBuilder, MalformedConditionFailsBuild) {
  WorkflowBuilder b("wf", "Flow");
  b.AddStart().AddCondition("route").AddEnd();
  b.Connect("start", "route").Connect("route", "end", "x >");
  EXPECT_THROW(b.Build(), FlowError);
}

TEST(WorkflowBuilder, ModifierWithoutNodeFailsBuild) {
  WorkflowBuilder b("wf", "Flow");
  b.WithTimeout(10).AddStart().AddEnd().Connect("start", "end");
  EXPECT_THROW(b.Build(), FlowError);
}

// ============================================================
// G. Codec Tests
// ============================================================

static DefinitionPtr RichFlow() {
  return WorkflowBuilder("rich", "Rich flow")
      .SetDescription("every feature at once")
      .SetVersion("2.1.0")
      .SetTimeout(60000)
      .SetVariable("threshold", Value::Number(0.5))
      .SetVariable("enabled", Value::Bool(true))
      .SetMetadata(ConfigNode::Map().Set("owner", ConfigNode("ops")))
      .AddTag("test")
      .AddStart()
      .CallMcp("fetch", "mcp://store/items",
               ConfigNode::Map().Set("limit", ConfigNode::Int(5)))
      .WithRetry({3, Backoff::kExponential, 100, 1000, 2.0})
      .Optional()
      .AddCondition("route")
      .AddLoop("refine", "polish", 4, "score < 7")
      .ExecuteAgent("polish", "polish the draft")
      .AddTransform("empty", "set", {}, "flag",
                    ConfigNode::Map().Set("value", ConfigNode("")))
      .AddHumanApproval("sign_off", "looks good?")
      .WithTimeout(1000)
      .AddEnd()
      .Connect("start", "fetch")
      .Connect("fetch", "route")
      .Connect("route", "refine", R"(fetch_output exists && mode == "deep")")
      .Connect("route", "empty")
      .Connect("refine", "polish")
      .Connect("refine", "sign_off")
      .ConnectBack("polish", "refine")
      .Connect("empty", "sign_off")
      .Connect("sign_off", "end")
      .Build();
}

TEST(Codec, JsonRoundTripIsStructurallyEqual) {
  auto def = RichFlow();
  auto copy = FromJson(ToJson(*def));
  EXPECT_TRUE(*copy == *def);
  EXPECT_EQ(copy->node_order(), def->node_order());
}

TEST(Codec, YamlRoundTripIsStructurallyEqual) {
  auto def = RichFlow();
  auto copy = FromYaml(ToYaml(*def));
  EXPECT_TRUE(*copy == *def);
}

TEST(Codec, YamlDocumentLoads) {
  const std::string text = R"(
id: hand_written
name: Hand written
nodes:
  - {id: start, kind: start}
  - id: wait
    kind: delay
    config: {duration_ms: 10}
  - {id: end, kind: end}
edges:
  - {from: start, to: wait}
  - {from: wait, to: end}
)";
  auto def = FromYaml(text);
  EXPECT_EQ(def->id(), "hand_written");
  EXPECT_EQ(def->FindNode("wait")->kind, NodeKind::kDelay);
  EXPECT_EQ(def->FindNode("wait")->config["duration_ms"].As<int>(), 10);
}

TEST(Codec, MalformedInputIsInvalidDefinition) {
  auto expect_invalid = [](const std::function<void()>& fn) {
    try {
      fn();
      ADD_FAILURE() << "expected FlowError";
    } catch (const FlowError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::kInvalidDefinition);
    }
  };
  expect_invalid([] { FromJson("{ not json"); });
  expect_invalid([] { FromJson(R"({"id": "x", "nodes": [{"id": "a"}]})"); });
  expect_invalid([] {
    FromJson(R"({"id": "x", "nodes": [{"id": "a", "kind": "teleport"}]})");
  });
  expect_invalid([] {
    FromJson(R"({"id": "x",
                 "nodes": [{"id": "start", "kind": "start"},
                           {"id": "end", "kind": "end"}],
                 "edges": [{"from": "start", "to": "end",
                            "condition": "x =="}]})");
  });
  expect_invalid([] { FromYaml("nodes: [unclosed"); });
  expect_invalid([] { FromYaml("id: x\nnodes: {}\n"); });
}

TEST(Codec, JsonValueConversion) {
  ConfigNode node = ParseJsonTree(R"({"n": 3, "f": 1.5, "b": true, "s": "3"})");
  EXPECT_TRUE(node["n"].IsNumber());
  EXPECT_TRUE(node["f"].IsNumber());
  EXPECT_TRUE(node["b"].IsBool());
  EXPECT_TRUE(node["s"].IsString());
  auto j = ToJsonValue(node);
  EXPECT_TRUE(j["n"].is_number_integer());
  EXPECT_TRUE(j["f"].is_number_float());
  EXPECT_TRUE(j["s"].is_string());
}

// ============================================================
// H. Transform Tests
// ============================================================

static Value ApplyTransform(const std::string& name, const ConfigNode& config,
                            std::vector<Value> inputs,
                            const Variables& vars = {}) {
  auto t = TransformFactory::Get().Create(name);
  return t->Apply(TransformArgs{config, std::move(inputs), vars});
}

TEST(Transforms, BuiltinsAreRegistered) {
  for (const char* name : {"set", "copy", "concat", "sum", "increment", "count",
                           "collect", "merge", "format"}) {
    EXPECT_TRUE(TransformFactory::Get().Has(name)) << name;
  }
  EXPECT_THROW(TransformFactory::Get().Create("no_such_op"),
               std::runtime_error);
}

TEST(Transforms, CustomRegistrationIsVisible) {
  EXPECT_TRUE(TransformFactory::Get().Has("reverse"));
  EXPECT_EQ(ApplyTransform("reverse", ConfigNode::Map(), {Value::String("abc")})
                .ToString(),
            "cba");
}

TEST(Transforms, ValueOperations) {
  auto config = ConfigNode::Map().Set("separator", ConfigNode(", "));
  EXPECT_EQ(ApplyTransform("concat", config,
                           {Value::String("a"),
                            Value::StringList({"b", "c"})})
                .ToString(),
            "a, b, c");
  EXPECT_EQ(ApplyTransform("sum", ConfigNode::Map(),
                           {Value::Int(2), Value::Number(0.5)})
                .As<double>(),
            2.5);
  EXPECT_EQ(ApplyTransform("increment", ConfigNode::Map(), {Value()}).As<int>(),
            1);
  EXPECT_EQ(ApplyTransform("increment",
                           ConfigNode::Map().Set("by", ConfigNode::Int(5)),
                           {Value::Int(2)})
                .As<int>(),
            7);
  EXPECT_EQ(ApplyTransform("count", ConfigNode::Map(),
                           {Value::StringList({"x", "y", "z"})})
                .As<int>(),
            3);
}

TEST(Transforms, CollectAppendsToOutputVariable) {
  Variables vars;
  vars["history"] = Value::StringList({"v1"});
  auto out = ApplyTransform(
      "collect", ConfigNode::Map().Set("output", ConfigNode("history")),
      {Value::String("v2")}, vars);
  ASSERT_TRUE(out.IsSequence());
  EXPECT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].ToString(), "v2");
}

TEST(Transforms, BadInputThrows) {
  EXPECT_THROW(ApplyTransform("sum", ConfigNode::Map(), {Value::String("x")}),
               std::runtime_error);
  EXPECT_THROW(ApplyTransform("merge", ConfigNode::Map(), {Value::Int(1)}),
               std::runtime_error);
  EXPECT_THROW(ApplyTransform("copy", ConfigNode::Map(), {}),
               std::runtime_error);
  EXPECT_THROW(
      ApplyTransform("format",
                     ConfigNode::Map().Set("template", ConfigNode("${who}")),
                     {}),
      std::runtime_error);
}

TEST(Transforms, FormatSubstitutesVariables) {
  Variables vars{{"who", Value::String("world")}, {"n", Value::Int(3)}};
  auto out = ApplyTransform(
      "format",
      ConfigNode::Map().Set("template", ConfigNode("hello ${who} x${n}")), {},
      vars);
  EXPECT_EQ(out.ToString(), "hello world x3");
}

// ============================================================
// I. TemplateLibrary Tests
// ============================================================

TEST(TemplateLibrary, BuiltinsAreListed) {
  TemplateLibrary lib;
  std::set<std::string> names;
  for (const auto& t : lib.List()) names.insert(t.name);
  EXPECT_EQ(names, (std::set<std::string>{
                       "approval_gate", "conditional_review", "data_pipeline",
                       "fan_out_fan_in", "iterative_refinement",
                       "sequential"}));
  EXPECT_EQ(lib.List("development").size(), 2u);
  auto cats = lib.Categories();
  EXPECT_NE(std::find(cats.begin(), cats.end(), "data"), cats.end());
}

TEST(TemplateLibrary, UnknownTemplateThrows) {
  TemplateLibrary lib;
  try {
    lib.Instantiate("no_such_template");
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kTemplateNotFound);
  }
}

TEST(TemplateLibrary, MissingParameterThrows) {
  TemplateLibrary lib;
  try {
    lib.Instantiate("sequential", ConfigNode::Map());
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kMissingParameter);
  }
}

TEST(TemplateLibrary, DefaultsAreFilledIn) {
  TemplateLibrary lib;
  auto def = lib.Instantiate(
      "fan_out_fan_in",
      ConfigNode::Map().Set("tasks", ConfigNode::StringList({"a", "b"})));
  const Node* join = def->FindNode("fan_in");
  ASSERT_NE(join, nullptr);
  EXPECT_EQ(join->config["on_branch_failure"].ToString(), "tolerate_partial");
  EXPECT_TRUE(def->FindNode("task_2")->optional);

  auto strict = lib.Instantiate(
      "fan_out_fan_in",
      ConfigNode::Map()
          .Set("tasks", ConfigNode::StringList({"a"}))
          .Set("failure_tolerance", ConfigNode("none")));
  EXPECT_EQ(strict->FindNode("fan_in")->config["on_branch_failure"].ToString(),
            "fail_fast");
}

TEST(TemplateLibrary, CustomTemplateRegisters) {
  TemplateLibrary lib;
  WorkflowTemplate tmpl;
  tmpl.name = "ping";
  tmpl.category = "ops";
  tmpl.parameters = {{"target", true, ConfigNode(), "webhook target"}};
  tmpl.factory = [](const ConfigNode& p) {
    return WorkflowBuilder("ping", "Ping")
        .AddStart()
        .CallWebhook("ping", p["target"].ToString())
        .AddEnd()
        .Connect("start", "ping")
        .Connect("ping", "end")
        .Build();
  };
  lib.Register(tmpl);
  EXPECT_THROW(lib.Register(tmpl), std::runtime_error);
  auto def = lib.Instantiate(
      "ping", ConfigNode::Map().Set("target", ConfigNode("https://x/hook")));
  EXPECT_EQ(def->FindNode("ping")->config["target"].ToString(),
            "https://x/hook");
}

// ============================================================
// J. ExecutionStore Tests
// ============================================================

static Execution MakeExecution(const std::string& id, RunStatus status) {
  Execution e;
  e.id = id;
  e.status = status;
  e.started_at = std::chrono::system_clock::now();
  if (IsTerminal(status)) e.ended_at = e.started_at;
  return e;
}

TEST(ExecutionStore, CreateGetUpdate) {
  InMemoryExecutionStore store;
  store.Create(MakeExecution("r1", RunStatus::kRunning));
  EXPECT_THROW(store.Create(MakeExecution("r1", RunStatus::kRunning)),
               std::runtime_error);
  store.Update("r1", [](Execution& e) { e.variables["x"] = Value::Int(1); });
  auto got = store.Get("r1");
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->variables.at("x").As<int>(), 1);
  EXPECT_FALSE(store.Get("r2").has_value());
}

TEST(ExecutionStore, UnknownRunUpdateThrows) {
  InMemoryExecutionStore store;
  try {
    store.Update("ghost", [](Execution&) {});
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kUnknownRun);
  }
}

TEST(ExecutionStore, TerminalRunIsReadOnly) {
  InMemoryExecutionStore store;
  store.Create(MakeExecution("done", RunStatus::kSucceeded));
  EXPECT_THROW(store.Update("done", [](Execution&) {}), std::runtime_error);
}

TEST(ExecutionStore, PruneDropsOldTerminalRuns) {
  InMemoryExecutionStore store;
  store.Create(MakeExecution("old", RunStatus::kFailed));
  store.Create(MakeExecution("live", RunStatus::kRunning));
  size_t removed =
      store.Prune(std::chrono::system_clock::now() + std::chrono::seconds(1));
  EXPECT_EQ(removed, 1u);
  EXPECT_EQ(store.List(), (std::vector<std::string>{"live"}));
}

// ============================================================
// K. WorkflowEngine Tests
// ============================================================

class EngineTest : public ::testing::Test {
 protected:
  std::shared_ptr<ScriptedExecutor> executor_ =
      std::make_shared<ScriptedExecutor>();
  std::shared_ptr<ScriptedService> service_ =
      std::make_shared<ScriptedService>();
  std::unique_ptr<WorkflowEngine> engine_;

  void SetUp() override { engine_ = MakeEngine(4); }

  std::unique_ptr<WorkflowEngine> MakeEngine(size_t threads) {
    EngineOptions options;
    options.thread_pool_size = threads;
    options.log = silent;
    return std::make_unique<WorkflowEngine>(options, executor_, service_);
  }

  Execution RunToEnd(DefinitionPtr def, Variables vars = {}) {
    std::string id = engine_->Start(std::move(def), std::move(vars));
    auto status = engine_->WaitFor(id, std::chrono::seconds(5));
    EXPECT_TRUE(status.has_value()) << "run " << id << " did not finish";
    if (!status) engine_->Cancel(id, "test timeout");
    engine_->Wait(id);
    return *engine_->Inspect(id);
  }
};

TEST_F(EngineTest, GreetScenarioStoresOutput) {
  executor_->On("greet", [](const TaskRequest&) { return Value::String("hello"); });
  auto exec = RunToEnd(GreetFlow());
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("greet_output").ToString(), "hello");
  EXPECT_EQ(exec.State("greet").status, NodeStatus::kSucceeded);
  EXPECT_EQ(exec.State("greet").attempts, 1);
  EXPECT_EQ(exec.end_node, "end");
  EXPECT_TRUE(exec.ended_at.has_value());
  EXPECT_TRUE(exec.failures.empty());
}

TEST_F(EngineTest, ConditionRoutesOnSharedVariable) {
  auto def = WorkflowBuilder("route", "Route")
                 .AddStart()
                 .AddCondition("check")
                 .AddTransform("a", "set", {}, "path",
                               ConfigNode::Map().Set("value", ConfigNode("a")))
                 .AddTransform("b", "set", {}, "path",
                               ConfigNode::Map().Set("value", ConfigNode("b")))
                 .AddEnd()
                 .Connect("start", "check")
                 .Connect("check", "a", "x > 5")
                 .Connect("check", "b")
                 .Connect("a", "end")
                 .Connect("b", "end")
                 .Build();

  auto high = RunToEnd(def, {{"x", Value::Int(10)}});
  EXPECT_EQ(high.status, RunStatus::kSucceeded);
  EXPECT_EQ(high.variables.at("path").ToString(), "a");
  EXPECT_EQ(high.variables.at("check_branch").ToString(), "a");
  EXPECT_EQ(high.State("b").status, NodeStatus::kSkipped);

  auto low = RunToEnd(def, {{"x", Value::Int(2)}});
  EXPECT_EQ(low.status, RunStatus::kSucceeded);
  EXPECT_EQ(low.variables.at("path").ToString(), "b");
  EXPECT_EQ(low.State("a").status, NodeStatus::kSkipped);
}

TEST_F(EngineTest, ConditionWithoutMatchFails) {
  auto def = WorkflowBuilder("route", "Route")
                 .AddStart()
                 .AddCondition("check")
                 .AddEnd()
                 .Connect("start", "check")
                 .Connect("check", "end", "x > 5")
                 .Build();
  auto exec = RunToEnd(def, {{"x", Value::Int(1)}});
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kNoMatchingBranch);
  EXPECT_EQ(exec.failures[0].node_id, "check");
}

TEST_F(EngineTest, LoopBoundExceededAfterExactlyMaxIterations) {
  auto def = WorkflowBuilder("spin", "Spin")
                 .SetVariable("go", Value::Bool(true))
                 .AddStart()
                 .AddLoop("loop", "work", 3, "go == true")
                 .ExecuteAgent("work", "spin")
                 .AddEnd()
                 .Connect("start", "loop")
                 .Connect("loop", "work")
                 .Connect("loop", "end")
                 .ConnectBack("work", "loop")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kLoopBoundExceeded);
  EXPECT_EQ(exec.failures[0].node_id, "loop");
  EXPECT_EQ(executor_->Calls("work"), 3);
  EXPECT_EQ(exec.variables.at("loop_index").As<int>(), 2);
}

TEST_F(EngineTest, CountedLoopRunsBodyAndExits) {
  auto def = WorkflowBuilder("count", "Count")
                 .AddStart()
                 .AddLoop("loop", "inc", 5, "", 3)
                 .AddTransform("inc", "increment", {"counter"}, "counter")
                 .AddEnd()
                 .Connect("start", "loop")
                 .Connect("loop", "inc")
                 .Connect("loop", "end")
                 .ConnectBack("inc", "loop")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("counter").As<int>(), 3);
  EXPECT_EQ(exec.State("loop").output["iterations"].As<int>(), 3);
  EXPECT_EQ(exec.State("inc").iteration, 2);
}

// start -> outer -> inner -> tick (back to inner); inner -> bump (back to
// outer); outer -> end
static DefinitionPtr NestedLoopFlow() {
  return WorkflowBuilder("nested", "Nested")
      .AddStart()
      .AddLoop("outer", "inner", 5, "", 2)
      .AddLoop("inner", "tick", 5, "", 3)
      .AddTransform("tick", "increment", {"n"}, "n")
      .AddTransform("bump", "increment", {"m"}, "m")
      .AddEnd()
      .Connect("start", "outer")
      .Connect("outer", "inner")
      .Connect("outer", "end")
      .Connect("inner", "tick")
      .Connect("inner", "bump")
      .ConnectBack("tick", "inner")
      .ConnectBack("bump", "outer")
      .Build();
}

TEST(CompiledWorkflow, NestedLoopBodyContainsInnerBody) {
  auto wf = CompiledWorkflow::Compile(NestedLoopFlow());
  const auto& outer = wf->Nodes()[wf->IndexOf("outer")];
  for (const char* id : {"inner", "tick", "bump"}) {
    EXPECT_TRUE(outer.body.count(wf->IndexOf(id))) << id;
  }
  EXPECT_FALSE(outer.body.count(wf->IndexOf("end")));
  const auto& inner = wf->Nodes()[wf->IndexOf("inner")];
  EXPECT_EQ(inner.body, std::set<int>{wf->IndexOf("tick")});
}

TEST_F(EngineTest, NestedLoopsRerunInnerLoopEachOuterIteration) {
  auto exec = RunToEnd(NestedLoopFlow());
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("n").As<int>(), 6);
  EXPECT_EQ(exec.variables.at("m").As<int>(), 2);
  EXPECT_EQ(exec.State("outer").output["iterations"].As<int>(), 2);
  EXPECT_EQ(exec.State("inner").output["iterations"].As<int>(), 3);
  EXPECT_EQ(exec.end_node, "end");
}

TEST_F(EngineTest, LoopInsideParallelBranchFeedsJoin) {
  auto def = WorkflowBuilder("fan_loop", "Fan loop")
                 .AddStart()
                 .AddParallel("fan", "g")
                 .ExecuteAgent("side", "side work")
                 .AddLoop("loop", "inc", 5, "", 2)
                 .AddTransform("inc", "increment", {"counter"}, "counter")
                 .AddJoin("join", "g", "fail_fast")
                 .AddEnd()
                 .Connect("start", "fan")
                 .Connect("fan", "side")
                 .Connect("fan", "loop")
                 .Connect("loop", "inc")
                 .ConnectBack("inc", "loop")
                 .Connect("loop", "join")
                 .Connect("side", "join")
                 .Connect("join", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("counter").As<int>(), 2);
  EXPECT_EQ(exec.State("join").status, NodeStatus::kSucceeded);
  EXPECT_EQ(exec.State("join").output["arrived"].As<int>(), 2);
}

TEST_F(EngineTest, ConditionBreaksOutOfLoop) {
  auto def = WorkflowBuilder("break", "Break")
                 .AddStart()
                 .AddLoop("loop", "inc", 10, "", 10)
                 .AddTransform("inc", "increment", {"n"}, "n")
                 .AddCondition("check")
                 .AddTransform("cont", "increment", {"turns"}, "turns")
                 .AddTransform("brk", "set", {}, "exit",
                               ConfigNode::Map().Set("value", ConfigNode("broke")))
                 .AddEnd()
                 .Connect("start", "loop")
                 .Connect("loop", "inc")
                 .Connect("loop", "end")
                 .Connect("inc", "check")
                 .Connect("check", "cont", "n < 3")
                 .Connect("check", "brk")
                 .ConnectBack("cont", "loop")
                 .Connect("brk", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("n").As<int>(), 3);
  EXPECT_EQ(exec.variables.at("turns").As<int>(), 2);
  EXPECT_EQ(exec.variables.at("exit").ToString(), "broke");
  EXPECT_EQ(exec.State("loop").output["iterations"].As<int>(), 3);
  EXPECT_EQ(exec.State("brk").status, NodeStatus::kSucceeded);
  EXPECT_EQ(exec.State("cont").status, NodeStatus::kSkipped);
  EXPECT_EQ(exec.end_node, "end");
}

static DefinitionPtr ForEachFlow() {
  return WorkflowBuilder("each", "Each")
      .AddStart()
      .AddForEach("each", "gather", "items", 10, "item")
      .AddTransform("gather", "collect", {"item"}, "seen")
      .AddEnd()
      .Connect("start", "each")
      .Connect("each", "gather")
      .Connect("each", "end")
      .ConnectBack("gather", "each")
      .Build();
}

TEST_F(EngineTest, ForEachLoopBindsEachItem) {
  auto exec =
      RunToEnd(ForEachFlow(), {{"items", Value::StringList({"a", "b", "c"})}});
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  const Value& seen = exec.variables.at("seen");
  ASSERT_TRUE(seen.IsSequence());
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0].ToString(), "a");
  EXPECT_EQ(seen[2].ToString(), "c");
  EXPECT_EQ(exec.variables.at("item").ToString(), "c");
  EXPECT_EQ(exec.variables.at("each_index").As<int>(), 2);
  EXPECT_EQ(exec.State("each").output["iterations"].As<int>(), 3);
}

TEST_F(EngineTest, ForEachOverMissingOrScalarValue) {
  auto none = RunToEnd(ForEachFlow());
  EXPECT_EQ(none.status, RunStatus::kSucceeded);
  EXPECT_EQ(none.State("each").output["iterations"].As<int>(), 0);
  EXPECT_EQ(none.State("gather").status, NodeStatus::kSkipped);

  auto one = RunToEnd(ForEachFlow(), {{"items", Value::String("solo")}});
  EXPECT_EQ(one.status, RunStatus::kSucceeded);
  ASSERT_EQ(one.variables.at("seen").size(), 1u);
  EXPECT_EQ(one.variables.at("seen")[0].ToString(), "solo");
}

TEST_F(EngineTest, ForEachStillHonoursMaxIterations) {
  auto def = WorkflowBuilder("each", "Each")
                 .AddStart()
                 .AddForEach("each", "gather", "items", 2)
                 .AddTransform("gather", "collect", {"each_item"}, "seen")
                 .AddEnd()
                 .Connect("start", "each")
                 .Connect("each", "gather")
                 .Connect("each", "end")
                 .ConnectBack("gather", "each")
                 .Build();
  auto exec = RunToEnd(def, {{"items", Value::StringList({"a", "b", "c"})}});
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kLoopBoundExceeded);
  EXPECT_EQ(exec.variables.at("seen").size(), 2u);
}

TEST_F(EngineTest, RetrySucceedsOnThirdAttempt) {
  std::atomic<int> failures{0};
  executor_->On("flaky", [&failures](const TaskRequest& req) {
    if (failures.fetch_add(1) < 2) {
      throw std::runtime_error("transient " + std::to_string(req.attempt));
    }
    return Value::String("ok");
  });
  auto def = WorkflowBuilder("retry", "Retry")
                 .AddStart()
                 .ExecuteAgent("flaky", "try")
                 .WithRetry({3, Backoff::kFixed, 5})
                 .AddEnd()
                 .Connect("start", "flaky")
                 .Connect("flaky", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.State("flaky").status, NodeStatus::kSucceeded);
  EXPECT_EQ(exec.State("flaky").attempts, 3);
}

TEST_F(EngineTest, RetryExhaustionFailsRun) {
  executor_->On("broken", [](const TaskRequest&) -> Value {
    throw std::runtime_error("always down");
  });
  auto def = WorkflowBuilder("retry", "Retry")
                 .AddStart()
                 .ExecuteAgent("broken", "try")
                 .WithRetry({2, Backoff::kNone})
                 .AddEnd()
                 .Connect("start", "broken")
                 .Connect("broken", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  EXPECT_EQ(exec.State("broken").attempts, 2);
  ASSERT_TRUE(exec.State("broken").last_error.has_value());
  EXPECT_EQ(exec.State("broken").last_error->kind, ErrorKind::kExecutorFailure);
  EXPECT_EQ(exec.State("end").status, NodeStatus::kPending);
}

TEST_F(EngineTest, ParallelJoinWaitsForAllBranches) {
  for (auto [node, ms] : std::vector<std::pair<std::string, int>>{
           {"a", 5}, {"b", 20}, {"c", 40}}) {
    int delay = ms;
    executor_->On(node, [delay](const TaskRequest& req) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
      return Value::String(req.node_id);
    });
  }
  auto def = WorkflowBuilder("fan", "Fan")
                 .AddStart()
                 .AddParallel("fan", "g")
                 .ExecuteAgent("a", "a")
                 .ExecuteAgent("b", "b")
                 .ExecuteAgent("c", "c")
                 .AddJoin("join", "g", "fail_fast")
                 .AddEnd()
                 .Connect("start", "fan")
                 .Connect("fan", "a")
                 .Connect("fan", "b")
                 .Connect("fan", "c")
                 .Connect("a", "join")
                 .Connect("b", "join")
                 .Connect("c", "join")
                 .Connect("join", "end")
                 .Build();
  EventLog log;
  engine_->Subscribe(log.Observe());
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  int join_done = log.IndexOf("join", "SUCCEEDED");
  ASSERT_GE(join_done, 0);
  for (const char* branch : {"a", "b", "c"}) {
    int done = log.IndexOf(branch, "SUCCEEDED");
    ASSERT_GE(done, 0) << branch;
    EXPECT_LT(done, join_done) << branch;
  }
  EXPECT_EQ(exec.State("join").output["arrived"].As<int>(), 3);
}

static DefinitionPtr JoinWithFailingBranch(const std::string& policy) {
  return WorkflowBuilder("join_" + policy, "Join")
      .AddStart()
      .AddParallel("fan", "g")
      .ExecuteAgent("ok", "fine")
      .ExecuteAgent("bad", "breaks")
      .Optional()
      .AddJoin("join", "g", policy)
      .AddEnd()
      .Connect("start", "fan")
      .Connect("fan", "ok")
      .Connect("fan", "bad")
      .Connect("ok", "join")
      .Connect("bad", "join")
      .Connect("join", "end")
      .Build();
}

TEST_F(EngineTest, FailFastJoinFailsOnBranchFailure) {
  executor_->On("bad", [](const TaskRequest&) -> Value {
    throw std::runtime_error("nope");
  });
  auto exec = RunToEnd(JoinWithFailingBranch("fail_fast"));
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kJoinedBranchFailed);
  EXPECT_EQ(exec.failures[0].node_id, "join");
  EXPECT_EQ(exec.State("bad").status, NodeStatus::kFailed);
}

TEST_F(EngineTest, TolerantJoinProceedsWithPartialResults) {
  executor_->On("bad", [](const TaskRequest&) -> Value {
    throw std::runtime_error("nope");
  });
  auto exec = RunToEnd(JoinWithFailingBranch("tolerate_partial"));
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.State("join").output["arrived"].As<int>(), 1);
  EXPECT_EQ(exec.State("join").output["failed"].As<int>(), 1);
  EXPECT_EQ(exec.State("bad").status, NodeStatus::kFailed);
  EXPECT_NE(exec.variables.at("bad_error").ToString().find("nope"),
            std::string::npos);
  EXPECT_TRUE(exec.failures.empty());
}

TEST_F(EngineTest, OptionalFailureTakesFallbackEdge) {
  service_->On("fetch", [](const ServiceRequest&) -> Value {
    throw std::runtime_error("503");
  });
  auto def =
      WorkflowBuilder("fallback", "Fallback")
          .AddStart()
          .CallWebhook("fetch", "https://example.invalid/hook")
          .Optional()
          .AddTransform("use", "copy", {"fetch_output"}, "result")
          .AddTransform("fallback", "set", {}, "result",
                        ConfigNode::Map().Set("value", ConfigNode("cached")))
          .AddEnd()
          .Connect("start", "fetch")
          .Connect("fetch", "use", "fetch_error not_exists")
          .Connect("fetch", "fallback", "fetch_error exists")
          .Connect("use", "end")
          .Connect("fallback", "end")
          .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.State("fetch").status, NodeStatus::kFailed);
  EXPECT_EQ(exec.State("use").status, NodeStatus::kSkipped);
  EXPECT_EQ(exec.State("fallback").status, NodeStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("result").ToString(), "cached");
}

TEST_F(EngineTest, ServiceCallGetsMappedPayload) {
  service_->On("lookup", [](const ServiceRequest& req) {
    return Value::Map().Set("echo", req.payload);
  });
  auto def =
      WorkflowBuilder("svc", "Service")
          .AddStart()
          .CallMcp("lookup", "mcp://search",
                   ConfigNode::Map().Set("limit", ConfigNode::Int(5)))
          .WithConfig("input_mapping",
                      ConfigNode::Map().Set("query", ConfigNode("topic")))
          .AddEnd()
          .Connect("start", "lookup")
          .Connect("lookup", "end")
          .Build();
  auto exec = RunToEnd(def, {{"topic", Value::String("cats")}});
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  auto requests = service_->Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].kind, NodeKind::kMcpCall);
  EXPECT_EQ(requests[0].target, "mcp://search");
  EXPECT_EQ(requests[0].payload["query"].ToString(), "cats");
  EXPECT_EQ(requests[0].payload["limit"].As<int>(), 5);
  EXPECT_EQ(exec.variables.at("lookup_output")["echo"]["query"].ToString(),
            "cats");
}

TEST_F(EngineTest, AgentOutputMappingWritesVariables) {
  executor_->On("score", [](const TaskRequest&) {
    return Value::Map()
        .Set("reply", Value::String("fine"))
        .Set("score", Value::Int(9));
  });
  auto def = WorkflowBuilder("map", "Map")
                 .AddStart()
                 .ExecuteAgent("score", "rate it")
                 .WithConfig("output_mapping",
                             ConfigNode::Map().Set("score", ConfigNode("quality")))
                 .AddEnd()
                 .Connect("start", "score")
                 .Connect("score", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.variables.at("quality").As<int>(), 9);
  EXPECT_EQ(exec.variables.at("score_output")["reply"].ToString(), "fine");
}

TEST_F(EngineTest, CancelWhileAwaitingApproval) {
  std::string id = engine_->Start(ApprovalFlow());
  ASSERT_TRUE(WaitUntil([&] { return !engine_->PendingApprovals().empty(); }));
  EXPECT_EQ(engine_->Inspect(id)->State("approval").status,
            NodeStatus::kAwaitingApproval);

  EXPECT_TRUE(engine_->Cancel(id, "operator abort"));
  EXPECT_EQ(engine_->Wait(id), RunStatus::kCancelled);
  auto exec = *engine_->Inspect(id);
  EXPECT_EQ(exec.status, RunStatus::kCancelled);
  EXPECT_EQ(exec.State("approval").status, NodeStatus::kCancelled);
  EXPECT_EQ(exec.cancel_reason, "operator abort");
  EXPECT_TRUE(engine_->PendingApprovals().empty());
  EXPECT_FALSE(engine_->Cancel(id));
}

TEST_F(EngineTest, PausedRunDispatchesNothingUntilResumed) {
  std::atomic<bool> release{false};
  executor_->On("slow", [&release](const TaskRequest&) {
    while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(2));
    return Value::String("slow done");
  });
  auto def = WorkflowBuilder("pausable", "Pausable")
                 .AddStart()
                 .ExecuteAgent("slow", "block")
                 .ExecuteAgent("after", "follow up")
                 .AddEnd()
                 .Connect("start", "slow")
                 .Connect("slow", "after")
                 .Connect("after", "end")
                 .Build();
  std::string id = engine_->Start(def);
  ASSERT_TRUE(WaitUntil([&] { return executor_->Calls("slow") == 1; }));

  EXPECT_TRUE(engine_->Pause(id));
  EXPECT_FALSE(engine_->Pause(id));
  release = true;

  // The in-flight call lands; its successor waits.
  EXPECT_TRUE(WaitUntil([&] {
    return engine_->Inspect(id)->State("after").status == NodeStatus::kReady;
  }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto paused = *engine_->Inspect(id);
  EXPECT_EQ(paused.status, RunStatus::kPaused);
  EXPECT_EQ(paused.State("slow").status, NodeStatus::kSucceeded);
  EXPECT_EQ(executor_->Calls("after"), 0);

  EXPECT_TRUE(engine_->Resume(id));
  EXPECT_EQ(engine_->Wait(id), RunStatus::kSucceeded);
  EXPECT_EQ(executor_->Calls("after"), 1);
  EXPECT_FALSE(engine_->Resume(id));
}

TEST_F(EngineTest, CancelPausedRun) {
  std::string id = engine_->Start(ApprovalFlow());
  ASSERT_TRUE(WaitUntil([&] { return !engine_->PendingApprovals().empty(); }));
  EXPECT_TRUE(engine_->Pause(id));
  EXPECT_EQ(engine_->Inspect(id)->status, RunStatus::kPaused);
  EXPECT_TRUE(engine_->Cancel(id, "stop"));
  EXPECT_EQ(engine_->Wait(id), RunStatus::kCancelled);
  EXPECT_FALSE(engine_->Resume(id));
}

TEST_F(EngineTest, ApproveAndReject) {
  std::string approved = engine_->Start(ApprovalFlow());
  std::string rejected = engine_->Start(ApprovalFlow());
  ASSERT_TRUE(
      WaitUntil([&] { return engine_->PendingApprovals().size() == 2u; }));

  EXPECT_FALSE(engine_->Approve(approved, "start"));
  EXPECT_TRUE(engine_->Approve(approved, "approval"));
  EXPECT_TRUE(engine_->Reject(rejected, "approval", "not today"));

  EXPECT_EQ(engine_->Wait(approved), RunStatus::kSucceeded);
  EXPECT_TRUE(engine_->Inspect(approved)->variables.at("approval_approved")
                  .As<bool>());

  EXPECT_EQ(engine_->Wait(rejected), RunStatus::kFailed);
  auto exec = *engine_->Inspect(rejected);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kApprovalRejected);
  EXPECT_EQ(exec.failures[0].message, "not today");
}

TEST_F(EngineTest, ApprovalTimeoutAppliesDefaultAction) {
  auto approve = RunToEnd(ApprovalFlow(20, "approve"));
  EXPECT_EQ(approve.status, RunStatus::kSucceeded);

  auto reject = RunToEnd(ApprovalFlow(20, "reject"));
  EXPECT_EQ(reject.status, RunStatus::kFailed);
  ASSERT_EQ(reject.failures.size(), 1u);
  EXPECT_EQ(reject.failures[0].kind, ErrorKind::kApprovalRejected);
}

TEST_F(EngineTest, ObserverMayApproveFromCallback) {
  WorkflowEngine* engine = engine_.get();
  engine_->Subscribe([engine](const TransitionEvent& e) {
    if (e.to == "AWAITING_APPROVAL") engine->Approve(e.run_id, e.node_id);
  });
  auto exec = RunToEnd(ApprovalFlow());
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
}

TEST_F(EngineTest, ObserversReceiveEveryTransition) {
  EventLog log;
  int sub = engine_->Subscribe(log.Observe());
  auto exec = RunToEnd(GreetFlow());
  ASSERT_EQ(exec.status, RunStatus::kSucceeded);

  auto events = log.Events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().node_id, "");
  EXPECT_EQ(events.front().from, "PENDING");
  EXPECT_EQ(events.front().to, "RUNNING");
  EXPECT_EQ(events.back().node_id, "");
  EXPECT_EQ(events.back().to, "SUCCEEDED");

  std::vector<std::string> greet;
  for (const auto& e : events) {
    EXPECT_EQ(e.run_id, exec.id);
    if (e.node_id == "greet") greet.push_back(e.from + ">" + e.to);
  }
  EXPECT_EQ(greet, (std::vector<std::string>{"PENDING>READY", "READY>RUNNING",
                                             "RUNNING>SUCCEEDED"}));

  engine_->Unsubscribe(sub);
  size_t seen = log.Events().size();
  RunToEnd(GreetFlow());
  EXPECT_EQ(log.Events().size(), seen);
}

TEST_F(EngineTest, DelayDoesNotHoldAWorker) {
  engine_ = MakeEngine(1);
  std::atomic<int64_t> work_at_ms{-1};
  auto t0 = std::chrono::steady_clock::now();
  executor_->On("work", [&work_at_ms, t0](const TaskRequest&) {
    work_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - t0)
                     .count();
    return Value::String("done");
  });
  auto def = WorkflowBuilder("delay", "Delay")
                 .AddStart()
                 .AddParallel("fan", "g")
                 .AddDelay("wait", 200)
                 .ExecuteAgent("work", "quick")
                 .AddJoin("join", "g", "fail_fast")
                 .AddEnd()
                 .Connect("start", "fan")
                 .Connect("fan", "wait")
                 .Connect("fan", "work")
                 .Connect("wait", "join")
                 .Connect("work", "join")
                 .Connect("join", "end")
                 .Build();
  auto exec = RunToEnd(def);
  auto total = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - t0)
                   .count();
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_GE(work_at_ms.load(), 0);
  EXPECT_LT(work_at_ms.load(), 150);
  EXPECT_GE(total, 190);
}

TEST_F(EngineTest, RunTimeoutFailsRun) {
  auto def = WorkflowBuilder("slow", "Slow")
                 .SetTimeout(50)
                 .AddStart()
                 .AddHumanApproval("approval")
                 .AddEnd()
                 .Connect("start", "approval")
                 .Connect("approval", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kTimeoutExceeded);
  EXPECT_EQ(exec.failures[0].node_id, "");
  EXPECT_EQ(exec.State("approval").status, NodeStatus::kCancelled);
}

TEST_F(EngineTest, NodeTimeoutCancelsAttempt) {
  std::atomic<bool> saw_cancel{false};
  executor_->On("stuck", [&saw_cancel](const TaskRequest& req) -> Value {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
      if (req.cancel->IsCancelled()) {
        saw_cancel = true;
        throw std::runtime_error("cancelled");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return Value::String("too late");
  });
  auto def = WorkflowBuilder("stuck", "Stuck")
                 .AddStart()
                 .ExecuteAgent("stuck", "hang")
                 .WithTimeout(30)
                 .AddEnd()
                 .Connect("start", "stuck")
                 .Connect("stuck", "end")
                 .Build();
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kFailed);
  ASSERT_EQ(exec.failures.size(), 1u);
  EXPECT_EQ(exec.failures[0].kind, ErrorKind::kTimeoutExceeded);
  EXPECT_EQ(exec.State("stuck").attempts, 1);
  EXPECT_TRUE(WaitUntil([&] { return saw_cancel.load(); }));
}

TEST_F(EngineTest, MissingExecutorFailsAgentNode) {
  EngineOptions options;
  options.thread_pool_size = 2;
  options.log = silent;
  WorkflowEngine bare(options);
  std::string id = bare.Start(GreetFlow());
  EXPECT_EQ(bare.Wait(id), RunStatus::kFailed);
  EXPECT_EQ(bare.Inspect(id)->failures.at(0).kind, ErrorKind::kExecutorFailure);
}

TEST_F(EngineTest, InvalidDefinitionIsRejectedAtStart) {
  auto bad = std::make_shared<WorkflowDefinition>(
      "bad", "Bad", "",
      std::vector<Node>{MakeNode("end", NodeKind::kEnd)}, std::vector<Edge>{});
  try {
    engine_->Start(bad);
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidDefinition);
    EXPECT_FALSE(e.violations().empty());
  }
  EXPECT_TRUE(engine_->ListRuns().empty());
}

TEST_F(EngineTest, RegistryByName) {
  engine_->RegisterWorkflow("greet", GreetFlow());
  EXPECT_THROW(engine_->RegisterWorkflow("greet", GreetFlow()),
               std::runtime_error);
  EXPECT_THROW(engine_->ReplaceWorkflow("other", GreetFlow()),
               std::runtime_error);
  EXPECT_NO_THROW(engine_->ReplaceWorkflow("greet", GreetFlow()));
  EXPECT_TRUE(engine_->HasWorkflow("greet"));
  EXPECT_EQ(engine_->ListWorkflows(), (std::vector<std::string>{"greet"}));
  EXPECT_THROW(engine_->Start(std::string("other")), std::runtime_error);

  std::string id = engine_->Start(std::string("greet"));
  EXPECT_EQ(engine_->Wait(id), RunStatus::kSucceeded);
  EXPECT_EQ(engine_->Inspect(id)->workflow_id, "greet_flow");
}

TEST_F(EngineTest, UnknownRunThrows) {
  try {
    engine_->Wait("run-404");
    FAIL() << "expected FlowError";
  } catch (const FlowError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kUnknownRun);
  }
  EXPECT_FALSE(engine_->Inspect("run-404").has_value());
}

TEST_F(EngineTest, FinishedRunIsReadOnlyAndPrunable) {
  auto exec = RunToEnd(GreetFlow());
  EXPECT_THROW(engine_->Store().Update(exec.id, [](Execution&) {}),
               std::runtime_error);

  auto metrics = engine_->Metrics();
  EXPECT_GE(metrics[NodeKind::kAgentExecute].count, 1);
  EXPECT_GE(metrics[NodeKind::kStart].count, 1);

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  EXPECT_EQ(engine_->Prune(std::chrono::milliseconds(0)), 1u);
  EXPECT_FALSE(engine_->Inspect(exec.id).has_value());
  EXPECT_THROW(engine_->Wait(exec.id), FlowError);
}

// ============================================================
// L. Templates End-to-End
// ============================================================

TEST_F(EngineTest, SequentialTemplateRunsStepsInOrder) {
  TemplateLibrary lib;
  auto def = lib.Instantiate(
      "sequential",
      ConfigNode::Map().Set("steps", ConfigNode::StringList({"plan", "build"})));
  EventLog log;
  engine_->Subscribe(log.Observe());
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("step_2_output").ToString(), "step_2 done");
  EXPECT_LT(log.IndexOf("step_1", "SUCCEEDED"), log.IndexOf("step_2", "RUNNING"));
}

TEST_F(EngineTest, FanOutTemplateToleratesFailedTask) {
  executor_->On("task_2", [](const TaskRequest&) -> Value {
    throw std::runtime_error("task 2 broke");
  });
  TemplateLibrary lib;
  auto def = lib.Instantiate(
      "fan_out_fan_in",
      ConfigNode::Map().Set("tasks", ConfigNode::StringList({"a", "b", "c"})));
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  ASSERT_TRUE(exec.variables.at("results").IsSequence());
  EXPECT_EQ(exec.variables.at("results").size(), 2u);
}

TEST_F(EngineTest, IterativeRefinementTemplateCollectsHistory) {
  TemplateLibrary lib;
  auto def = lib.Instantiate(
      "iterative_refinement",
      ConfigNode::Map()
          .Set("task", ConfigNode("polish"))
          .Set("max_iterations", ConfigNode::Int(3)));
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(executor_->Calls("refine"), 3);
  EXPECT_EQ(exec.variables.at("history").size(), 3u);
}

TEST_F(EngineTest, ConditionalReviewTemplateRoutesOnScore) {
  executor_->On("work", [](const TaskRequest&) { return Value::Int(8); });
  TemplateLibrary lib;
  auto def = lib.Instantiate("conditional_review",
                             ConfigNode::Map()
                                 .Set("task", ConfigNode("write"))
                                 .Set("variable", ConfigNode("work_output"))
                                 .Set("threshold", ConfigNode::Int(7)));
  auto exec = RunToEnd(def);
  EXPECT_EQ(exec.status, RunStatus::kSucceeded);
  EXPECT_EQ(exec.variables.at("review_status").ToString(), "accepted");
  EXPECT_EQ(exec.State("revise").status, NodeStatus::kSkipped);
}
