#include <httplib.h>

#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "../example/agents.hpp"
#include "../example/loader.hpp"

using json = nlohmann::json;
using namespace miniflow;

static std::string ParseArg(int argc, char** argv, const std::string& flag,
                            const std::string& default_val) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (flag == argv[i]) return argv[i + 1];
  }
  return default_val;
}

static int64_t EpochMs(std::chrono::system_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

static void Reply(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void ReplyError(httplib::Response& res, int status,
                       const std::string& message) {
  Reply(res, status, json{{"error", message}});
}

static int StatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTemplateNotFound:
    case ErrorKind::kUnknownRun:
      return 404;
    case ErrorKind::kInvalidDefinition:
    case ErrorKind::kMissingParameter:
      return 400;
    default:
      return 500;
  }
}

static void ReplyFlowError(httplib::Response& res, const FlowError& e) {
  json body{{"error", e.what()}, {"kind", ToString(e.kind())}};
  if (!e.violations().empty()) {
    json violations = json::array();
    for (const auto& v : e.violations()) {
      violations.push_back(json{{"element", v.element}, {"message", v.message}});
    }
    body["violations"] = violations;
  }
  Reply(res, StatusFor(e.kind()), body);
}

// Empty bodies parse as an empty object.
static bool ParseBody(const httplib::Request& req, httplib::Response& res,
                      json* body) {
  if (req.body.empty()) {
    *body = json::object();
    return true;
  }
  try {
    *body = json::parse(req.body);
  } catch (const std::exception& e) {
    ReplyError(res, 400, std::string("Invalid JSON: ") + e.what());
    return false;
  }
  if (!body->is_object()) {
    ReplyError(res, 400, "Request body must be a JSON object");
    return false;
  }
  return true;
}

static json ExecutionToJson(const Execution& exec) {
  json nodes = json::object();
  for (const auto& [id, st] : exec.nodes) {
    json n{{"status", ToString(st.status)},
           {"attempts", st.attempts},
           {"iteration", st.iteration},
           {"duration_us", st.duration_us},
           {"output", ToJsonValue(st.output)}};
    if (st.last_error) {
      n["error"] = json{{"kind", ToString(st.last_error->kind)},
                        {"message", st.last_error->message}};
    }
    nodes[id] = n;
  }
  json variables = json::object();
  for (const auto& [k, v] : exec.variables) variables[k] = ToJsonValue(v);
  json failures = json::array();
  for (const auto& f : exec.failures) {
    failures.push_back(json{{"node", f.node_id},
                            {"kind", ToString(f.kind)},
                            {"message", f.message}});
  }
  json out{{"id", exec.id},
           {"workflow_id", exec.workflow_id},
           {"workflow_name", exec.workflow_name},
           {"status", ToString(exec.status)},
           {"started_at_ms", EpochMs(exec.started_at)},
           {"variables", variables},
           {"nodes", nodes},
           {"failures", failures}};
  if (exec.ended_at) out["ended_at_ms"] = EpochMs(*exec.ended_at);
  if (!exec.end_node.empty()) out["end_node"] = exec.end_node;
  if (!exec.cancel_reason.empty()) out["cancel_reason"] = exec.cancel_reason;
  return out;
}

static json TemplateToJson(const WorkflowTemplate& t) {
  json params = json::array();
  for (const auto& p : t.parameters) {
    json jp{{"name", p.name},
            {"required", p.required},
            {"description", p.description}};
    if (!p.default_value.IsNull()) jp["default"] = ToJsonValue(p.default_value);
    params.push_back(jp);
  }
  return json{{"name", t.name},
              {"category", t.category},
              {"description", t.description},
              {"parameters", params}};
}

int main(int argc, char** argv) {
  std::string config_path =
      ParseArg(argc, argv, "--config", "example/example_conf.json");

  // 1. Parse config & register workflows
  Loader::AppConfig app_config;
  try {
    app_config = Loader::ParseAppConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Error loading config: " << e.what() << std::endl;
    return 1;
  }
  std::string host = ParseArg(argc, argv, "--host", app_config.host);
  int port =
      std::stoi(ParseArg(argc, argv, "--port", std::to_string(app_config.port)));

  EngineOptions options;
  if (app_config.thread_pool_size > 0) {
    options.thread_pool_size = static_cast<size_t>(app_config.thread_pool_size);
  }
  options.log = StderrLogger(LogLevel::kInfo);
  WorkflowEngine engine(options, std::make_shared<SimulatedAgents>(),
                        std::make_shared<SimulatedService>());
  TemplateLibrary library;

  for (const auto& wf_conf : app_config.workflows) {
    try {
      std::cout << "Registering workflow: " << wf_conf.name << std::endl;
      engine.RegisterWorkflow(wf_conf.name, wf_conf.definition);
    } catch (const std::exception& e) {
      std::cerr << "Failed to register workflow '" << wf_conf.name
                << "': " << e.what() << std::endl;
      return 1;
    }
  }

  // 2. Set up HTTP server
  httplib::Server svr;

  // Health check
  svr.Get("/api/v1/health",
          [](const httplib::Request&, httplib::Response& res) {
            Reply(res, 200, json{{"status", "ok"}});
          });

  // ---- workflows ----

  svr.Get("/api/v1/workflows",
          [&engine](const httplib::Request&, httplib::Response& res) {
            Reply(res, 200, json{{"workflows", engine.ListWorkflows()}});
          });

  svr.Get(R"(/api/v1/workflows/([^/]+))",
          [&engine](const httplib::Request& req, httplib::Response& res) {
            std::string name = req.matches[1];
            if (!engine.HasWorkflow(name)) {
              ReplyError(res, 404, "Unknown workflow: " + name);
              return;
            }
            Reply(res, 200, ToJsonValue(ToTree(*engine.Workflow(name))));
          });

  // POST registers a new name, PUT replaces an existing one.
  auto store_workflow = [&engine](bool replace) {
    return [&engine, replace](const httplib::Request& req,
                              httplib::Response& res) {
      std::string name = req.matches[1];
      if (replace != engine.HasWorkflow(name)) {
        ReplyError(res, replace ? 404 : 409,
                   (replace ? "Unknown workflow: " : "Workflow exists: ") + name);
        return;
      }
      json body;
      if (!ParseBody(req, res, &body)) return;
      try {
        auto def = FromTree(ConvertJson(body));
        if (replace) {
          engine.ReplaceWorkflow(name, def);
        } else {
          engine.RegisterWorkflow(name, def);
        }
        Reply(res, replace ? 200 : 201, json{{"workflow", name}});
      } catch (const FlowError& e) {
        ReplyFlowError(res, e);
      } catch (const std::exception& e) {
        ReplyError(res, 409, e.what());
      }
    };
  };
  svr.Post(R"(/api/v1/workflows/([^/]+))", store_workflow(false));
  svr.Put(R"(/api/v1/workflows/([^/]+))", store_workflow(true));

  // ---- templates ----

  svr.Get("/api/v1/templates",
          [&library](const httplib::Request& req, httplib::Response& res) {
            auto list = req.has_param("category")
                            ? library.List(req.get_param_value("category"))
                            : library.List();
            json arr = json::array();
            for (const auto& t : list) arr.push_back(TemplateToJson(t));
            Reply(res, 200,
                  json{{"templates", arr}, {"categories", library.Categories()}});
          });

  // Body: {"parameters": {...}, "register_as": "name"}
  svr.Post(R"(/api/v1/templates/([^/]+)/instantiate)",
           [&engine, &library](const httplib::Request& req,
                               httplib::Response& res) {
             std::string name = req.matches[1];
             json body;
             if (!ParseBody(req, res, &body)) return;
             try {
               ConfigNode params = body.contains("parameters")
                                       ? ConvertJson(body["parameters"])
                                       : ConfigNode::Map();
               auto def = library.Instantiate(name, params);
               json out{{"definition", ToJsonValue(ToTree(*def))}};
               if (body.contains("register_as")) {
                 std::string as = body["register_as"].get<std::string>();
                 engine.RegisterWorkflow(as, def);
                 out["workflow"] = as;
               }
               Reply(res, 201, out);
             } catch (const FlowError& e) {
               ReplyFlowError(res, e);
             } catch (const std::exception& e) {
               ReplyError(res, 409, e.what());
             }
           });

  // ---- runs ----

  // Body: {"variables": {...}, "wait_ms": 0}. With wait_ms the reply holds
  // the execution if it finished in time.
  svr.Post(R"(/api/v1/workflows/([^/]+)/runs)",
           [&engine](const httplib::Request& req, httplib::Response& res) {
             std::string name = req.matches[1];
             if (!engine.HasWorkflow(name)) {
               ReplyError(res, 404, "Unknown workflow: " + name);
               return;
             }
             json body;
             if (!ParseBody(req, res, &body)) return;
             Variables vars;
             if (body.contains("variables")) {
               if (!body["variables"].is_object()) {
                 ReplyError(res, 400, "'variables' must be an object");
                 return;
               }
               for (const auto& [k, v] : ConvertJson(body["variables"]).Entries()) {
                 vars[k] = v;
               }
             }
             int wait_ms = body.value("wait_ms", 0);
             try {
               std::string run_id = engine.Start(name, vars);
               if (wait_ms > 0) {
                 engine.WaitFor(run_id, std::chrono::milliseconds(wait_ms));
               }
               auto exec = engine.Inspect(run_id);
               Reply(res, 201, exec ? ExecutionToJson(*exec)
                                    : json{{"id", run_id}});
             } catch (const FlowError& e) {
               ReplyFlowError(res, e);
             } catch (const std::exception& e) {
               ReplyError(res, 500, e.what());
             }
           });

  svr.Get("/api/v1/runs",
          [&engine](const httplib::Request&, httplib::Response& res) {
            json runs = json::array();
            for (const auto& id : engine.ListRuns()) {
              if (auto exec = engine.Inspect(id)) {
                runs.push_back(json{{"id", id},
                                    {"workflow_id", exec->workflow_id},
                                    {"status", ToString(exec->status)}});
              }
            }
            Reply(res, 200, json{{"runs", runs}});
          });

  svr.Get(R"(/api/v1/runs/([^/]+))",
          [&engine](const httplib::Request& req, httplib::Response& res) {
            std::string run_id = req.matches[1];
            auto exec = engine.Inspect(run_id);
            if (!exec) {
              ReplyError(res, 404, "Unknown run: " + run_id);
              return;
            }
            Reply(res, 200, ExecutionToJson(*exec));
          });

  svr.Post(R"(/api/v1/runs/([^/]+)/cancel)",
           [&engine](const httplib::Request& req, httplib::Response& res) {
             std::string run_id = req.matches[1];
             json body;
             if (!ParseBody(req, res, &body)) return;
             try {
               bool cancelled =
                   engine.Cancel(run_id, body.value("reason", std::string()));
               Reply(res, cancelled ? 200 : 409,
                     json{{"run", run_id}, {"cancelled", cancelled}});
             } catch (const FlowError& e) {
               ReplyFlowError(res, e);
             }
           });

  auto toggle = [&engine](bool pause) {
    return [&engine, pause](const httplib::Request& req,
                            httplib::Response& res) {
      std::string run_id = req.matches[1];
      try {
        bool done = pause ? engine.Pause(run_id) : engine.Resume(run_id);
        if (!done) {
          ReplyError(res, 409, std::string("Run '") + run_id + "' is not " +
                                   (pause ? "running" : "paused"));
          return;
        }
        Reply(res, 200, json{{"run", run_id},
                             {"status", pause ? "PAUSED" : "RUNNING"}});
      } catch (const FlowError& e) {
        ReplyFlowError(res, e);
      }
    };
  };
  svr.Post(R"(/api/v1/runs/([^/]+)/pause)", toggle(true));
  svr.Post(R"(/api/v1/runs/([^/]+)/resume)", toggle(false));

  auto decide = [&engine](bool approve) {
    return [&engine, approve](const httplib::Request& req,
                              httplib::Response& res) {
      std::string run_id = req.matches[1];
      std::string node_id = req.matches[2];
      json body;
      if (!ParseBody(req, res, &body)) return;
      try {
        bool done = approve ? engine.Approve(run_id, node_id)
                            : engine.Reject(run_id, node_id,
                                            body.value("reason", std::string()));
        if (!done) {
          ReplyError(res, 409, "Node '" + node_id + "' is not awaiting approval");
          return;
        }
        Reply(res, 200, json{{"run", run_id},
                             {"node", node_id},
                             {"decision", approve ? "approved" : "rejected"}});
      } catch (const FlowError& e) {
        ReplyFlowError(res, e);
      }
    };
  };
  svr.Post(R"(/api/v1/runs/([^/]+)/nodes/([^/]+)/approve)", decide(true));
  svr.Post(R"(/api/v1/runs/([^/]+)/nodes/([^/]+)/reject)", decide(false));

  svr.Get("/api/v1/approvals",
          [&engine](const httplib::Request&, httplib::Response& res) {
            json arr = json::array();
            for (const auto& p : engine.PendingApprovals()) {
              arr.push_back(json{{"run", p.run_id},
                                 {"node", p.node_id},
                                 {"message", p.message},
                                 {"since_ms", EpochMs(p.since)}});
            }
            Reply(res, 200, json{{"approvals", arr}});
          });

  svr.Get("/api/v1/metrics",
          [&engine](const httplib::Request&, httplib::Response& res) {
            json out = json::object();
            for (const auto& [kind, m] : engine.Metrics()) {
              out[ToString(kind)] = json{{"count", m.count},
                                         {"avg_us", m.AverageUs()},
                                         {"max_us", m.max_us}};
            }
            Reply(res, 200, json{{"metrics", out}});
          });

  std::cout << "mini_flow_server listening on " << host << ":" << port
            << std::endl;
  svr.listen(host, port);
  return 0;
}
