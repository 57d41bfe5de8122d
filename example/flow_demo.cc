#include <chrono>
#include <iostream>
#include <string>

#include "agents.hpp"
#include "loader.hpp"

static void PrintRun(const Execution& exec) {
  std::cout << "Run " << exec.id << " (" << exec.workflow_id
            << "): " << ToString(exec.status);
  if (!exec.end_node.empty()) std::cout << " at '" << exec.end_node << "'";
  std::cout << std::endl;
  for (const auto& id : exec.definition->node_order()) {
    const NodeState& st = exec.State(id);
    std::cout << "  " << id << ": " << ToString(st.status);
    if (st.attempts > 1) std::cout << " [attempts " << st.attempts << "]";
    if (st.last_error) {
      std::cout << " [" << ToString(st.last_error->kind) << ": "
                << st.last_error->message << "]";
    }
    std::cout << " " << st.duration_us << "us" << std::endl;
  }
  for (const auto& f : exec.failures) {
    std::cout << "  failure at '" << f.node_id << "': " << ToString(f.kind)
              << ": " << f.message << std::endl;
  }
}

int main(int argc, char** argv) {
  std::string config_path = "../example/example_conf.json";
  if (argc > 1) {
    config_path = argv[1];
  }

  // 1. Parse config
  Loader::AppConfig app_config;
  try {
    app_config = Loader::ParseAppConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Error loading config: " << e.what() << std::endl;
    return -1;
  }

  // 2. Create the engine (with stderr logger)
  EngineOptions options;
  if (app_config.thread_pool_size > 0) {
    options.thread_pool_size = static_cast<size_t>(app_config.thread_pool_size);
  }
  options.log = StderrLogger(LogLevel::kInfo);
  WorkflowEngine engine(options, std::make_shared<SimulatedAgents>(),
                        std::make_shared<SimulatedService>());

  // Stand-in for a human reviewer: approve every gate as soon as it opens.
  engine.Subscribe([&engine](const TransitionEvent& e) {
    if (e.to != ToString(NodeStatus::kAwaitingApproval)) return;
    std::cout << "[reviewer] approving '" << e.node_id << "' in " << e.run_id
              << std::endl;
    engine.Approve(e.run_id, e.node_id);
  });

  // 3. Register all workflows
  for (const auto& wf_conf : app_config.workflows) {
    try {
      std::cout << "\n=== Registering workflow: " << wf_conf.name
                << " ===" << std::endl;
      engine.RegisterWorkflow(wf_conf.name, wf_conf.definition);
    } catch (const std::exception& e) {
      std::cerr << "Failed to register workflow '" << wf_conf.name
                << "': " << e.what() << std::endl;
      return -1;
    }
  }

  // Plus one instantiated from the template library
  TemplateLibrary library;
  ConfigNode params = ConfigNode::Map();
  params.Set("tasks", ConfigNode::StringList({"research", "draft", "check"}));
  params.Set("failure_tolerance", ConfigNode("partial"));
  try {
    engine.RegisterWorkflow("fan_out",
                            library.Instantiate("fan_out_fan_in", params));
  } catch (const std::exception& e) {
    std::cerr << "Failed to instantiate template: " << e.what() << std::endl;
    return -1;
  }

  // 4. Run each workflow
  for (const auto& name : engine.ListWorkflows()) {
    std::cout << "\n====== Running workflow: " << name << " ======"
              << std::endl;
    auto t_start = std::chrono::high_resolution_clock::now();
    try {
      Variables vars;
      vars["topic"] = Value::String("release notes");
      std::string run_id = engine.Start(name, vars);
      auto status = engine.WaitFor(run_id, std::chrono::milliseconds(5000));
      if (!status) {
        engine.Cancel(run_id, "demo deadline");
        std::cerr << "Run " << run_id << " timed out (cancelled)" << std::endl;
        engine.Wait(run_id);
      }
      if (auto exec = engine.Inspect(run_id)) PrintRun(*exec);
    } catch (const std::exception& e) {
      std::cerr << "Run error: " << e.what() << std::endl;
    }
    auto t_end = std::chrono::high_resolution_clock::now();
    std::cout << "Latency: "
              << std::chrono::duration_cast<std::chrono::milliseconds>(
                     t_end - t_start)
                     .count()
              << "ms" << std::endl;
  }

  // Per-kind metrics
  std::cout << "\nNode metrics:" << std::endl;
  for (const auto& [kind, m] : engine.Metrics()) {
    std::cout << "  " << ToString(kind) << ": count " << m.count << ", avg "
              << m.AverageUs() << "us, max " << m.max_us << "us" << std::endl;
  }

  return 0;
}
