#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/mini_flow.hpp"

class Loader {
 public:
  struct WorkflowConfig {
    std::string name;
    miniflow::DefinitionPtr definition;
  };

  struct AppConfig {
    int thread_pool_size = 0;
    std::string host = "0.0.0.0";
    int port = 8080;
    std::vector<WorkflowConfig> workflows;
  };

  static nlohmann::json Load(const std::string& filename) {
    try {
      return nlohmann::json::parse(miniflow::ReadFile(filename));
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("Invalid JSON in " + filename + ": " + e.what());
    }
  }

  // {thread_pool_size, host, port, workflows: {name: tree | "file.yaml"}}
  // Relative workflow paths resolve against the config file's directory.
  static AppConfig ParseAppConfig(const std::string& filename) {
    auto root = Load(filename);
    AppConfig app;
    app.thread_pool_size = root.value("thread_pool_size", 0);
    app.host = root.value("host", app.host);
    app.port = root.value("port", app.port);

    if (!root.contains("workflows") || !root["workflows"].is_object()) {
      throw std::runtime_error("Config must contain a 'workflows' object");
    }

    std::string dir;
    auto slash = filename.find_last_of('/');
    if (slash != std::string::npos) dir = filename.substr(0, slash + 1);

    for (auto& [name, wf_json] : root["workflows"].items()) {
      WorkflowConfig wc;
      wc.name = name;
      try {
        if (wf_json.is_string()) {
          std::string path = wf_json.get<std::string>();
          if (!path.empty() && path[0] != '/') path = dir + path;
          wc.definition = miniflow::LoadWorkflowFile(path);
        } else if (wf_json.is_object()) {
          wc.definition = miniflow::FromTree(miniflow::ConvertJson(wf_json));
        } else {
          throw std::runtime_error("expected a definition or a file path");
        }
      } catch (const std::exception& e) {
        throw std::runtime_error("Workflow '" + name + "': " + e.what());
      }
      app.workflows.push_back(std::move(wc));
    }

    return app;
  }
};
