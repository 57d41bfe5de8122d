#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "mini_flow/config_node.hpp"
#include "mini_flow/graph.hpp"

namespace miniflow {

// ==========================================
// Collaborators supplied by the embedding application
// ==========================================

// Signalled when the run is cancelled, the attempt times out or the run
// fails elsewhere. Long-running executors should poll it.
class CancelToken {
 public:
  void Cancel() { cancelled_.store(true, std::memory_order_release); }
  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

struct TaskRequest {
  std::string run_id;
  std::string node_id;
  NodeKind kind = NodeKind::kAgentExecute;
  ConfigNode config;
  Variables variables;  // snapshot taken at dispatch
  int attempt = 1;
  CancelTokenPtr cancel;
};

// Runs AGENT_SPAWN / AGENT_EXECUTE work. Throw to report failure.
class TaskExecutor {
 public:
  virtual ~TaskExecutor() = default;
  virtual Value Execute(const TaskRequest& request) = 0;
};

struct ServiceRequest {
  std::string run_id;
  std::string node_id;
  NodeKind kind = NodeKind::kMcpCall;  // kMcpCall or kWebhook
  std::string target;
  ConfigNode payload;
  int64_t timeout_ms = 0;
  int attempt = 1;
  CancelTokenPtr cancel;
};

// Performs MCP_CALL / WEBHOOK requests. Throw to report failure.
class ExternalService {
 public:
  virtual ~ExternalService() = default;
  virtual Value Call(const ServiceRequest& request) = 0;
};

}  // namespace miniflow
