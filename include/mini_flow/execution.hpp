#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mini_flow/config_node.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/graph.hpp"

namespace miniflow {

// ==========================================
// Run state
// ==========================================

enum class RunStatus {
  kPending,
  kRunning,
  kPaused,
  kSucceeded,
  kFailed,
  kCancelled,
};

enum class NodeStatus {
  kPending,
  kReady,
  kRunning,
  kSucceeded,
  kFailed,
  kSkipped,
  kCancelled,
  kAwaitingApproval,
};

inline const char* ToString(RunStatus s) {
  switch (s) {
    case RunStatus::kPending:
      return "PENDING";
    case RunStatus::kRunning:
      return "RUNNING";
    case RunStatus::kPaused:
      return "PAUSED";
    case RunStatus::kSucceeded:
      return "SUCCEEDED";
    case RunStatus::kFailed:
      return "FAILED";
    case RunStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

inline const char* ToString(NodeStatus s) {
  switch (s) {
    case NodeStatus::kPending:
      return "PENDING";
    case NodeStatus::kReady:
      return "READY";
    case NodeStatus::kRunning:
      return "RUNNING";
    case NodeStatus::kSucceeded:
      return "SUCCEEDED";
    case NodeStatus::kFailed:
      return "FAILED";
    case NodeStatus::kSkipped:
      return "SKIPPED";
    case NodeStatus::kCancelled:
      return "CANCELLED";
    case NodeStatus::kAwaitingApproval:
      return "AWAITING_APPROVAL";
  }
  return "UNKNOWN";
}

// Running or paused: results still land, but a paused run dispatches nothing.
inline bool IsLive(RunStatus s) {
  return s == RunStatus::kRunning || s == RunStatus::kPaused;
}

inline bool IsTerminal(RunStatus s) {
  return s == RunStatus::kSucceeded || s == RunStatus::kFailed ||
         s == RunStatus::kCancelled;
}

// READY, RUNNING and AWAITING_APPROVAL nodes keep a run alive.
inline bool IsActive(NodeStatus s) {
  return s == NodeStatus::kReady || s == NodeStatus::kRunning ||
         s == NodeStatus::kAwaitingApproval;
}

struct NodeError {
  ErrorKind kind = ErrorKind::kExecutorFailure;
  std::string message;
};

struct NodeState {
  NodeStatus status = NodeStatus::kPending;
  int attempts = 0;
  std::optional<NodeError> last_error;
  Value output;
  int iteration = 0;  // loop iteration the state belongs to
  int64_t duration_us = 0;
};

struct Failure {
  std::string node_id;  // empty for run-level failures such as a run timeout
  ErrorKind kind = ErrorKind::kExecutorFailure;
  std::string message;
};

struct Execution {
  using TimePoint = std::chrono::system_clock::time_point;

  std::string id;
  std::string workflow_id;
  std::string workflow_name;
  DefinitionPtr definition;
  RunStatus status = RunStatus::kPending;
  TimePoint started_at;
  std::optional<TimePoint> ended_at;
  Variables variables;
  std::map<std::string, NodeState> nodes;
  std::vector<Failure> failures;
  std::string end_node;  // first END reached
  std::string cancel_reason;

  bool IsTerminal() const { return miniflow::IsTerminal(status); }

  const NodeState& State(const std::string& node_id) const {
    return nodes.at(node_id);
  }
};

// Run-level transitions carry an empty node_id.
struct TransitionEvent {
  std::string run_id;
  std::string node_id;
  std::string from;
  std::string to;
  std::chrono::system_clock::time_point timestamp;
};

}  // namespace miniflow
