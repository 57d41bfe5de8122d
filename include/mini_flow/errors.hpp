#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// Error taxonomy
// ==========================================
enum class ErrorKind {
  kInvalidDefinition,
  kExecutorFailure,
  kServiceFailure,
  kTimeoutExceeded,
  kNoMatchingBranch,
  kJoinedBranchFailed,
  kLoopBoundExceeded,
  kApprovalRejected,
  kRunCancelled,
  kTemplateNotFound,
  kMissingParameter,
  kTransformFailed,
  kUnknownRun,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidDefinition:
      return "InvalidDefinition";
    case ErrorKind::kExecutorFailure:
      return "ExecutorFailure";
    case ErrorKind::kServiceFailure:
      return "ServiceFailure";
    case ErrorKind::kTimeoutExceeded:
      return "TimeoutExceeded";
    case ErrorKind::kNoMatchingBranch:
      return "NoMatchingBranch";
    case ErrorKind::kJoinedBranchFailed:
      return "JoinedBranchFailed";
    case ErrorKind::kLoopBoundExceeded:
      return "LoopBoundExceeded";
    case ErrorKind::kApprovalRejected:
      return "ApprovalRejected";
    case ErrorKind::kRunCancelled:
      return "RunCancelled";
    case ErrorKind::kTemplateNotFound:
      return "TemplateNotFound";
    case ErrorKind::kMissingParameter:
      return "MissingParameter";
    case ErrorKind::kTransformFailed:
      return "TransformFailed";
    case ErrorKind::kUnknownRun:
      return "UnknownRun";
  }
  return "Unknown";
}

// Executor, service and timeout failures are worth another attempt; the rest
// mean the graph or its inputs were wrong.
inline bool IsRetryable(ErrorKind kind) {
  return kind == ErrorKind::kExecutorFailure ||
         kind == ErrorKind::kServiceFailure ||
         kind == ErrorKind::kTimeoutExceeded;
}

// One structural problem found by Validate(). `element` names the node, the
// edge ("a->b") or the definition itself.
struct Violation {
  std::string element;
  std::string message;

  bool operator==(const Violation& o) const {
    return element == o.element && message == o.message;
  }
};

class FlowError : public std::runtime_error {
 public:
  FlowError(ErrorKind kind, const std::string& msg)
      : std::runtime_error(std::string(ToString(kind)) + ": " + msg),
        kind_(kind) {}

  FlowError(ErrorKind kind, const std::string& msg,
            std::vector<Violation> violations)
      : std::runtime_error(std::string(ToString(kind)) + ": " + msg +
                           Describe(violations)),
        kind_(kind),
        violations_(std::move(violations)) {}

  ErrorKind kind() const { return kind_; }
  const std::vector<Violation>& violations() const { return violations_; }

 private:
  ErrorKind kind_;
  std::vector<Violation> violations_;

  static std::string Describe(const std::vector<Violation>& violations) {
    std::string out;
    for (const auto& v : violations) {
      out += "\n  - " + v.element + ": " + v.message;
    }
    return out;
  }
};

}  // namespace miniflow
