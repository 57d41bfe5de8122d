#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "../include/mini_flow.hpp"

using namespace miniflow;

// Helper: simulate latency, giving up early if the attempt is cancelled
inline void SleepMs(int ms, const CancelTokenPtr& cancel = nullptr) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel && cancel->IsCancelled()) {
      throw std::runtime_error("cancelled");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

// ==========================
// Simulated collaborators
// ==========================

// Stands in for a pool of autonomous agents. Replies "<agent>: done <task>"
// and reports a quality score that improves with every loop iteration.
class SimulatedAgents : public TaskExecutor {
 public:
  explicit SimulatedAgents(int latency_ms = 20) : latency_ms_(latency_ms) {}

  Value Execute(const TaskRequest& req) override {
    SleepMs(latency_ms_, req.cancel);
    std::string task = req.config["task"].As<std::string>(
        req.config["agent_type"].As<std::string>("agent"));

    int round = 0;
    for (const auto& [name, value] : req.variables) {
      if (name.size() > 6 && name.compare(name.size() - 6, 6, "_index") == 0) {
        round = std::max(round, value.As<int>(0) + 1);
      }
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      std::cout << "[" << req.node_id << "] attempt " << req.attempt << ": "
                << task << std::endl;
    }

    Value result = Value::Map();
    result.Set("reply", Value::String(req.node_id + ": done " + task));
    result.Set("score", Value::Int(40 + 20 * round));
    return result;
  }

 private:
  int latency_ms_;
  std::mutex mu_;
};

// Echoes the payload back with the target it was sent to.
class SimulatedService : public ExternalService {
 public:
  Value Call(const ServiceRequest& req) override {
    SleepMs(10, req.cancel);
    if (req.target.rfind("fail://", 0) == 0) {
      throw std::runtime_error("service unavailable: " + req.target);
    }
    Value result = Value::Map();
    result.Set("target", Value::String(req.target));
    result.Set("kind", Value::String(ToString(req.kind)));
    result.Set("payload", req.payload);
    return result;
  }
};

// ==========================
// Custom transform
// ==========================
class UppercaseTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    if (args.inputs.size() != 1 || args.inputs[0].IsNull()) {
      throw std::runtime_error("uppercase takes exactly one input");
    }
    std::string text = args.inputs[0].ToString();
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return Value::String(text);
  }
  std::string Name() const override { return "uppercase"; }
};

MINIFLOW_REGISTER_TRANSFORM("uppercase", UppercaseTransform);
