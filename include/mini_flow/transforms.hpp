#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "mini_flow/config_node.hpp"

namespace miniflow {

// ==========================================
// DATA_TRANSFORM operations
// ==========================================

struct TransformArgs {
  const ConfigNode& config;
  std::vector<Value> inputs;  // values of config `inputs`, in order; null if unset
  const Variables& variables;
};

// Pure function of its arguments. Throws std::runtime_error on bad input.
class Transform {
 public:
  virtual ~Transform() = default;
  virtual Value Apply(const TransformArgs& args) const = 0;
  virtual std::string Name() const = 0;
};

using TransformCreator = std::function<std::shared_ptr<Transform>()>;

class TransformFactory {
 public:
  static TransformFactory& Get() {
    static TransformFactory f;
    return f;
  }

  void RegisterCreator(const std::string& name, TransformCreator c) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    creators_[name] = std::move(c);
  }

  std::shared_ptr<Transform> Create(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = creators_.find(name);
    if (it == creators_.end()) {
      throw std::runtime_error("Unknown transform: " + name);
    }
    return it->second();
  }

  bool Has(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return creators_.count(name) > 0;
  }

  std::vector<std::string> Names() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<std::string> names;
    names.reserve(creators_.size());
    for (const auto& [k, _] : creators_) names.push_back(k);
    return names;
  }

 private:
  TransformFactory();

  std::unordered_map<std::string, TransformCreator> creators_;
  mutable std::shared_mutex mu_;
};

#define MINIFLOW_REGISTER_TRANSFORM(Name, Type)               \
  static struct RegTransform##Type {                          \
    RegTransform##Type() {                                    \
      miniflow::TransformFactory::Get().RegisterCreator(      \
          Name, []() { return std::make_shared<Type>(); });   \
    }                                                         \
  } reg_transform_##Type;

namespace transforms {

inline double NumberOf(const Value& v, const std::string& what) {
  double d = 0;
  if (!v.ToDouble(&d)) {
    throw std::runtime_error(what + " is not a number: " + v.ToString());
  }
  return d;
}

// Sequences contribute their items; scalars contribute themselves.
inline std::vector<Value> Flatten(const std::vector<Value>& inputs) {
  std::vector<Value> out;
  for (const auto& v : inputs) {
    if (v.IsSequence()) {
      for (const auto& item : v) out.push_back(item);
    } else if (!v.IsNull()) {
      out.push_back(v);
    }
  }
  return out;
}

class SetTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    if (!args.config.Has("value")) {
      throw std::runtime_error("set requires a 'value'");
    }
    return args.config["value"];
  }
  std::string Name() const override { return "set"; }
};

class CopyTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    if (args.inputs.size() != 1) {
      throw std::runtime_error("copy takes exactly one input");
    }
    if (args.inputs[0].IsNull()) {
      throw std::runtime_error("copy input is not set");
    }
    return args.inputs[0];
  }
  std::string Name() const override { return "copy"; }
};

class ConcatTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    std::string sep = args.config["separator"].As<std::string>("");
    std::string out;
    bool first = true;
    for (const auto& v : Flatten(args.inputs)) {
      if (!first) out += sep;
      first = false;
      out += v.ToString();
    }
    return Value::String(out);
  }
  std::string Name() const override { return "concat"; }
};

class SumTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    double total = 0;
    for (const auto& v : Flatten(args.inputs)) total += NumberOf(v, "sum input");
    return Value::Number(total);
  }
  std::string Name() const override { return "sum"; }
};

// A missing input counts as zero, so a counter can start from nothing.
class IncrementTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    if (args.inputs.size() != 1) {
      throw std::runtime_error("increment takes exactly one input");
    }
    double by = 1;
    if (args.config.Has("by")) by = NumberOf(args.config["by"], "increment 'by'");
    double base = 0;
    if (!args.inputs[0].IsNull()) base = NumberOf(args.inputs[0], "increment input");
    return Value::Number(base + by);
  }
  std::string Name() const override { return "increment"; }
};

class CountTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    if (args.inputs.size() == 1 &&
        (args.inputs[0].IsSequence() || args.inputs[0].IsMap())) {
      return Value::Int(static_cast<int64_t>(args.inputs[0].size()));
    }
    int64_t n = 0;
    for (const auto& v : args.inputs) {
      if (!v.IsNull()) ++n;
    }
    return Value::Int(n);
  }
  std::string Name() const override { return "count"; }
};

// Appends the inputs to the current value of the output variable.
class CollectTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    Value out = Value::Sequence();
    auto it = args.variables.find(args.config["output"].As<std::string>());
    if (it != args.variables.end() && it->second.IsSequence()) out = it->second;
    for (const auto& v : args.inputs) {
      if (!v.IsNull()) out.Append(v);
    }
    return out;
  }
  std::string Name() const override { return "collect"; }
};

class MergeTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    Value out = Value::Map();
    for (const auto& v : args.inputs) {
      if (v.IsNull()) continue;
      if (!v.IsMap()) {
        throw std::runtime_error("merge input is not a map: " + v.Dump());
      }
      for (const auto& [k, item] : v.Entries()) out.Set(k, item);
    }
    return out;
  }
  std::string Name() const override { return "merge"; }
};

// Replaces ${name} with the variable's text.
class FormatTransform : public Transform {
 public:
  Value Apply(const TransformArgs& args) const override {
    if (!args.config["template"].IsScalar()) {
      throw std::runtime_error("format requires a 'template'");
    }
    const std::string tmpl = args.config["template"].Text();
    std::string out;
    size_t pos = 0;
    while (pos < tmpl.size()) {
      size_t open = tmpl.find("${", pos);
      if (open == std::string::npos) {
        out += tmpl.substr(pos);
        break;
      }
      size_t close = tmpl.find('}', open + 2);
      if (close == std::string::npos) {
        throw std::runtime_error("unterminated placeholder in template");
      }
      out += tmpl.substr(pos, open - pos);
      std::string name = tmpl.substr(open + 2, close - open - 2);
      auto it = args.variables.find(name);
      if (it == args.variables.end()) {
        throw std::runtime_error("template references unknown variable: " +
                                 name);
      }
      out += it->second.ToString();
      pos = close + 1;
    }
    return Value::String(out);
  }
  std::string Name() const override { return "format"; }
};

}  // namespace transforms

inline TransformFactory::TransformFactory() {
  auto add = [this](std::shared_ptr<Transform> proto) {
    std::string name = proto->Name();
    creators_[name] = [proto]() { return proto; };
  };
  add(std::make_shared<transforms::SetTransform>());
  add(std::make_shared<transforms::CopyTransform>());
  add(std::make_shared<transforms::ConcatTransform>());
  add(std::make_shared<transforms::SumTransform>());
  add(std::make_shared<transforms::IncrementTransform>());
  add(std::make_shared<transforms::CountTransform>());
  add(std::make_shared<transforms::CollectTransform>());
  add(std::make_shared<transforms::MergeTransform>());
  add(std::make_shared<transforms::FormatTransform>());
}

}  // namespace miniflow
