#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

#include "mini_flow/config_node.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/serialization.hpp"

namespace miniflow {

// ==========================================
// JSON (nlohmann/json)
// ==========================================

inline ConfigNode ConvertJson(const nlohmann::json& j) {
  if (j.is_string()) {
    return ConfigNode(j.get<std::string>());
  } else if (j.is_number_integer()) {
    ConfigNode node;
    node.SetScalar(j.dump(), ConfigNode::kNumber);
    return node;
  } else if (j.is_number_float()) {
    ConfigNode node;
    node.SetScalar(j.dump(), ConfigNode::kNumber);
    return node;
  } else if (j.is_boolean()) {
    return ConfigNode::Bool(j.get<bool>());
  } else if (j.is_array()) {
    ConfigNode node = ConfigNode::Sequence();
    for (const auto& item : j) {
      node.AddSequenceItem() = ConvertJson(item);
    }
    return node;
  } else if (j.is_object()) {
    ConfigNode node = ConfigNode::Map();
    for (auto it = j.begin(); it != j.end(); ++it) {
      node.AddMapItem(it.key()) = ConvertJson(it.value());
    }
    return node;
  }
  return ConfigNode();
}

namespace detail {

inline bool ParseInteger(const std::string& text, int64_t* out) {
  if (text.empty()) return false;
  std::istringstream ss(text);
  int64_t v = 0;
  ss >> v;
  if (ss.fail() || !ss.eof()) return false;
  *out = v;
  return true;
}

}  // namespace detail

inline nlohmann::json ToJsonValue(const ConfigNode& node) {
  switch (node.type()) {
    case ConfigNode::kNull:
      return nullptr;
    case ConfigNode::kScalar: {
      if (node.IsBool()) return node.Text() == "true";
      if (node.IsNumber()) {
        int64_t i = 0;
        if (detail::ParseInteger(node.Text(), &i)) return i;
        double d = 0;
        if (node.ToDouble(&d)) return d;
      }
      return node.Text();
    }
    case ConfigNode::kSequence: {
      nlohmann::json arr = nlohmann::json::array();
      for (const auto& item : node) arr.push_back(ToJsonValue(item));
      return arr;
    }
    case ConfigNode::kMap: {
      nlohmann::json obj = nlohmann::json::object();
      for (const auto& [k, v] : node.Entries()) obj[k] = ToJsonValue(v);
      return obj;
    }
  }
  return nullptr;
}

inline ConfigNode ParseJsonTree(const std::string& text) {
  try {
    return ConvertJson(nlohmann::json::parse(text));
  } catch (const nlohmann::json::parse_error& e) {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    std::string("malformed JSON: ") + e.what());
  }
}

inline std::string ToJson(const WorkflowDefinition& def, int indent = 2) {
  return ToJsonValue(ToTree(def)).dump(indent);
}

inline DefinitionPtr FromJson(const std::string& text) {
  return FromTree(ParseJsonTree(text));
}

// ==========================================
// YAML (yaml-cpp)
// ==========================================

// Quoted scalars stay strings; plain ones are inferred as bool or number.
inline ConfigNode ConvertYaml(const YAML::Node& y) {
  switch (y.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return ConfigNode();
    case YAML::NodeType::Scalar: {
      const std::string& text = y.Scalar();
      if (y.Tag() == "!") return ConfigNode(text);
      if (text == "true" || text == "false") {
        return ConfigNode::Bool(text == "true");
      }
      ConfigNode node(text);
      double d = 0;
      if (node.ToDouble(&d)) node.SetScalar(text, ConfigNode::kNumber);
      return node;
    }
    case YAML::NodeType::Sequence: {
      ConfigNode node = ConfigNode::Sequence();
      for (const auto& item : y) node.Append(ConvertYaml(item));
      return node;
    }
    case YAML::NodeType::Map: {
      ConfigNode node = ConfigNode::Map();
      for (const auto& kv : y) {
        node.Set(kv.first.as<std::string>(), ConvertYaml(kv.second));
      }
      return node;
    }
  }
  return ConfigNode();
}

inline void EmitYaml(YAML::Emitter& out, const ConfigNode& node) {
  switch (node.type()) {
    case ConfigNode::kNull:
      out << YAML::Null;
      break;
    case ConfigNode::kScalar:
      if (node.IsBool()) {
        out << (node.Text() == "true");
      } else if (node.IsNumber()) {
        out << node.Text();
      } else {
        out << YAML::DoubleQuoted << node.Text();
      }
      break;
    case ConfigNode::kSequence:
      out << YAML::BeginSeq;
      for (const auto& item : node) EmitYaml(out, item);
      out << YAML::EndSeq;
      break;
    case ConfigNode::kMap:
      out << YAML::BeginMap;
      for (const auto& [k, v] : node.Entries()) {
        out << YAML::Key << k << YAML::Value;
        EmitYaml(out, v);
      }
      out << YAML::EndMap;
      break;
  }
}

inline ConfigNode ParseYamlTree(const std::string& text) {
  try {
    return ConvertYaml(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    throw FlowError(ErrorKind::kInvalidDefinition,
                    std::string("malformed YAML: ") + e.what());
  }
}

inline std::string ToYaml(const WorkflowDefinition& def) {
  YAML::Emitter out;
  EmitYaml(out, ToTree(def));
  return out.c_str();
}

inline DefinitionPtr FromYaml(const std::string& text) {
  return FromTree(ParseYamlTree(text));
}

// ==========================================
// Files
// ==========================================

inline std::string ReadFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  return buffer.str();
}

inline bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// .yaml / .yml are read as YAML, everything else as JSON.
inline ConfigNode LoadTreeFile(const std::string& path) {
  std::string text = ReadFile(path);
  if (EndsWith(path, ".yaml") || EndsWith(path, ".yml")) {
    return ParseYamlTree(text);
  }
  return ParseJsonTree(text);
}

inline DefinitionPtr LoadWorkflowFile(const std::string& path) {
  return FromTree(LoadTreeFile(path));
}

}  // namespace miniflow
