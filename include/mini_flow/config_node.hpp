#pragma once

#include <cstdint>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// Value tree
// ==========================================

// Tree of null / scalar / sequence / map. Scalars keep their text plus a
// kind so numbers and booleans survive a trip through JSON or YAML. The same
// type carries node configuration, shared variables and executor results.
class ConfigNode {
 public:
  enum Type { kNull, kScalar, kSequence, kMap };
  enum ScalarKind { kString, kNumber, kBool };

  ConfigNode() : type_(kNull) {}
  explicit ConfigNode(std::string value)
      : type_(kScalar), scalar_(std::move(value)) {}

  static ConfigNode String(std::string value) {
    return ConfigNode(std::move(value));
  }
  static ConfigNode Int(int64_t value) {
    ConfigNode n(std::to_string(value));
    n.kind_ = kNumber;
    return n;
  }
  static ConfigNode Number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    ConfigNode n(oss.str());
    n.kind_ = kNumber;
    return n;
  }
  static ConfigNode Bool(bool value) {
    ConfigNode n(value ? "true" : "false");
    n.kind_ = kBool;
    return n;
  }
  static ConfigNode Map() {
    ConfigNode n;
    n.type_ = kMap;
    return n;
  }
  static ConfigNode Sequence() {
    ConfigNode n;
    n.type_ = kSequence;
    return n;
  }
  static ConfigNode StringList(const std::vector<std::string>& items) {
    ConfigNode n = Sequence();
    for (const auto& item : items) n.Append(ConfigNode(item));
    return n;
  }

  Type type() const { return type_; }
  ScalarKind scalar_kind() const { return kind_; }

  bool IsNull() const { return type_ == kNull; }
  bool IsScalar() const { return type_ == kScalar; }
  bool IsSequence() const { return type_ == kSequence; }
  bool IsMap() const { return type_ == kMap; }
  bool IsNumber() const { return type_ == kScalar && kind_ == kNumber; }
  bool IsBool() const { return type_ == kScalar && kind_ == kBool; }
  bool IsString() const { return type_ == kScalar && kind_ == kString; }

  const ConfigNode& operator[](const std::string& key) const {
    if (type_ != kMap) {
      return NullNode();
    }
    auto it = map_.find(key);
    if (it == map_.end()) {
      return NullNode();
    }
    return it->second;
  }

  const ConfigNode& operator[](size_t index) const {
    if (type_ != kSequence || index >= sequence_.size()) {
      return NullNode();
    }
    return sequence_[index];
  }

  bool Has(const std::string& key) const {
    return type_ == kMap && map_.find(key) != map_.end();
  }

  std::vector<ConfigNode>::const_iterator begin() const {
    return sequence_.begin();
  }
  std::vector<ConfigNode>::const_iterator end() const {
    return sequence_.end();
  }

  const std::vector<ConfigNode>& Items() const { return sequence_; }
  const std::map<std::string, ConfigNode>& Entries() const { return map_; }

  size_t size() const {
    if (type_ == kSequence) {
      return sequence_.size();
    } else if (type_ == kMap) {
      return map_.size();
    }
    return 0;
  }

  template <typename T>
  T As(const T& default_value = T{}) const {
    if (type_ != kScalar) {
      return default_value;
    }
    return Parse<T>(scalar_);
  }

  template <typename T>
  T AsRequired() const {
    if (type_ != kScalar) {
      throw std::runtime_error("ConfigNode is not a scalar");
    }
    return Parse<T>(scalar_);
  }

  // Numeric view of a scalar: numbers, and strings that parse fully as one.
  bool ToDouble(double* out) const {
    if (type_ != kScalar || kind_ == kBool || scalar_.empty()) return false;
    std::istringstream ss(scalar_);
    double v = 0;
    ss >> v;
    if (ss.fail() || !ss.eof()) return false;
    *out = v;
    return true;
  }

  const std::string& Text() const { return scalar_; }

  void SetScalar(std::string value) {
    type_ = kScalar;
    kind_ = kString;
    scalar_ = std::move(value);
  }

  void SetScalar(std::string value, ScalarKind kind) {
    SetScalar(std::move(value));
    kind_ = kind;
  }

  ConfigNode& AddSequenceItem() {
    type_ = kSequence;
    sequence_.emplace_back();
    return sequence_.back();
  }

  ConfigNode& AddMapItem(const std::string& key) {
    type_ = kMap;
    return map_[key];
  }

  ConfigNode& Append(ConfigNode value) {
    AddSequenceItem() = std::move(value);
    return *this;
  }

  ConfigNode& Set(const std::string& key, ConfigNode value) {
    AddMapItem(key) = std::move(value);
    return *this;
  }

  void Erase(const std::string& key) { map_.erase(key); }

  bool operator==(const ConfigNode& o) const {
    if (type_ != o.type_) return false;
    switch (type_) {
      case kNull:
        return true;
      case kScalar:
        return kind_ == o.kind_ && scalar_ == o.scalar_;
      case kSequence:
        return sequence_ == o.sequence_;
      case kMap:
        return map_ == o.map_;
    }
    return false;
  }
  bool operator!=(const ConfigNode& o) const { return !(*this == o); }

  // Compact JSON-like rendering, used for logs and string formatting.
  std::string Dump() const {
    std::ostringstream out;
    DumpTo(out);
    return out.str();
  }

  // Scalars print bare; containers fall back to Dump().
  std::string ToString() const {
    if (type_ == kScalar) return scalar_;
    if (type_ == kNull) return "";
    return Dump();
  }

 private:
  Type type_;
  ScalarKind kind_ = kString;
  std::string scalar_;
  std::vector<ConfigNode> sequence_;
  std::map<std::string, ConfigNode> map_;

  static const ConfigNode& NullNode() {
    static ConfigNode null;
    return null;
  }

  template <typename T>
  T Parse(const std::string& value) const {
    if constexpr (std::is_same_v<T, std::string>) {
      return value;
    } else if constexpr (std::is_same_v<T, bool>) {
      return value == "true" || value == "1";
    } else {
      T res{};
      std::stringstream ss(value);
      ss >> res;
      return res;
    }
  }

  void DumpTo(std::ostringstream& out) const {
    switch (type_) {
      case kNull:
        out << "null";
        break;
      case kScalar:
        if (kind_ == kString) {
          out << '"' << scalar_ << '"';
        } else {
          out << scalar_;
        }
        break;
      case kSequence: {
        out << '[';
        bool first = true;
        for (const auto& item : sequence_) {
          if (!first) out << ',';
          first = false;
          item.DumpTo(out);
        }
        out << ']';
        break;
      }
      case kMap: {
        out << '{';
        bool first = true;
        for (const auto& [k, v] : map_) {
          if (!first) out << ',';
          first = false;
          out << '"' << k << "\":";
          v.DumpTo(out);
        }
        out << '}';
        break;
      }
    }
  }
};

// Shared variables, executor results and template parameters are all trees.
using Value = ConfigNode;
using Variables = std::map<std::string, Value>;

}  // namespace miniflow
