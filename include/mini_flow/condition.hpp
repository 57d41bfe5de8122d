#pragma once

#include <cctype>
#include <regex>
#include <string>
#include <vector>

#include "mini_flow/config_node.hpp"
#include "mini_flow/errors.hpp"

namespace miniflow {

// ==========================================
// Edge / loop predicates
// ==========================================

enum class CompareOp {
  kEq,
  kNe,
  kGt,
  kLt,
  kGe,
  kLe,
  kContains,
  kNotContains,
  kRegex,
  kExists,
  kNotExists,
};

inline const char* ToString(CompareOp op) {
  switch (op) {
    case CompareOp::kEq:
      return "==";
    case CompareOp::kNe:
      return "!=";
    case CompareOp::kGt:
      return ">";
    case CompareOp::kLt:
      return "<";
    case CompareOp::kGe:
      return ">=";
    case CompareOp::kLe:
      return "<=";
    case CompareOp::kContains:
      return "contains";
    case CompareOp::kNotContains:
      return "not_contains";
    case CompareOp::kRegex:
      return "regex";
    case CompareOp::kExists:
      return "exists";
    case CompareOp::kNotExists:
      return "not_exists";
  }
  return "?";
}

struct Clause {
  std::string variable;
  CompareOp op = CompareOp::kEq;
  Value expected;

  bool operator==(const Clause& o) const {
    return variable == o.variable && op == o.op && expected == o.expected;
  }
};

// A conjunction, disjunction or exclusive-or of clauses. Text form:
//   x > 5
//   status == "done" && retries < 3
//   reply contains "LGTM" || forced exists
class Condition {
 public:
  enum Logic { kAnd, kOr, kXor };

  Condition() = default;
  Condition(std::vector<Clause> clauses, Logic logic = kAnd)
      : clauses_(std::move(clauses)), logic_(logic) {}

  // Throws FlowError(kInvalidDefinition) on malformed text.
  static Condition Parse(const std::string& text) {
    Condition cond;
    std::vector<std::string> parts;
    std::string current;
    bool in_quote = false;
    int separators = 0;
    for (size_t i = 0; i < text.size(); ++i) {
      char c = text[i];
      if (c == '"') in_quote = !in_quote;
      if (!in_quote && i + 1 < text.size()) {
        std::string two = text.substr(i, 2);
        Logic logic = kAnd;
        bool is_sep = true;
        if (two == "&&") {
          logic = kAnd;
        } else if (two == "||") {
          logic = kOr;
        } else if (two == "^^") {
          logic = kXor;
        } else {
          is_sep = false;
        }
        if (is_sep) {
          if (separators > 0 && logic != cond.logic_) {
            throw FlowError(ErrorKind::kInvalidDefinition,
                            "mixed logical operators in condition: " + text);
          }
          cond.logic_ = logic;
          ++separators;
          parts.push_back(current);
          current.clear();
          ++i;
          continue;
        }
      }
      current += c;
    }
    if (in_quote) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "unterminated string in condition: " + text);
    }
    parts.push_back(current);
    for (const auto& part : parts) {
      cond.clauses_.push_back(ParseClause(part, text));
    }
    return cond;
  }

  // Canonical text; Parse(ToText()) reproduces an equal condition.
  std::string ToText() const {
    static const char* joiners[] = {" && ", " || ", " ^^ "};
    std::string out;
    for (size_t i = 0; i < clauses_.size(); ++i) {
      if (i > 0) out += joiners[logic_];
      const auto& c = clauses_[i];
      out += c.variable + " " + ToString(c.op);
      if (c.op == CompareOp::kExists || c.op == CompareOp::kNotExists) {
        continue;
      }
      out += " ";
      if (c.expected.IsString()) {
        out += "\"" + c.expected.Text() + "\"";
      } else {
        out += c.expected.ToString();
      }
    }
    return out;
  }

  bool Evaluate(const Variables& vars) const {
    if (clauses_.empty()) return true;
    int hits = 0;
    for (const auto& clause : clauses_) {
      bool r = EvaluateClause(clause, vars);
      if (r) ++hits;
      if (logic_ == kAnd && !r) return false;
      if (logic_ == kOr && r) return true;
    }
    if (logic_ == kAnd) return true;
    if (logic_ == kOr) return false;
    return hits == 1;
  }

  const std::vector<Clause>& clauses() const { return clauses_; }
  Logic logic() const { return logic_; }
  bool empty() const { return clauses_.empty(); }

  bool operator==(const Condition& o) const {
    return logic_ == o.logic_ && clauses_ == o.clauses_;
  }
  bool operator!=(const Condition& o) const { return !(*this == o); }

 private:
  std::vector<Clause> clauses_;
  Logic logic_ = kAnd;

  static std::string Trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
           c == '.' || c == '-';
  }

  static Value ParseLiteral(const std::string& raw) {
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
      return Value::String(raw.substr(1, raw.size() - 2));
    }
    if (raw == "true") return Value::Bool(true);
    if (raw == "false") return Value::Bool(false);
    Value text(raw);
    double d = 0;
    if (text.ToDouble(&d)) {
      Value n(raw);
      n.SetScalar(raw, Value::kNumber);
      return n;
    }
    return Value::String(raw);
  }

  static Clause ParseClause(const std::string& part, const std::string& full) {
    std::string s = Trim(part);
    size_t i = 0;
    while (i < s.size() && IsIdentChar(s[i])) ++i;
    Clause clause;
    clause.variable = s.substr(0, i);
    if (clause.variable.empty()) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "condition clause has no variable: " + full);
    }
    std::string rest = Trim(s.substr(i));

    static const std::vector<std::pair<std::string, CompareOp>> kSymbols = {
        {">=", CompareOp::kGe}, {"<=", CompareOp::kLe}, {"==", CompareOp::kEq},
        {"!=", CompareOp::kNe}, {">", CompareOp::kGt},  {"<", CompareOp::kLt},
    };
    static const std::vector<std::pair<std::string, CompareOp>> kWords = {
        {"not_contains", CompareOp::kNotContains},
        {"contains", CompareOp::kContains},
        {"not_exists", CompareOp::kNotExists},
        {"exists", CompareOp::kExists},
        {"regex", CompareOp::kRegex},
    };

    bool found = false;
    for (const auto& [sym, op] : kSymbols) {
      if (rest.compare(0, sym.size(), sym) == 0) {
        clause.op = op;
        rest = Trim(rest.substr(sym.size()));
        found = true;
        break;
      }
    }
    if (!found) {
      for (const auto& [word, op] : kWords) {
        if (rest.compare(0, word.size(), word) == 0 &&
            (rest.size() == word.size() ||
             std::isspace(static_cast<unsigned char>(rest[word.size()])))) {
          clause.op = op;
          rest = Trim(rest.substr(word.size()));
          found = true;
          break;
        }
      }
    }
    if (!found) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "unknown operator in condition: " + full);
    }

    bool unary =
        clause.op == CompareOp::kExists || clause.op == CompareOp::kNotExists;
    if (unary) {
      if (!rest.empty()) {
        throw FlowError(ErrorKind::kInvalidDefinition,
                        "unexpected operand after existence test: " + full);
      }
      return clause;
    }
    if (rest.empty()) {
      throw FlowError(ErrorKind::kInvalidDefinition,
                      "condition clause has no value: " + full);
    }
    clause.expected = ParseLiteral(rest);
    if (clause.op == CompareOp::kRegex) {
      try {
        std::regex compiled(clause.expected.ToString());
      } catch (const std::regex_error& e) {
        throw FlowError(ErrorKind::kInvalidDefinition,
                        "bad regex in condition '" + full + "': " + e.what());
      }
    }
    return clause;
  }

  static bool Contains(const Value& actual, const Value& expected) {
    const std::string needle = expected.ToString();
    if (actual.IsSequence()) {
      for (const auto& item : actual) {
        if (item.ToString() == needle) return true;
      }
      return false;
    }
    if (actual.IsMap()) return actual.Has(needle);
    return actual.ToString().find(needle) != std::string::npos;
  }

  static bool EvaluateClause(const Clause& c, const Variables& vars) {
    auto it = vars.find(c.variable);
    bool present = it != vars.end() && !it->second.IsNull();
    if (c.op == CompareOp::kExists) return present;
    if (c.op == CompareOp::kNotExists) return !present;
    if (!present) return false;
    const Value& actual = it->second;

    double a = 0, b = 0;
    bool numeric = actual.ToDouble(&a) && c.expected.ToDouble(&b);
    switch (c.op) {
      case CompareOp::kEq:
        return numeric ? a == b : actual.ToString() == c.expected.ToString();
      case CompareOp::kNe:
        return numeric ? a != b : actual.ToString() != c.expected.ToString();
      case CompareOp::kGt:
        return numeric && a > b;
      case CompareOp::kLt:
        return numeric && a < b;
      case CompareOp::kGe:
        return numeric && a >= b;
      case CompareOp::kLe:
        return numeric && a <= b;
      case CompareOp::kContains:
        return Contains(actual, c.expected);
      case CompareOp::kNotContains:
        return !Contains(actual, c.expected);
      case CompareOp::kRegex: {
        std::regex re(c.expected.ToString());
        return std::regex_search(actual.ToString(), re,
                                 std::regex_constants::match_continuous);
      }
      case CompareOp::kExists:
      case CompareOp::kNotExists:
        break;
    }
    return false;
  }
};

}  // namespace miniflow
