#ifndef LINKWATCH_CORE_JSON_DOM_HPP_
#define LINKWATCH_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::core::json {

// Minimal DOM used by the monitor config loader and validator.
// STL-only; the config file is small and read once at startup.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }

  // Returns nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "unknown";
}

// uint64 max is not representable as a double; its cast rounds up to 2^64.
inline constexpr double kTwoPow64 = 18446744073709551616.0;

// Typed readers. Each returns false (leaving `out` untouched) on a type
// mismatch so callers can turn that into a path-qualified validation issue.
inline bool TryGetUnsigned(const Value& value, std::uint64_t& out) {
  if (value.type != Value::Type::kNumber || !std::isfinite(value.number_value) ||
      value.number_value < 0.0 || std::floor(value.number_value) != value.number_value ||
      value.number_value >= kTwoPow64) {
    return false;
  }
  out = static_cast<std::uint64_t>(value.number_value);
  return true;
}

inline bool TryGetNumber(const Value& value, double& out) {
  if (value.type != Value::Type::kNumber || !std::isfinite(value.number_value)) {
    return false;
  }
  out = value.number_value;
  return true;
}

inline bool TryGetString(const Value& value, std::string& out) {
  if (value.type != Value::Type::kString) {
    return false;
  }
  out = value.string_value;
  return true;
}

inline bool TryGetBool(const Value& value, bool& out) {
  if (value.type != Value::Type::kBool) {
    return false;
  }
  out = value.bool_value;
  return true;
}

// Recursive-descent parser. Diagnostics carry line/column of the failure.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0U, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ < input_.size()) {
      return Fail("trailing characters after top-level value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input", error);
    }

    value = Value{};
    const char c = input_[pos_];
    switch (c) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return ConsumeLiteral("true", error);
    case 'f':
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return ConsumeLiteral("false", error);
    case 'n':
      value.type = Value::Type::kNull;
      return ConsumeLiteral("null", error);
    default:
      break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail(std::string("unexpected character '") + c + "'", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Step();
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!TryConsume(':')) {
        return Fail("expected ':' after key \"" + key + "\"", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1U, error)) {
        return false;
      }
      value.object_value[std::move(key)] = std::move(member);

      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Step();
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& out, std::string& error) {
    out.clear();
    Step();
    while (pos_ < input_.size()) {
      const char c = Step();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character inside string", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= input_.size()) {
        break;
      }
      const char escaped = Step();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out.push_back(escaped);
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      default:
        return Fail(std::string("unsupported escape '\\") + escaped + "'", error);
      }
    }
    return Fail("unterminated string", error);
  }

  bool ParseNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '+' || c == '.' ||
          c == 'e' || c == 'E') {
        Step();
        continue;
      }
      break;
    }

    const std::string token(input_.substr(start, pos_ - start));
    try {
      std::size_t consumed = 0;
      out = std::stod(token, &consumed);
      if (consumed != token.size()) {
        return Fail("malformed number '" + token + "'", error);
      }
    } catch (const std::exception&) {
      return Fail("malformed number '" + token + "'", error);
    }
    return true;
  }

  bool ConsumeLiteral(std::string_view literal, std::string& error) {
    if (input_.substr(pos_, literal.size()) != literal) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < literal.size(); ++i) {
      Step();
    }
    return true;
  }

  bool TryConsume(char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      Step();
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Step();
    }
  }

  char Step() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    return c;
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "line " + std::to_string(line_) + ", col " + std::to_string(column_) + ": " +
            std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t column_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace linkwatch::core::json

#endif // LINKWATCH_CORE_JSON_DOM_HPP_
