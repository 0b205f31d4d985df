#ifndef AGENTWATCH_CORE_JSON_DOM_HPP_
#define AGENTWATCH_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agentwatch::core::json {

// DOM for the opaque structured payloads carried by trace and drift records
// (`input_data`, `output_data`, `metadata`, `context`) and for config files.
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

  bool operator==(const Value& other) const = default;
};

inline Value MakeObject(Value::Object members = {}) {
  Value value;
  value.type = Value::Type::kObject;
  value.object_value = std::move(members);
  return value;
}

inline Value MakeArray(Value::Array items = {}) {
  Value value;
  value.type = Value::Type::kArray;
  value.array_value = std::move(items);
  return value;
}

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeNumber(const double number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = number;
  return value;
}

inline Value MakeBool(const bool flag) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = flag;
  return value;
}

inline Value MakeStringArray(const std::vector<std::string>& items) {
  Value value = MakeArray();
  value.array_value.reserve(items.size());
  for (const auto& item : items) {
    value.array_value.push_back(MakeString(item));
  }
  return value;
}

// Returns the member value or nullptr when `object_value` is not an object or
// the key is absent.
inline const Value* FindMember(const Value& object_value, std::string_view key) {
  if (object_value.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.object_value.find(std::string(key));
  if (it == object_value.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Compact serializer. `std::map` members keep key order stable so stored rows
// and snapshot tests are deterministic.
inline void SerializeTo(const Value& value, std::string& out) {
  switch (value.type) {
  case Value::Type::kObject: {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      out += "\"" + EscapeJson(key) + "\":";
      SerializeTo(member, out);
      first = false;
    }
    out.push_back('}');
    return;
  }
  case Value::Type::kArray: {
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      SerializeTo(item, out);
      first = false;
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kString:
    out += "\"" + EscapeJson(value.string_value) + "\"";
    return;
  case Value::Type::kNumber:
    out += FormatJsonNumber(value.number_value);
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNull:
    out += "null";
    return;
  }
}

inline std::string Serialize(const Value& value) {
  std::string out;
  SerializeTo(value, out);
  return out;
}

// Lightweight JSON parser with deterministic diagnostics.
// Errors report line/column so malformed rows and config files are actionable.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ReadHex4(std::uint32_t& code_unit, std::string& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape in string", error);
      }
      const char h = Advance();
      code_unit <<= 4U;
      if (h >= '0' && h <= '9') {
        code_unit |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_unit |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_unit |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    return true;
  }

  // Decodes `XXXX` (and a following low surrogate when needed) into UTF-8.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    if (!ReadHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("high surrogate without low surrogate in string", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in string", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unexpected low surrogate in string", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end == nullptr || static_cast<std::size_t>(end - text.c_str()) != text.size()) {
      return Fail("invalid number token", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace agentwatch::core::json

#endif // AGENTWATCH_CORE_JSON_DOM_HPP_
