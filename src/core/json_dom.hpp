#ifndef HWBRIDGE_CORE_JSON_DOM_HPP_
#define HWBRIDGE_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hwbridge::core::json {

// Minimal DOM shared by the config loader, the RPC dispatcher and the client.
// Objects keep keys ordered so serialized frames are deterministic in tests.
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

  bool IsObject() const { return type == Type::kObject; }
  bool IsArray() const { return type == Type::kArray; }
  bool IsString() const { return type == Type::kString; }
  bool IsNumber() const { return type == Type::kNumber; }
  bool IsBool() const { return type == Type::kBool; }
  bool IsNull() const { return type == Type::kNull; }

  // Returns the member or nullptr when this is not an object or lacks `key`.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }

  // Inserts or replaces one member, converting a null value into an object.
  Value& Set(std::string key, Value member) {
    if (type != Type::kObject) {
      *this = Value{};
      type = Type::kObject;
    }
    Value& slot = object_value[std::move(key)];
    slot = std::move(member);
    return slot;
  }

  void Push(Value item) {
    if (type != Type::kArray) {
      *this = Value{};
      type = Type::kArray;
    }
    array_value.push_back(std::move(item));
  }
};

inline Value MakeObject() {
  Value value;
  value.type = Value::Type::kObject;
  return value;
}

inline Value MakeArray() {
  Value value;
  value.type = Value::Type::kArray;
  return value;
}

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeNumber(double number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = number;
  return value;
}

inline Value MakeBool(bool flag) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = flag;
  return value;
}

inline Value MakeNull() {
  return Value{};
}

inline Value MakeStringArray(const std::vector<std::string>& items) {
  Value value = MakeArray();
  for (const auto& item : items) {
    value.array_value.push_back(MakeString(item));
  }
  return value;
}

// Lightweight JSON parser with deterministic diagnostics.
// Frames come from untrusted browser clients, so nesting depth is bounded.
class Parser {
public:
  static constexpr std::size_t kMaxDepth = 64;

  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }
    if (depth > kMaxDepth) {
      return Fail("maximum nesting depth exceeded", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, depth, error);
    }
    if (c == '[') {
      return ParseArray(value, depth, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value = MakeBool(true);
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value = MakeBool(false);
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value = Value{};
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value = MakeObject();

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
      if (!ParseValue(item, depth + 1U, error)) {
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

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value = MakeArray();

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
      if (!ParseValue(item, depth + 1U, error)) {
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

  bool ParseHex4(std::uint32_t& code_unit, std::string& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
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

  static void AppendUtf8(std::uint32_t code_point, std::string& output) {
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
  }

  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t high = 0;
    if (!ParseHex4(high, error)) {
      return false;
    }
    if (high >= 0xDC00U && high <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }
    if (high < 0xD800U || high > 0xDBFFU) {
      AppendUtf8(high, output);
      return true;
    }

    if (!StartsWith("\\u")) {
      return Fail("high surrogate must be followed by a low surrogate", error);
    }
    AdvanceN(2);
    std::uint32_t low = 0;
    if (!ParseHex4(low, error)) {
      return false;
    }
    if (low < 0xDC00U || low > 0xDFFFU) {
      return Fail("invalid low surrogate in \\u escape", error);
    }
    AppendUtf8(0x10000U + ((high - 0xD800U) << 10U) + (low - 0xDC00U), output);
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
    try {
      std::size_t parsed = 0;
      output = std::stod(text, &parsed);
      if (parsed != text.size()) {
        return Fail("invalid number token", error);
      }
    } catch (const std::exception&) {
      return Fail("invalid numeric value", error);
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

namespace detail {

// Integral values inside the exactly-representable range are written without a
// fraction so request ids and counters echo back as `7`, not `7.0`.
inline void AppendNumber(double number, std::string& out) {
  if (!std::isfinite(number)) {
    out += "null";
    return;
  }
  constexpr double kMaxExactInteger = 9007199254740992.0;
  if (std::floor(number) == number && std::fabs(number) <= kMaxExactInteger) {
    out += std::to_string(static_cast<std::int64_t>(number));
    return;
  }
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number);
  if (ec != std::errc()) {
    out += "null";
    return;
  }
  out.append(buffer, ptr);
}

inline void AppendValue(const Value& value, std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    AppendNumber(value.number_value, out);
    return;
  case Value::Type::kString:
    out.push_back('"');
    out += EscapeJson(value.string_value);
    out.push_back('"');
    return;
  case Value::Type::kArray: {
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendValue(item, out);
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      out.push_back('"');
      out += EscapeJson(key);
      out += "\":";
      AppendValue(member, out);
    }
    out.push_back('}');
    return;
  }
  }
}

} // namespace detail

// Compact serializer; output parses back into an equal DOM.
inline std::string Serialize(const Value& value) {
  std::string out;
  detail::AppendValue(value, out);
  return out;
}

} // namespace hwbridge::core::json

#endif // HWBRIDGE_CORE_JSON_DOM_HPP_
