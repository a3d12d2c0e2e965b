#ifndef RECSYNC_CORE_JSON_DOM_HPP_
#define RECSYNC_CORE_JSON_DOM_HPP_

#include <cctype>
#include <charconv>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recsync::core::json {

// Small STL-only DOM shared by config loading, manifest writing and manifest
// reading. Integers are kept apart from floating point values so counters and
// device indices round-trip without a trailing ".0".
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kInteger,
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
  std::int64_t integer_value = 0;
  double number_value = 0.0;
  bool bool_value = false;

  bool is_object() const { return type == Type::kObject; }
  bool is_array() const { return type == Type::kArray; }
  bool is_string() const { return type == Type::kString; }
  bool is_integer() const { return type == Type::kInteger; }
  bool is_number() const { return type == Type::kInteger || type == Type::kNumber; }

  double AsDouble() const {
    return type == Type::kInteger ? static_cast<double>(integer_value) : number_value;
  }

  bool operator==(const Value& other) const = default;
};

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeInteger(std::int64_t number) {
  Value value;
  value.type = Value::Type::kInteger;
  value.integer_value = number;
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

inline const Value* FindMember(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Recursive-descent parser. Diagnostics carry line/column so a broken
// config.json points straight at the offending token.
class Parser {
public:
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
  static constexpr std::size_t kMaxDepth = 64;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    switch (Peek()) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      return ParseLiteral("true", MakeBool(true), value, error);
    case 'f':
      return ParseLiteral("false", MakeBool(false), value, error);
    case 'n':
      return ParseLiteral("null", Value{}, value, error);
    default:
      break;
    }

    if (Peek() == '-' || std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      return ParseNumber(value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ParseLiteral(std::string_view token, Value literal, Value& value, std::string& error) {
    if (input_.substr(pos_, token.size()) != token) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
      Advance();
    }
    value = std::move(literal);
    return true;
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value = MakeObject();
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Match(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1, error)) {
        return false;
      }
      // Last duplicate key wins, same as most producers expect.
      value.object_value[std::move(key)] = std::move(member);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value = MakeArray();
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseHex4(std::uint32_t& code_point, std::string& error) {
    if (pos_ + 4 > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    const char* begin = input_.data() + pos_;
    const auto [ptr, ec] = std::from_chars(begin, begin + 4, code_point, 16);
    if (ec != std::errc() || ptr != begin + 4) {
      return Fail("invalid hex digits in \\u escape", error);
    }
    for (int i = 0; i < 4; ++i) {
      Advance();
    }
    return true;
  }

  static void AppendUtf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80U) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t cp = 0;
    if (!ParseHex4(cp, error)) {
      return false;
    }
    if (cp >= 0xD800U && cp <= 0xDBFFU) {
      if (!Match('\\') || !Match('u')) {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      std::uint32_t low = 0;
      if (!ParseHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (cp >= 0xDC00U && cp <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }
    AppendUtf8(cp, output);
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    Advance(); // opening quote

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (AtEnd()) {
        break;
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
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseNumber(Value& value, std::string& error) {
    const std::size_t start = pos_;
    bool integral = true;

    Match('-');
    if (!Match('0')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }
    if (Match('.')) {
      integral = false;
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }
    if (Match('e') || Match('E')) {
      integral = false;
      if (!Match('+')) {
        Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const char* begin = input_.data() + start;
    const char* end = input_.data() + pos_;
    if (integral) {
      std::int64_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(begin, end, parsed);
      if (ec == std::errc() && ptr == end) {
        value = MakeInteger(parsed);
        return true;
      }
      // Out of int64 range: keep it as a double instead of failing.
    }

    try {
      const std::string text(begin, end);
      std::size_t consumed = 0;
      const double parsed = std::stod(text, &consumed);
      if (consumed != text.size()) {
        return Fail("invalid number token", error);
      }
      value = MakeNumber(parsed);
    } catch (const std::exception&) {
      return Fail("numeric value out of range", error);
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

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const { return input_[pos_]; }

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

  bool AtEnd() const { return pos_ >= input_.size(); }

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

} // namespace recsync::core::json

#endif // RECSYNC_CORE_JSON_DOM_HPP_
