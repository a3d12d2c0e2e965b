#ifndef RECSYNC_CORE_JSON_UTILS_HPP_
#define RECSYNC_CORE_JSON_UTILS_HPP_

#include "core/json_dom.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace recsync::core {

// Shared JSON string escaping for manifest/config/marker writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Shortest round-trip text for a double. Integral doubles keep a ".0" suffix so
// a reader can still tell them apart from integers; non-finite values have no
// JSON spelling and are written as null.
inline std::string FormatJsonDouble(double number) {
  if (!std::isfinite(number)) {
    return "null";
  }
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number);
  if (ec != std::errc()) {
    return "null";
  }
  std::string text(buffer, ptr);
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

namespace detail {

inline void AppendIndent(std::string& out, int indent, int depth) {
  if (indent < 0) {
    return;
  }
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent) * static_cast<std::size_t>(depth), ' ');
}

inline void AppendJson(const json::Value& value, int indent, int depth, std::string& out) {
  using Type = json::Value::Type;
  switch (value.type) {
  case Type::kNull:
    out += "null";
    return;
  case Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Type::kInteger:
    out += std::to_string(value.integer_value);
    return;
  case Type::kNumber:
    out += FormatJsonDouble(value.number_value);
    return;
  case Type::kString:
    out += QuoteJson(value.string_value);
    return;
  case Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendIndent(out, indent, depth + 1);
      AppendJson(item, indent, depth + 1, out);
    }
    AppendIndent(out, indent, depth);
    out.push_back(']');
    return;
  }
  case Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendIndent(out, indent, depth + 1);
      out += QuoteJson(key);
      out += indent < 0 ? ":" : ": ";
      AppendJson(member, indent, depth + 1, out);
    }
    AppendIndent(out, indent, depth);
    out.push_back('}');
    return;
  }
  }
}

} // namespace detail

// Serializes a DOM value. `indent < 0` gives compact single-line output;
// otherwise members are placed on their own lines, indented as if the value
// sat `depth` levels deep in an enclosing document. Object keys come out in
// sorted order because the DOM stores them in a std::map.
inline std::string ToJsonText(const json::Value& value, int indent = -1, int depth = 0) {
  std::string out;
  detail::AppendJson(value, indent, depth, out);
  return out;
}

} // namespace recsync::core

#endif // RECSYNC_CORE_JSON_UTILS_HPP_
