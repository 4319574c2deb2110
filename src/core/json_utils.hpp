#ifndef HWBRIDGE_CORE_JSON_UTILS_HPP_
#define HWBRIDGE_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace hwbridge::core {

// Shared JSON string escaping for the DOM serializer and hand-built frames.
// Non-ASCII bytes pass through untouched; payloads are UTF-8 already.
inline std::string EscapeJson(std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(input.size() + 8U);
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out += "\\u00";
        out.push_back(kHex[(as_unsigned >> 4U) & 0x0FU]);
        out.push_back(kHex[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

} // namespace hwbridge::core

#endif // HWBRIDGE_CORE_JSON_UTILS_HPP_
