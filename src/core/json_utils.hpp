#ifndef LINKWATCH_CORE_JSON_UTILS_HPP_
#define LINKWATCH_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace linkwatch::core {

// JSON string escaping shared by the event stream and replay output.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
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
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

} // namespace linkwatch::core

#endif // LINKWATCH_CORE_JSON_UTILS_HPP_
