#ifndef ADMAPPER_CORE_JSON_UTILS_HPP_
#define ADMAPPER_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace admapper::core {

// JSON string escaping for stats and CLI output.
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
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(as_unsigned));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

} // namespace admapper::core

#endif // ADMAPPER_CORE_JSON_UTILS_HPP_
