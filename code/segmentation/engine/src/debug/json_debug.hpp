#pragma once

#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace gate {

// (line, column) of a byte offset in raw text, both 1-based.
inline std::pair<size_t, size_t> calc_line_col(const std::string &s,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// A short excerpt around the byte offset with a caret under it.
inline std::string context_snippet(const std::string &s, size_t byte_pos,
                                   size_t window = 40) {
  byte_pos = std::min(byte_pos, s.size());
  size_t start = (byte_pos > window ? byte_pos - window : 0);
  size_t end = std::min(s.size(), byte_pos + window);
  std::string snippet = s.substr(start, end - start);
  std::replace(snippet.begin(), snippet.end(), '\n', ' ');
  return snippet + "\n" + std::string(byte_pos - start, ' ') + "^";
}

// Error body for a failed parse of `text`, used by the settings loader and the
// HTTP handlers alike.
inline nlohmann::json
parse_error_json(const nlohmann::json::parse_error &e,
                 const std::string &text) {
  // nlohmann reports the offset one past the offending byte
  const size_t byte = e.byte > 0 ? e.byte - 1 : 0;
  auto [line, col] = calc_line_col(text, byte);
  return nlohmann::json{{"ok", false},
                        {"kind", "parse_error"},
                        {"what", e.what()},
                        {"line", line},
                        {"column", col},
                        {"context", context_snippet(text, byte)}};
}

inline std::string describe_parse_error(const nlohmann::json::parse_error &e,
                                        const std::string &text,
                                        const std::string &origin) {
  const size_t byte = e.byte > 0 ? e.byte - 1 : 0;
  auto [line, col] = calc_line_col(text, byte);
  return origin + ":" + std::to_string(line) + ":" + std::to_string(col) +
         ": " + e.what();
}

} // namespace gate
