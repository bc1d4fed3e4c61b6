#pragma once

#include "llm_json_repair.hpp"

#include <cctype>
#include <string>

namespace llm_json_repair {
namespace detail {

inline bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

inline bool is_ident_start(char c) { return is_alpha(c) || c == '_' || c == '$'; }

inline bool is_ident_char(char c) { return is_ident_start(c) || is_digit(c); }

inline std::string trim_copy(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_ws(s[b])) ++b;
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline size_t skip_ws(const std::string& s, size_t i) {
  while (i < s.size() && is_ws(s[i])) ++i;
  return i;
}

inline char matching_closer(char opener) { return opener == '{' ? '}' : ']'; }

inline SanitizerResult unchanged(const std::string& text) {
  SanitizerResult r;
  r.content = text;
  return r;
}

inline SanitizerResult changed_to(std::string content, std::string description) {
  SanitizerResult r;
  r.content = std::move(content);
  r.changed = true;
  r.description = std::move(description);
  return r;
}

// "Fixed 2 mismatched delimiter(s)"
inline std::string count_message(const std::string& verb, size_t n, const std::string& noun) {
  return verb + " " + std::to_string(n) + " " + noun + "(s)";
}

std::string json_escape(const std::string& s);

}  // namespace detail
}  // namespace llm_json_repair
