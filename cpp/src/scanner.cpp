#include "internal.hpp"

namespace llm_json_repair {

// ---------------- Character-state scanner ----------------

CharState StringScanner::advance(char c) {
  if (escape_) {
    escape_ = false;
    return in_string_ ? CharState::Escaped : CharState::Structural;
  }
  if (c == '\\') {
    escape_ = true;
    return in_string_ ? CharState::InString : CharState::Structural;
  }
  if (c == '"') {
    in_string_ = !in_string_;
    return in_string_ ? CharState::OpenQuote : CharState::CloseQuote;
  }
  return in_string_ ? CharState::InString : CharState::Structural;
}

void StringScanner::reset() {
  in_string_ = false;
  escape_ = false;
}

bool is_inside_string(const std::string& text, size_t offset) {
  StringScanner sc;
  size_t n = offset < text.size() ? offset : text.size();
  for (size_t i = 0; i < n; ++i) sc.advance(text[i]);
  return sc.in_string();
}

// ---------------- Balanced-span extraction ----------------

bool has_json_opener(const std::string& text) { return text.find_first_of("{[") != std::string::npos; }

static bool is_viable_opener(const std::string& text, size_t i) {
  char c = text[i];
  if (i + 1 >= text.size()) return true;  // truncated right after the opener
  char next = text[i + 1];
  if (c == '{') {
    if (i > 0 && detail::is_ident_char(text[i - 1])) return false;  // template-ish "foo{"
    return detail::is_ws(next) || next == '"' || next == '\'' || next == '}' || detail::is_alpha(next);
  }
  if (text.compare(i + 1, 4, "true") == 0 || text.compare(i + 1, 5, "false") == 0 ||
      text.compare(i + 1, 4, "null") == 0) {
    return true;
  }
  return detail::is_ws(next) || next == '"' || next == '\'' || next == '{' || next == '[' || next == ']' ||
         next == '-' || detail::is_digit(next);
}

std::optional<size_t> find_json_opener(const std::string& text, size_t from) {
  for (size_t i = from; i < text.size(); ++i) {
    char c = text[i];
    if ((c == '{' || c == '[') && is_viable_opener(text, i)) return i;
  }
  return std::nullopt;
}

std::optional<JsonSpan> find_balanced_span_at(const std::string& text, size_t begin) {
  if (begin >= text.size()) return std::nullopt;
  const char open = text[begin];
  if (open != '{' && open != '[') return std::nullopt;
  const char close = detail::matching_closer(open);

  StringScanner sc;
  int depth = 0;
  for (size_t i = begin; i < text.size(); ++i) {
    if (sc.advance(text[i]) != CharState::Structural) continue;
    if (text[i] == open) {
      ++depth;
    } else if (text[i] == close) {
      if (--depth == 0) return JsonSpan{begin, i + 1};
    }
  }
  return std::nullopt;
}

std::optional<JsonSpan> find_json_span(const std::string& text) {
  auto open = find_json_opener(text);
  if (!open) return std::nullopt;
  return find_balanced_span_at(text, *open);
}

std::optional<std::string> extract_json_span(const std::string& text) {
  auto span = find_json_span(text);
  if (!span) return std::nullopt;
  return detail::trim_copy(text.substr(span->begin, span->end - span->begin));
}

std::vector<JsonSpan> split_top_level_values(const std::string& text) {
  std::vector<JsonSpan> spans;
  size_t i = detail::skip_ws(text, 0);
  while (i < text.size()) {
    auto span = find_balanced_span_at(text, i);
    if (!span) return {};
    spans.push_back(*span);
    i = detail::skip_ws(text, span->end);
  }
  return spans;
}

}  // namespace llm_json_repair
