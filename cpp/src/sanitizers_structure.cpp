#include "internal.hpp"

namespace llm_json_repair {

using detail::changed_to;
using detail::unchanged;

// Index one past the quote closing the string that opens at `open`, or npos.
static size_t string_end(const std::string& s, size_t open) {
  bool escape = false;
  for (size_t i = open + 1; i < s.size(); ++i) {
    if (escape) {
      escape = false;
    } else if (s[i] == '\\') {
      escape = true;
    } else if (s[i] == '"') {
      return i + 1;
    }
  }
  return std::string::npos;
}

// True when the string opening at `open` is followed by ':' (i.e. it is a property name).
static bool is_property_name_at(const std::string& s, size_t open) {
  size_t end = string_end(s, open);
  if (end == std::string::npos) return false;
  size_t k = detail::skip_ws(s, end);
  return k < s.size() && s[k] == ':';
}

static bool is_keyword(const std::string& w) { return w == "true" || w == "false" || w == "null"; }

// ---------------- Mismatched delimiters ----------------

SanitizerResult fix_mismatched_delimiters(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 4);
  std::vector<char> stack;
  StringScanner sc;
  size_t fixes = 0;
  std::vector<std::string> diagnostics;

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (sc.advance(c) != CharState::Structural) {
      out.push_back(c);
      continue;
    }
    if (c == '{' || c == '[') {
      stack.push_back(c);
      out.push_back(c);
      continue;
    }
    if ((c != '}' && c != ']') || stack.empty()) {
      out.push_back(c);  // stray closers with nothing open are left alone
      continue;
    }

    const char expected = detail::matching_closer(stack.back());
    if (c == expected) {
      stack.pop_back();
      out.push_back(c);
      continue;
    }

    // {"list": [{"a": 1], "next": 2} : the ']' stands for "}]"
    if (c == ']' && expected == '}' && stack.size() >= 2 && stack[stack.size() - 2] == '[') {
      size_t k = detail::skip_ws(text, i + 1);
      bool parent_continues = false;
      if (k < text.size() && text[k] == '}') {
        parent_continues = true;
      } else if (k < text.size() && text[k] == ',') {
        size_t q = detail::skip_ws(text, k + 1);
        parent_continues = q < text.size() && text[q] == '"' && is_property_name_at(text, q);
      }
      if (parent_continues) {
        out += "}]";
        stack.pop_back();
        stack.pop_back();
        ++fixes;
        diagnostics.push_back("Expanded ']' at offset " + std::to_string(i) + " to '}]'");
        continue;
      }
    }

    out.push_back(expected);
    stack.pop_back();
    ++fixes;
    diagnostics.push_back(std::string("Replaced '") + c + "' with '" + expected + "' at offset " + std::to_string(i));
  }

  if (fixes == 0) return unchanged(text);
  SanitizerResult r = changed_to(std::move(out), detail::count_message("Fixed", fixes, "mismatched delimiter"));
  r.diagnostics = std::move(diagnostics);
  return r;
}

// ---------------- Stray prose before property names ----------------

SanitizerResult remove_stray_property_prefixes(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::vector<char> stack;
  StringScanner sc;
  char prev_sig = 0;
  std::vector<std::string> diagnostics;

  for (size_t i = 0; i < text.size();) {
    const char c = text[i];
    if (!sc.in_string() && !sc.escaped() && detail::is_alpha(c) && !stack.empty() && stack.back() == '{' &&
        (prev_sig == '{' || prev_sig == ',')) {
      size_t j = i;
      while (j < text.size() && detail::is_ident_char(text[j])) ++j;
      std::string word = text.substr(i, j - i);
      size_t k = detail::skip_ws(text, j);
      if (!is_keyword(word) && k < text.size() && text[k] == '"' && is_property_name_at(text, k)) {
        diagnostics.push_back("Removed stray text '" + word + "' before property name");
        i = k;
        continue;
      }
      out.append(word);
      prev_sig = word.back();
      i = j;
      continue;
    }

    CharState st = sc.advance(c);
    out.push_back(c);
    ++i;
    if (st == CharState::CloseQuote) {
      prev_sig = '"';
    } else if (st == CharState::Structural && !detail::is_ws(c)) {
      if (c == '{' || c == '[') {
        stack.push_back(c);
      } else if ((c == '}' || c == ']') && !stack.empty()) {
        stack.pop_back();
      }
      prev_sig = c;
    }
  }

  if (diagnostics.empty()) return unchanged(text);
  SanitizerResult r =
      changed_to(std::move(out), detail::count_message("Removed", diagnostics.size(), "stray property prefix"));
  r.diagnostics = std::move(diagnostics);
  return r;
}

// ---------------- Property assignment ----------------

static bool ends_bare_value(char c) { return c == ',' || c == '}' || c == ']' || c == '\n' || c == '"'; }

SanitizerResult normalize_property_assignment(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 8);
  std::vector<char> stack;
  StringScanner sc;
  size_t assignments = 0;
  size_t quoted = 0;

  for (size_t i = 0; i < text.size();) {
    const char c = text[i];
    CharState st = sc.advance(c);
    out.push_back(c);
    ++i;
    if (st != CharState::Structural) continue;
    if (c == '{' || c == '[') {
      stack.push_back(c);
      continue;
    }
    if ((c == '}' || c == ']') && !stack.empty()) {
      stack.pop_back();
      continue;
    }
    if (c != ':' || stack.empty() || stack.back() != '{') continue;

    // "name":= "value"
    if (i < text.size() && text[i] == '=') {
      ++i;
      ++assignments;
    }

    size_t j = detail::skip_ws(text, i);
    if (j >= text.size() || !detail::is_ident_start(text[j])) continue;
    size_t v = j;
    while (v < text.size() && !ends_bare_value(text[v])) ++v;
    if (v >= text.size()) continue;  // cut off mid-value; left for the truncation repair
    std::string raw = detail::trim_copy(text.substr(j, v - j));
    if (is_keyword(raw) || raw.find_first_of("+(){}[]:'") != std::string::npos) continue;

    if (text[v] == '"') {
      // "name":toBeCredited", : only the opening quote is missing
      bool ident = true;
      for (char r : raw) ident = ident && (detail::is_ident_char(r) || r == '.');
      size_t k = detail::skip_ws(text, v + 1);
      if (!ident || raw.size() != v - j || (k < text.size() && text[k] != ',' && text[k] != '}' && text[k] != ']')) {
        continue;
      }
      out.append(text, i, j - i);
      out += "\"" + raw + "\"";
      i = v + 1;
    } else {
      out.append(text, i, j - i);
      out += "\"" + detail::json_escape(raw) + "\"";
      i = j + raw.size();
    }
    ++quoted;
  }

  if (assignments == 0 && quoted == 0) return unchanged(text);
  SanitizerResult r;
  r.content = std::move(out);
  r.changed = true;
  if (assignments > 0) r.diagnostics.push_back(detail::count_message("Replaced", assignments, "':=' assignment"));
  if (quoted > 0) r.diagnostics.push_back(detail::count_message("Quoted", quoted, "unquoted property value"));
  r.description = r.diagnostics.front();
  return r;
}

// ---------------- Truncation markers ----------------

// End of a "..." or U+2026 marker starting at `i`, or 0.
static size_t truncation_marker_end(const std::string& s, size_t i) {
  if (s.compare(i, 3, "...") == 0) {
    while (i < s.size() && s[i] == '.') ++i;
    return i;
  }
  if (s.compare(i, 3, "\xE2\x80\xA6") == 0) return i + 3;
  return 0;
}

SanitizerResult remove_truncation_markers(const std::string& text) {
  // [1, 2, ...] and {"a": 1,\n  ...\n} : an elided element stands where a member would
  std::string out;
  out.reserve(text.size());
  StringScanner sc;
  char prev_sig = 0;
  size_t removed = 0;

  for (size_t i = 0; i < text.size();) {
    const char c = text[i];
    if (!sc.in_string() && (prev_sig == '[' || prev_sig == '{' || prev_sig == ',')) {
      size_t m = truncation_marker_end(text, i);
      size_t k = m > 0 ? detail::skip_ws(text, m) : 0;
      if (m > 0 && (k >= text.size() || text[k] == ',' || text[k] == '}' || text[k] == ']')) {
        i = k < text.size() && text[k] == ',' ? k + 1 : m;
        ++removed;
        continue;
      }
    }
    CharState st = sc.advance(c);
    if (st == CharState::CloseQuote) {
      prev_sig = '"';
    } else if (st == CharState::Structural && !detail::is_ws(c)) {
      prev_sig = c;
    }
    out.push_back(c);
    ++i;
  }

  if (removed == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Removed", removed, "truncation marker"));
}

// ---------------- Missing commas ----------------

SanitizerResult add_missing_commas(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 8);
  std::vector<char> stack;
  StringScanner sc;

  // Last significant token outside strings and where it ends in `out`.
  bool terminator = false;
  size_t terminator_end = 0;
  bool newline_since = false;
  std::string word;
  size_t inserted = 0;

  auto starts_member = [&](char c, size_t i) {
    if (stack.empty()) return false;
    if (stack.back() == '{') return c == '"' && is_property_name_at(text, i);
    return c == '"' || c == '{' || c == '[' || c == '-' || detail::is_digit(c) || c == 't' || c == 'f' || c == 'n';
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    const bool was_outside = !sc.in_string();
    CharState st = sc.advance(c);

    if (st == CharState::Structural && detail::is_ws(c)) {
      if (!word.empty()) {
        terminator = is_keyword(word) || detail::is_digit(word.back());
        terminator_end = out.size();
        word.clear();
      }
      if (c == '\n') newline_since = true;
      out.push_back(c);
      continue;
    }

    if (was_outside && (st == CharState::OpenQuote || st == CharState::Structural)) {
      const bool word_char = st == CharState::Structural && (detail::is_ident_char(c) || c == '.' || c == '-' || c == '+');
      if (!word.empty() && !word_char) {
        terminator = is_keyword(word) || detail::is_digit(word.back());
        terminator_end = out.size();
        newline_since = false;
        word.clear();
      }
      if (word.empty() && terminator && newline_since && starts_member(c, i)) {
        out.insert(terminator_end, ",");
        ++inserted;
      }
      if (st == CharState::Structural) {
        if (word_char) {
          word.push_back(c);
          terminator = false;
          newline_since = false;
        } else {
          if (c == '{' || c == '[') {
            stack.push_back(c);
          } else if ((c == '}' || c == ']') && !stack.empty()) {
            stack.pop_back();
          }
          terminator = c == '}' || c == ']';
          terminator_end = out.size() + 1;
          newline_since = false;
        }
      } else {
        terminator = false;
        newline_since = false;
      }
      out.push_back(c);
      continue;
    }

    out.push_back(c);
    if (st == CharState::CloseQuote) {
      terminator = true;
      terminator_end = out.size();
      newline_since = false;
    }
  }

  if (inserted == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Added", inserted, "missing comma"));
}

// ---------------- Trailing commas ----------------

SanitizerResult remove_trailing_commas(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  StringScanner sc;
  size_t dropped = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (sc.advance(c) == CharState::Structural && c == ',') {
      size_t j = detail::skip_ws(text, i + 1);
      if (j < text.size() && (text[j] == '}' || text[j] == ']')) {
        ++dropped;
        continue;
      }
    }
    out.push_back(c);
  }

  if (dropped == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Removed", dropped, "trailing comma"));
}

// ---------------- Truncated structures ----------------

namespace {

enum class Last {
  Open,
  Key,
  Colon,
  Value,
  Comma,
};

struct Frame {
  char open;
  Last last{Last::Open};
  size_t comma_pos{std::string::npos};
  size_t key_pos{std::string::npos};
  bool key_after_comma{false};
};

bool is_hex(char c) { return detail::is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

bool is_scalar_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '+' || c == '-'; }

bool is_complete_number(const std::string& s) {
  size_t i = 0;
  if (i < s.size() && s[i] == '-') ++i;
  if (i >= s.size() || !detail::is_digit(s[i])) return false;
  while (i < s.size() && detail::is_digit(s[i])) ++i;
  if (i < s.size() && s[i] == '.') {
    ++i;
    if (i >= s.size() || !detail::is_digit(s[i])) return false;
    while (i < s.size() && detail::is_digit(s[i])) ++i;
  }
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (i >= s.size() || !detail::is_digit(s[i])) return false;
    while (i < s.size() && detail::is_digit(s[i])) ++i;
  }
  return i == s.size();
}

// Finishes a scalar cut off at end of input; "" means drop it. nullopt means leave as is.
std::optional<std::string> complete_scalar(const std::string& tok) {
  for (const char* kw : {"true", "false", "null"}) {
    std::string k(kw);
    if (tok.size() <= k.size() && k.compare(0, tok.size(), tok) == 0) return k;
  }
  if (tok[0] != '-' && !detail::is_digit(tok[0])) return std::nullopt;
  std::string n = tok;
  while (!n.empty() && !is_complete_number(n)) n.pop_back();
  return n;
}

}  // namespace

SanitizerResult complete_truncated_structures(const std::string& text) {
  std::vector<Frame> stack;
  StringScanner sc;
  bool str_is_key = false;
  size_t unicode_start = std::string::npos;
  int unicode_digits = 0;
  size_t tok_start = std::string::npos;

  auto end_scalar = [&]() {
    if (tok_start == std::string::npos) return;
    tok_start = std::string::npos;
    if (!stack.empty()) stack.back().last = Last::Value;
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    CharState st = sc.advance(c);
    switch (st) {
      case CharState::OpenQuote:
        end_scalar();
        str_is_key = !stack.empty() && stack.back().open == '{' &&
                     (stack.back().last == Last::Open || stack.back().last == Last::Comma);
        if (str_is_key) {
          stack.back().key_after_comma = stack.back().last == Last::Comma;
          stack.back().key_pos = i;
        }
        continue;
      case CharState::CloseQuote:
        unicode_start = std::string::npos;
        if (!stack.empty()) stack.back().last = str_is_key ? Last::Key : Last::Value;
        continue;
      case CharState::Escaped:
        if (c == 'u') {
          unicode_start = i - 1;
          unicode_digits = 0;
        } else {
          unicode_start = std::string::npos;
        }
        continue;
      case CharState::InString:
        if (unicode_start != std::string::npos) {
          if (is_hex(c) && ++unicode_digits < 4) continue;
          unicode_start = std::string::npos;
        }
        continue;
      case CharState::Structural:
        break;
    }

    if (is_scalar_char(c)) {
      if (tok_start == std::string::npos) tok_start = i;
      continue;
    }
    end_scalar();
    if (detail::is_ws(c) || stack.empty()) {
      if (c == '{' || c == '[') stack.push_back(Frame{c});
      continue;
    }
    Frame& top = stack.back();
    switch (c) {
      case '{':
      case '[':
        stack.push_back(Frame{c});
        break;
      case '}':
      case ']':
        stack.pop_back();
        if (!stack.empty()) stack.back().last = Last::Value;
        break;
      case ':':
        if (top.last == Last::Key) top.last = Last::Colon;
        break;
      case ',':
        top.last = Last::Comma;
        top.comma_pos = i;
        break;
      default:
        break;
    }
  }

  if (stack.empty() && !sc.in_string()) return unchanged(text);

  std::vector<std::string> diagnostics;
  std::string out = text;

  if (sc.in_string()) {
    if (str_is_key) {
      stack.back().last = Last::Key;  // partial property name, dropped below
    } else {
      size_t cut = text.size();
      if (sc.escaped()) {
        cut = text.size() - 1;
      } else if (unicode_start != std::string::npos) {
        cut = unicode_start;
      }
      out = text.substr(0, cut) + "\"";
      if (!stack.empty()) stack.back().last = Last::Value;
      diagnostics.push_back("Closed unterminated string");
    }
  } else if (tok_start != std::string::npos) {
    const std::string tok = text.substr(tok_start);
    auto fixed = complete_scalar(tok);
    if (!fixed) {
      if (!stack.empty()) stack.back().last = Last::Value;
    } else if (fixed->empty()) {
      out = text.substr(0, tok_start);
      diagnostics.push_back("Dropped truncated literal '" + tok + "'");
    } else {
      out = text.substr(0, tok_start) + *fixed;
      if (*fixed != tok) diagnostics.push_back("Completed truncated literal '" + tok + "' as '" + *fixed + "'");
      if (!stack.empty()) stack.back().last = Last::Value;
    }
  }

  if (!stack.empty()) {
    const Frame& top = stack.back();
    if (top.last == Last::Key || top.last == Last::Colon) {
      out = out.substr(0, top.key_after_comma ? top.comma_pos : top.key_pos);
      diagnostics.push_back("Dropped property without a value");
    } else if (top.last == Last::Comma) {
      out = out.substr(0, top.comma_pos);
      diagnostics.push_back("Dropped dangling comma");
    }
  }

  while (!out.empty() && detail::is_ws(out.back())) out.pop_back();
  if (!stack.empty()) {
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) out.push_back(detail::matching_closer(it->open));
    diagnostics.push_back(detail::count_message("Closed", stack.size(), "open delimiter"));
  }

  if (out == text) return unchanged(text);
  SanitizerResult r = changed_to(std::move(out), "Completed truncated JSON structure");
  r.diagnostics = std::move(diagnostics);
  return r;
}

// ---------------- Unquoted property names ----------------

SanitizerResult quote_unquoted_property_names(const std::string& text) {
  // { foo: 1 } -> {"foo": 1} (outside strings, only where a property name is expected).
  // A name at the start of a line also counts, so {a: 1\nb: 2} is ready for the comma repair.
  std::string out;
  out.reserve(text.size() + 8);
  StringScanner sc;
  char prev_sig = 0;
  bool newline_since = false;
  size_t quoted = 0;

  for (size_t i = 0; i < text.size();) {
    const char c = text[i];
    const bool name_position =
        prev_sig == '{' || prev_sig == ',' || (newline_since && prev_sig != ':' && prev_sig != '[');
    if (!sc.in_string() && !sc.escaped() && detail::is_ident_start(c) && name_position) {
      size_t j = i;
      while (j < text.size() && detail::is_ident_char(text[j])) ++j;
      size_t k = detail::skip_ws(text, j);
      if (k < text.size() && text[k] == ':') {
        out.push_back('"');
        out.append(text, i, j - i);
        out.push_back('"');
        ++quoted;
        prev_sig = '"';
        newline_since = false;
        i = j;
        continue;
      }
    }
    CharState st = sc.advance(c);
    if (st == CharState::CloseQuote) {
      prev_sig = '"';
      newline_since = false;
    } else if (st == CharState::Structural && c == '\n') {
      newline_since = true;
    } else if (st == CharState::Structural && !detail::is_ws(c)) {
      prev_sig = c;
      newline_since = false;
    }
    out.push_back(c);
    ++i;
  }

  if (quoted == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Quoted", quoted, "unquoted property name"));
}

}  // namespace llm_json_repair
