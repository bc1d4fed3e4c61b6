#include "internal.hpp"

#include <set>

namespace llm_json_repair {

using detail::changed_to;
using detail::unchanged;

// ---------------- Fences and preamble ----------------

SanitizerResult remove_code_fences(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  StringScanner sc;
  size_t fences = 0;

  for (size_t i = 0; i < text.size();) {
    if (!sc.in_string() && !sc.escaped() && text.compare(i, 3, "```") == 0) {
      while (i < text.size() && text[i] == '`') ++i;
      // language tag glued to the fence: ```json, ```JSON, ```javascript
      while (i < text.size() && std::isalnum(static_cast<unsigned char>(text[i]))) ++i;
      ++fences;
      continue;
    }
    sc.advance(text[i]);
    out.push_back(text[i]);
    ++i;
  }

  std::vector<std::string> diagnostics;
  if (fences > 0) diagnostics.push_back(detail::count_message("Removed", fences, "code fence marker"));

  // Prose before the first opener ("Here is the JSON you asked for:").
  auto open = find_json_opener(out);
  if (open && *open > 0) {
    bool prose = false;
    for (size_t i = 0; i < *open; ++i) {
      if (!detail::is_ws(out[i])) {
        prose = true;
        break;
      }
    }
    if (prose) {
      diagnostics.push_back(detail::count_message("Removed", *open, "character") + " of leading prose");
      out.erase(0, *open);
    }
  }

  if (diagnostics.empty()) return unchanged(text);
  SanitizerResult r = changed_to(std::move(out), fences > 0 ? "Removed code fences" : "Removed leading prose");
  r.diagnostics = std::move(diagnostics);
  return r;
}

// ---------------- Control characters and curly quotes ----------------

namespace {

enum class Special {
  None,
  ZeroWidth,
  LeftCurly,
  RightCurly,
};

// Recognizes the multi-byte sequences this stage cares about; `len` receives the byte count.
Special classify_utf8(const std::string& s, size_t i, size_t& len) {
  len = 1;
  auto at = [&](size_t k) { return static_cast<unsigned char>(s[i + k]); };
  if (i + 3 > s.size()) return Special::None;
  if (at(0) == 0xE2 && at(1) == 0x80) {
    unsigned char b = at(2);
    len = 3;
    if (b == 0x8B || b == 0x8C || b == 0x8D) return Special::ZeroWidth;  // U+200B..U+200D
    if (b == 0x9C) return Special::LeftCurly;                            // U+201C
    if (b == 0x9D) return Special::RightCurly;                           // U+201D
  }
  if (at(0) == 0xE2 && at(1) == 0x81 && at(2) == 0xA0) {
    len = 3;
    return Special::ZeroWidth;  // U+2060
  }
  if (at(0) == 0xEF && at(1) == 0xBB && at(2) == 0xBF) {
    len = 3;
    return Special::ZeroWidth;  // BOM
  }
  len = 1;
  return Special::None;
}

void append_control_escape(std::string& out, unsigned char c) {
  switch (c) {
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    default: {
      static const char* hex = "0123456789abcdef";
      out += "\\u00";
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0f]);
    }
  }
}

bool is_member_end(const std::string& s, size_t i) {
  size_t k = detail::skip_ws(s, i);
  return k >= s.size() || s[k] == ':' || s[k] == ',' || s[k] == '}' || s[k] == ']';
}

// {"name”: "Acme"}: a curly quote ends an ASCII-opened string when it is followed by
// structure and the next ASCII quote does not itself end the string.
bool curly_closes_string(const std::string& s, size_t after) {
  if (!is_member_end(s, after)) return false;
  bool escape = false;
  for (size_t k = after; k < s.size(); ++k) {
    if (escape) {
      escape = false;
    } else if (s[k] == '\\') {
      escape = true;
    } else if (s[k] == '"') {
      return !is_member_end(s, k + 1);
    }
  }
  return true;
}

}  // namespace

SanitizerResult remove_control_chars(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  // A string is either ASCII-quoted or was opened by a curly quote acting as a delimiter.
  bool in_string = false;
  bool curly = false;
  bool escape = false;
  size_t removed = 0;
  size_t escaped = 0;
  size_t quotes = 0;

  for (size_t i = 0; i < text.size();) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    size_t len = 1;
    Special sp = classify_utf8(text, i, len);

    if (!in_string) {
      if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F || sp == Special::ZeroWidth) {
        ++removed;
        i += len;
        continue;
      }
      if (sp == Special::LeftCurly || sp == Special::RightCurly) {
        out.push_back('"');
        in_string = true;
        curly = true;
        ++quotes;
        i += len;
        continue;
      }
      if (c == '"') {
        in_string = true;
        curly = false;
      }
      out.append(text, i, len);
      i += len;
      continue;
    }

    if (c < 0x20) {
      append_control_escape(out, c);
      escape = false;
      ++escaped;
      ++i;
      continue;
    }
    if (escape) {
      escape = false;
      out.append(text, i, len);
      i += len;
      continue;
    }
    if (c == '\\') {
      escape = true;
      out.push_back('\\');
      ++i;
      continue;
    }
    if (curly) {
      if (sp == Special::LeftCurly || sp == Special::RightCurly) {
        out.push_back('"');
        in_string = false;
        curly = false;
        ++quotes;
        i += len;
        continue;
      }
      if (c == '"') {
        out += "\\\"";
        ++i;
        continue;
      }
    } else if (c == '"') {
      in_string = false;
    } else if ((sp == Special::LeftCurly || sp == Special::RightCurly) && curly_closes_string(text, i + len)) {
      out.push_back('"');
      in_string = false;
      ++quotes;
      i += len;
      continue;
    }
    out.append(text, i, len);
    i += len;
  }

  if (removed == 0 && escaped == 0 && quotes == 0) return unchanged(text);
  SanitizerResult r;
  r.content = std::move(out);
  r.changed = true;
  if (removed > 0) r.diagnostics.push_back(detail::count_message("Removed", removed, "control/zero-width character"));
  if (escaped > 0) r.diagnostics.push_back(detail::count_message("Escaped", escaped, "control character") + " inside strings");
  if (quotes > 0) r.diagnostics.push_back(detail::count_message("Normalized", quotes, "curly quote"));
  r.description = r.diagnostics.front();
  return r;
}

// ---------------- Single quotes ----------------

namespace {

// Byte length of a ' or a U+2018/U+2019 quote at `i`, 0 otherwise.
size_t single_quote_at(const std::string& s, size_t i) {
  if (s[i] == '\'') return 1;
  if (i + 3 <= s.size() && static_cast<unsigned char>(s[i]) == 0xE2 && static_cast<unsigned char>(s[i + 1]) == 0x80 &&
      (static_cast<unsigned char>(s[i + 2]) == 0x98 || static_cast<unsigned char>(s[i + 2]) == 0x99)) {
    return 3;
  }
  return 0;
}

// First quote after `from` on the same line that is followed by structure; inner apostrophes are skipped.
std::optional<JsonSpan> find_single_quote_close(const std::string& s, size_t from) {
  for (size_t k = from; k < s.size(); ++k) {
    if (s[k] == '\n') return std::nullopt;
    if (s[k] == '\\') {
      ++k;
      continue;
    }
    size_t len = single_quote_at(s, k);
    if (len > 0 && is_member_end(s, k + len)) return JsonSpan{k, k + len};
  }
  return std::nullopt;
}

}  // namespace

SanitizerResult normalize_single_quotes(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 8);
  StringScanner sc;
  char prev_sig = 0;
  size_t converted = 0;

  for (size_t i = 0; i < text.size();) {
    const char c = text[i];
    const bool value_position = prev_sig == 0 || prev_sig == '{' || prev_sig == '[' || prev_sig == ',' || prev_sig == ':';
    const size_t open_len = sc.in_string() ? 0 : single_quote_at(text, i);
    if (open_len > 0 && value_position) {
      auto close = find_single_quote_close(text, i + open_len);
      if (close) {
        out.push_back('"');
        for (size_t k = i + open_len; k < close->begin; ++k) {
          if (text[k] == '\\' && k + 1 < close->begin) {
            if (text[k + 1] != '\'') out.push_back('\\');
            out.push_back(text[++k]);
          } else if (text[k] == '"') {
            out += "\\\"";
          } else {
            out.push_back(text[k]);
          }
        }
        out.push_back('"');
        prev_sig = '"';
        ++converted;
        i = close->end;
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

  if (converted == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Converted", converted, "single-quoted string"));
}

// ---------------- Comments ----------------

SanitizerResult strip_json_comments(const std::string& text) {
  // Removes //... and /*...*/ outside string literals.
  std::string out;
  out.reserve(text.size());
  StringScanner sc;
  size_t removed = 0;

  for (size_t i = 0; i < text.size();) {
    const char c = text[i];
    if (!sc.in_string() && c == '/' && i + 1 < text.size() && (text[i + 1] == '/' || text[i + 1] == '*')) {
      if (text[i + 1] == '/') {
        size_t nl = text.find('\n', i);
        i = nl == std::string::npos ? text.size() : nl;
      } else {
        size_t close = text.find("*/", i + 2);
        i = close == std::string::npos ? text.size() : close + 2;
      }
      ++removed;
      continue;
    }
    sc.advance(c);
    out.push_back(c);
    ++i;
  }

  if (removed == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Removed", removed, "comment"));
}

// ---------------- Span extraction ----------------

SanitizerResult extract_largest_json_span(const std::string& text) {
  auto span = find_json_span(text);
  if (!span) return unchanged(text);

  // Another top-level value right behind the span is left for the duplicate/disjoint checks.
  size_t after = detail::skip_ws(text, span->end);
  if (after < text.size() && (text[after] == '{' || text[after] == '[') && find_balanced_span_at(text, after)) {
    return unchanged(text);
  }

  std::string sliced = detail::trim_copy(text.substr(span->begin, span->end - span->begin));
  if (sliced == detail::trim_copy(text)) return unchanged(text);

  SanitizerResult r = changed_to(sliced, "Extracted JSON span from surrounding text");
  r.diagnostics.push_back("Kept bytes [" + std::to_string(span->begin) + ", " + std::to_string(span->end) + ") of " +
                          std::to_string(text.size()));
  return r;
}

// ---------------- Schema envelope ----------------

Json unwrap_json_schema_structure(const Json& value) {
  if (!value.is_object()) return value;
  const auto& obj = value.as_object();

  auto it_type = obj.find("type");
  if (it_type == obj.end() || !it_type->second.is_string() || it_type->second.as_string() != "object") return value;
  auto it_props = obj.find("properties");
  if (it_props == obj.end() || !it_props->second.is_object() || it_props->second.as_object().empty()) return value;

  // Schema bookkeeping may ride along; any other key means this is real data.
  static const std::set<std::string> kEnvelopeKeys = {
      "type", "properties", "required", "description", "title", "$schema", "$id", "additionalProperties",
  };
  for (const auto& kv : obj) {
    if (kEnvelopeKeys.count(kv.first) == 0) return value;
  }
  return it_props->second;
}

SanitizerResult unwrap_json_schema(const std::string& text) {
  std::string trimmed = detail::trim_copy(text);
  if (trimmed.empty() || trimmed[0] != '{') return unchanged(text);

  Json parsed;
  try {
    parsed = parse_json(trimmed);
  } catch (const JsonParseError&) {
    return unchanged(text);  // later stages may still repair it
  }
  Json unwrapped = unwrap_json_schema_structure(parsed);
  if (unwrapped == parsed) return unchanged(text);
  return changed_to(dumps_json(unwrapped), "Unwrapped schema-shaped envelope into its properties");
}

// ---------------- Duplicate top-level object ----------------

SanitizerResult collapse_duplicate_json_object(const std::string& text) {
  // Consecutive top-level values; prose after the last one ("Hope this helps") is dropped with it.
  std::vector<JsonSpan> spans;
  size_t i = detail::skip_ws(text, 0);
  while (i < text.size() && (text[i] == '{' || text[i] == '[')) {
    auto span = find_balanced_span_at(text, i);
    if (!span) return unchanged(text);
    spans.push_back(*span);
    i = detail::skip_ws(text, span->end);
  }
  if (spans.size() < 2 || text[spans[0].begin] != '{') return unchanged(text);
  if (i < text.size() && find_json_opener(text, i)) return unchanged(text);

  const std::string first = text.substr(spans[0].begin, spans[0].end - spans[0].begin);
  for (size_t k = 1; k < spans.size(); ++k) {
    if (text.compare(spans[k].begin, spans[k].end - spans[k].begin, first) != 0) return unchanged(text);
  }
  return changed_to(first, detail::count_message("Collapsed", spans.size() - 1, "duplicate top-level object"));
}

// ---------------- Whitespace ----------------

SanitizerResult trim_whitespace(const std::string& text) {
  std::string trimmed = detail::trim_copy(text);
  if (trimmed == text) return unchanged(text);
  return changed_to(std::move(trimmed), "Trimmed surrounding whitespace");
}

}  // namespace llm_json_repair
