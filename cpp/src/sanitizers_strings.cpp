#include "internal.hpp"

#include <algorithm>
#include <initializer_list>

namespace llm_json_repair {

using detail::changed_to;
using detail::unchanged;

// ---------------- Concatenation chains ----------------

namespace {

enum class TokenKind {
  Literal,     // "..."
  Identifier,  // BASE_PATH, path.join(...), process.env.HOME
  Number,
  Plus,
  Other,
};

struct Token {
  TokenKind kind;
  size_t begin;
  size_t end;
};

size_t skip_string(const std::string& s, size_t open) {
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
  return s.size();
}

// Identifier with member access and call arguments: path.join(__dirname, "x")
size_t skip_identifier(const std::string& s, size_t i) {
  while (i < s.size()) {
    char c = s[i];
    if (detail::is_ident_char(c) || c == '.') {
      ++i;
    } else if (c == '(') {
      int depth = 0;
      while (i < s.size()) {
        if (s[i] == '"') {
          i = skip_string(s, i);
          continue;
        }
        if (s[i] == '(') ++depth;
        if (s[i] == ')' && --depth == 0) {
          ++i;
          break;
        }
        ++i;
      }
    } else {
      break;
    }
  }
  return i;
}

size_t skip_number(const std::string& s, size_t i) {
  if (i < s.size() && s[i] == '-') ++i;
  while (i < s.size() && (detail::is_digit(s[i]) || s[i] == '.')) ++i;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    while (i < s.size() && detail::is_digit(s[i])) ++i;
  }
  return i;
}

std::vector<Token> tokenize(const std::string& s) {
  std::vector<Token> tokens;
  size_t i = 0;
  while (i < s.size()) {
    char c = s[i];
    if (detail::is_ws(c)) {
      ++i;
    } else if (c == '"') {
      size_t e = skip_string(s, i);
      tokens.push_back({TokenKind::Literal, i, e});
      i = e;
    } else if (detail::is_ident_start(c)) {
      size_t e = skip_identifier(s, i);
      tokens.push_back({TokenKind::Identifier, i, e});
      i = e;
    } else if (detail::is_digit(c) || (c == '-' && i + 1 < s.size() && detail::is_digit(s[i + 1]))) {
      size_t e = skip_number(s, i);
      tokens.push_back({TokenKind::Number, i, e});
      i = e;
    } else {
      tokens.push_back({c == '+' ? TokenKind::Plus : TokenKind::Other, i, i + 1});
      ++i;
    }
  }
  return tokens;
}

bool is_operand(const Token& t) { return t.kind == TokenKind::Literal || t.kind == TokenKind::Identifier; }

bool other_is(const std::string& s, const Token& t, const char* set) {
  return t.kind == TokenKind::Other && std::string(set).find(s[t.begin]) != std::string::npos;
}

struct Replacement {
  size_t begin;
  size_t end;
  std::string text;
};

// One pass; returns the rewritten chains, last first.
std::vector<Replacement> find_chains(const std::string& s, std::vector<std::string>& diagnostics) {
  std::vector<Replacement> out;
  auto tokens = tokenize(s);
  size_t k = 0;
  while (k < tokens.size()) {
    if (!is_operand(tokens[k])) {
      ++k;
      continue;
    }
    size_t last = k;
    while (last + 2 < tokens.size() && tokens[last + 1].kind == TokenKind::Plus && is_operand(tokens[last + 2])) {
      last += 2;
    }
    if (last == k) {
      ++k;
      continue;
    }

    // Only chains in value position: after ':' '[' ',' (or at the start) and before ',' '}' ']' (or the end).
    bool value_before = k == 0 || other_is(s, tokens[k - 1], ":[,");
    bool value_after = last + 1 == tokens.size() || other_is(s, tokens[last + 1], ",}]");
    if (!value_before || !value_after) {
      k = last + 1;
      continue;
    }

    std::vector<const Token*> literals;
    for (size_t t = k; t <= last; t += 2) {
      if (tokens[t].kind == TokenKind::Literal) literals.push_back(&tokens[t]);
    }
    const size_t operands = (last - k) / 2 + 1;

    std::string replacement;
    if (literals.empty()) {
      replacement = "\"\"";
    } else if (literals.size() == operands) {
      replacement = "\"";
      for (const Token* lit : literals) {
        if (lit->end - lit->begin >= 2 && s[lit->end - 1] == '"') {
          replacement.append(s, lit->begin + 1, lit->end - lit->begin - 2);
        }
      }
      replacement += "\"";
    } else {
      // Mixed chain: keep the longest literal, the first one on ties.
      const Token* best = literals.front();
      for (const Token* lit : literals) {
        if (lit->end - lit->begin > best->end - best->begin) best = lit;
      }
      replacement = s.substr(best->begin, best->end - best->begin);
    }

    diagnostics.push_back("Collapsed '" + s.substr(tokens[k].begin, tokens[last].end - tokens[k].begin) + "' to " +
                          replacement);
    out.push_back({tokens[k].begin, tokens[last].end, std::move(replacement)});
    k = last + 1;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

}  // namespace

SanitizerResult normalize_concatenation_chains(const std::string& text) {
  std::string cur = text;
  std::vector<std::string> diagnostics;
  for (int pass = 0; pass < kMaxRepairPasses; ++pass) {
    auto chains = find_chains(cur, diagnostics);
    if (chains.empty()) break;
    for (const auto& r : chains) cur.replace(r.begin, r.end - r.begin, r.text);
  }
  if (diagnostics.empty()) return unchanged(text);
  SanitizerResult r =
      changed_to(std::move(cur), detail::count_message("Normalized", diagnostics.size(), "concatenation chain"));
  r.diagnostics = std::move(diagnostics);
  return r;
}

// ---------------- Escape sequences ----------------

static bool is_hex4(const std::string& s, size_t i) {
  if (i + 4 > s.size()) return false;
  for (size_t k = i; k < i + 4; ++k) {
    if (!std::isxdigit(static_cast<unsigned char>(s[k]))) return false;
  }
  return true;
}

SanitizerResult fix_over_escaped_sequences(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 8);
  bool in_string = false;
  size_t over_escaped = 0;
  size_t invalid = 0;

  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (!in_string) {
      if (c == '"') in_string = true;
      out.push_back(c);
      ++i;
      continue;
    }
    if (c == '"') {
      in_string = false;
      out.push_back(c);
      ++i;
      continue;
    }
    if (c != '\\') {
      out.push_back(c);
      ++i;
      continue;
    }

    size_t run = 0;
    while (i + run < text.size() && text[i + run] == '\\') ++run;
    const size_t next = i + run;

    if (next >= text.size()) {
      // Dangling backslashes at end of input become literal backslashes.
      out.append(run, '\\');
      if (run % 2 == 1) {
        out.push_back('\\');
        ++invalid;
      }
      i = next;
      continue;
    }

    const char e = text[next];
    if (e == '\'' && run % 2 == 1) {
      // \' is a plain apostrophe; \\\' keeps its escaped backslash
      out.append(run - 1, '\\');
      out.push_back('\'');
      ++over_escaped;
      i = next + 1;
      continue;
    }
    if (e == '"' && (run == 3 || run == 5)) {
      out += "\\\"";
      ++over_escaped;
      i = next + 1;
      continue;
    }

    out.append(run - run % 2, '\\');
    i = next;
    if (run % 2 == 0) continue;  // escaped backslashes; `e` is ordinary content

    switch (e) {
      case '"':
      case '/':
      case 'b':
      case 'f':
      case 'n':
      case 'r':
      case 't':
        out.push_back('\\');
        out.push_back(e);
        i = next + 1;
        break;
      case 'u':
        if (is_hex4(text, next + 1)) {
          out.append(text, next - 1, 6);
          i = next + 5;
        } else {
          out += "\\\\u";
          ++invalid;
          i = next + 1;
        }
        break;
      case ' ':
      case ',':
      case ')':
        out.push_back(e);  // escaped punctuation
        ++over_escaped;
        i = next + 1;
        break;
      default:
        // \x, \0, \a, \v, ...: keep the backslash as a literal one
        out += "\\\\";
        ++invalid;
        break;
    }
  }

  if (over_escaped == 0 && invalid == 0) return unchanged(text);
  SanitizerResult r;
  r.content = std::move(out);
  r.changed = true;
  if (over_escaped > 0) r.diagnostics.push_back(detail::count_message("Repaired", over_escaped, "over-escaped sequence"));
  if (invalid > 0) r.diagnostics.push_back(detail::count_message("Fixed", invalid, "invalid escape sequence"));
  r.description = r.diagnostics.front();
  return r;
}

// ---------------- Bare words ----------------

namespace {

struct WordRewrite {
  const char* from;
  const char* to;
};

// Rewrites whole identifiers outside strings; returns how many were replaced.
size_t rewrite_bare_words(const std::string& text, std::initializer_list<WordRewrite> words, std::string& out) {
  out.clear();
  out.reserve(text.size());
  StringScanner sc;
  size_t replaced = 0;

  for (size_t i = 0; i < text.size();) {
    if (!sc.in_string() && !sc.escaped() && detail::is_ident_start(text[i]) &&
        (i == 0 || !detail::is_ident_char(text[i - 1]))) {
      size_t j = i;
      while (j < text.size() && detail::is_ident_char(text[j])) ++j;
      const WordRewrite* hit = nullptr;
      for (const auto& w : words) {
        if (text.compare(i, j - i, w.from) == 0) hit = &w;
      }
      if (hit) {
        out += hit->to;
        ++replaced;
      } else {
        out.append(text, i, j - i);
      }
      i = j;
      continue;
    }
    sc.advance(text[i]);
    out.push_back(text[i]);
    ++i;
  }
  return replaced;
}

}  // namespace

SanitizerResult fix_undefined_values(const std::string& text) {
  std::string out;
  size_t replaced = rewrite_bare_words(text, {{"undefined", "null"}}, out);
  if (replaced == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Replaced", replaced, "undefined value") + " with null");
}

SanitizerResult replace_python_literals(const std::string& text) {
  std::string out;
  size_t replaced = rewrite_bare_words(text, {{"True", "true"}, {"False", "false"}, {"None", "null"}}, out);
  if (replaced == 0) return unchanged(text);
  return changed_to(std::move(out), detail::count_message("Replaced", replaced, "Python literal"));
}

}  // namespace llm_json_repair
