#include "internal.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace llm_json_repair {

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

const char* Json::type_name() const {
  if (is_null()) return "null";
  if (is_bool()) return "boolean";
  if (is_number()) return "number";
  if (is_string()) return "string";
  if (is_array()) return "array";
  return "object";
}

bool operator==(const Json& a, const Json& b) {
  if (a.value.index() != b.value.index()) return false;
  if (a.is_null()) return true;
  if (a.is_bool()) return a.as_bool() == b.as_bool();
  if (a.is_number()) return a.as_number() == b.as_number();
  if (a.is_string()) return a.as_string() == b.as_string();
  if (a.is_array()) {
    const auto& x = a.as_array();
    const auto& y = b.as_array();
    if (x.size() != y.size()) return false;
    for (size_t i = 0; i < x.size(); ++i) {
      if (!(x[i] == y[i])) return false;
    }
    return true;
  }
  const auto& x = a.as_object();
  const auto& y = b.as_object();
  if (x.size() != y.size()) return false;
  auto it = y.begin();
  for (const auto& kv : x) {
    if (kv.first != it->first || !(kv.second == it->second)) return false;
    ++it;
  }
  return true;
}

bool operator!=(const Json& a, const Json& b) { return !(a == b); }

// ---------------- Serialization ----------------

namespace detail {

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          unsigned char u = static_cast<unsigned char>(c);
          out += "\\u00";
          out.push_back(hex[u >> 4]);
          out.push_back(hex[u & 0x0f]);
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

}  // namespace detail

static std::string format_number(double n) {
  if (!std::isfinite(n)) return "null";
  double intpart;
  if (std::modf(n, &intpart) == 0.0 && std::fabs(n) < 1e17) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(0);
    oss << n;
    return oss.str();
  }
  // Shortest of the two precisions that still reads back exactly.
  std::ostringstream oss;
  oss.precision(15);
  oss << n;
  if (std::strtod(oss.str().c_str(), nullptr) == n) return oss.str();
  std::ostringstream precise;
  precise.precision(17);
  precise << n;
  return precise.str();
}

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) return format_number(value.as_number());
  if (value.is_string()) return "\"" + detail::json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    out += "]";
    return out;
  }
  const auto& obj = value.as_object();
  std::string out = "{";
  bool first = true;
  for (const auto& kv : obj) {
    if (!first) out += ",";
    first = false;
    out += "\"" + detail::json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  out += "}";
  return out;
}

// ---------------- Strict parser ----------------

namespace {

constexpr int kMaxNestingDepth = 512;

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};

  explicit Parser(const std::string& in) : s(in) {}

  // JSON whitespace only; \f and \v are not allowed between tokens.
  void skip_ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const { throw JsonParseError(msg, i); }

  bool consume(char c) {
    skip_ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  Json parse_value() {
    skip_ws();
    if (i >= s.size()) fail("unexpected end of input");
    char c = s[i];
    if (c == '{') return parse_object();
    if (c == '[') return parse_array();
    if (c == '"') return Json(parse_string());
    if (c == 't') return parse_literal("true", Json(true));
    if (c == 'f') return parse_literal("false", Json(false));
    if (c == 'n') return parse_literal("null", Json(nullptr));
    if (c == '-' || detail::is_digit(c)) return Json(parse_number());
    fail(std::string("unexpected character '") + c + "'");
  }

  void enter() {
    if (++depth > kMaxNestingDepth) fail("nesting too deep");
  }

  Json parse_object() {
    enter();
    ++i;  // '{'
    JsonObject obj;
    if (consume('}')) {
      --depth;
      return Json(std::move(obj));
    }
    while (true) {
      skip_ws();
      if (i >= s.size()) fail("unterminated object");
      if (s[i] != '"') fail("expected string key");
      std::string key = parse_string();
      if (!consume(':')) fail("expected ':' after key");
      Json val = parse_value();
      obj[std::move(key)] = std::move(val);
      if (consume('}')) break;
      if (!consume(',')) fail(i >= s.size() ? "unterminated object" : "expected ',' or '}'");
    }
    --depth;
    return Json(std::move(obj));
  }

  Json parse_array() {
    enter();
    ++i;  // '['
    JsonArray arr;
    if (consume(']')) {
      --depth;
      return Json(std::move(arr));
    }
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      if (!consume(',')) fail(i >= s.size() ? "unterminated array" : "expected ',' or ']'");
    }
    --depth;
    return Json(std::move(arr));
  }

  unsigned read_hex4() {
    if (i + 4 > s.size()) fail("truncated unicode escape");
    unsigned v = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      v <<= 4;
      if (h >= '0' && h <= '9') {
        v |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        v |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        v |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        --i;
        fail("invalid unicode escape");
      }
    }
    return v;
  }

  static void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string parse_string() {
    ++i;  // opening quote
    std::string out;
    while (i < s.size()) {
      char c = s[i];
      if (c == '"') {
        ++i;
        return out;
      }
      if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
      ++i;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size()) fail("unterminated string");
      char e = s[i++];
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          unsigned cp = read_hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            size_t save = i;
            i += 2;
            unsigned lo = read_hex4();
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              i = save;
            }
          }
          append_utf8(out, cp);
          break;
        }
        default:
          i -= 1;
          fail(std::string("invalid escape '\\") + e + "'");
      }
    }
    fail("unterminated string");
  }

  double parse_number() {
    size_t start = i;
    if (s[i] == '-') ++i;
    if (i >= s.size() || !detail::is_digit(s[i])) fail("invalid number");
    if (s[i] == '0') {
      ++i;
      if (i < s.size() && detail::is_digit(s[i])) fail("leading zero in number");
    } else {
      while (i < s.size() && detail::is_digit(s[i])) ++i;
    }
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (i >= s.size() || !detail::is_digit(s[i])) fail("expected digit after decimal point");
      while (i < s.size() && detail::is_digit(s[i])) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !detail::is_digit(s[i])) fail("expected digit in exponent");
      while (i < s.size() && detail::is_digit(s[i])) ++i;
    }
    std::string num = s.substr(start, i - start);
    return std::strtod(num.c_str(), nullptr);
  }

  Json parse_literal(const char* word, Json v) {
    std::string w(word);
    if (s.compare(i, w.size(), w) != 0) fail("invalid literal, expected " + w);
    i += w.size();
    return v;
  }
};

}  // namespace

Json parse_json(const std::string& text) {
  Parser p(text);
  Json v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("unexpected trailing data");
  return v;
}

}  // namespace llm_json_repair
