#include "internal.hpp"

#include <cmath>
#include <regex>

namespace llm_json_repair {

// ---------------- JSON schema validation (subset) ----------------

namespace {

std::optional<double> number_field(const JsonObject& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_number()) return std::nullopt;
  return it->second.as_number();
}

const Json* field(const JsonObject& obj, const char* key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

const JsonArray* array_field(const JsonObject& obj, const char* key) {
  const Json* v = field(obj, key);
  return v && v->is_array() ? &v->as_array() : nullptr;
}

bool is_integral(double n) {
  double ip;
  return std::isfinite(n) && std::fabs(std::modf(n, &ip)) < 1e-12;
}

bool matches_type(const Json& value, const std::string& type) {
  if (type == "null") return value.is_null();
  if (type == "boolean") return value.is_bool();
  if (type == "number") return value.is_number();
  if (type == "integer") return value.is_number() && is_integral(value.as_number());
  if (type == "string") return value.is_string();
  if (type == "array") return value.is_array();
  if (type == "object") return value.is_object();
  return true;  // unknown type names do not constrain
}

// Collects every issue instead of stopping at the first one.
class SchemaValidator {
 public:
  explicit SchemaValidator(std::vector<ValidationError>& issues) : issues_(issues) {}

  void check(const Json& value, const Json& schema, const std::string& path) {
    if (!schema.is_object()) {
      report("schema must be an object", path, "schema");
      return;
    }
    const JsonObject& sch = schema.as_object();
    check_combinators(value, sch, path);
    check_enum_const(value, sch, path);
    if (!check_type(value, sch, path)) return;
    if (value.is_number()) check_number(value.as_number(), sch, path);
    if (value.is_string()) check_string(value.as_string(), sch, path);
    if (value.is_array()) check_array(value.as_array(), sch, path);
    if (value.is_object()) check_object(value.as_object(), sch, path);
  }

 private:
  std::vector<ValidationError>& issues_;

  void report(std::string message, const std::string& path, const char* kind = "schema") {
    issues_.emplace_back(std::move(message), path, kind);
  }

  static bool passes(const Json& value, const Json& schema, const std::string& path) {
    std::vector<ValidationError> scratch;
    SchemaValidator sub(scratch);
    sub.check(value, schema, path);
    return scratch.empty();
  }

  void check_combinators(const Json& value, const JsonObject& sch, const std::string& path) {
    if (const JsonArray* all = array_field(sch, "allOf")) {
      for (const auto& sub : *all) check(value, sub, path);
    }
    if (const JsonArray* any = array_field(sch, "anyOf")) {
      bool ok = false;
      for (const auto& sub : *any) {
        if (passes(value, sub, path)) {
          ok = true;
          break;
        }
      }
      if (!ok) report("does not match anyOf", path);
    }
    if (const JsonArray* one = array_field(sch, "oneOf")) {
      int matched = 0;
      for (const auto& sub : *one) {
        if (passes(value, sub, path)) ++matched;
      }
      if (matched != 1) report("matches " + std::to_string(matched) + " oneOf branches, expected exactly 1", path);
    }
    if (const Json* no = field(sch, "not")) {
      if (no->is_object() && passes(value, *no, path)) report("must not match schema in 'not'", path);
    }
  }

  void check_enum_const(const Json& value, const JsonObject& sch, const std::string& path) {
    if (const Json* c = field(sch, "const")) {
      if (value != *c) report("value does not match const " + dumps_json(*c), path);
    }
    if (const JsonArray* e = array_field(sch, "enum")) {
      for (const auto& allowed : *e) {
        if (value == allowed) return;
      }
      report("value " + dumps_json(value) + " not in enum", path);
    }
  }

  // False when the type is wrong; the type-specific keywords are then skipped.
  bool check_type(const Json& value, const JsonObject& sch, const std::string& path) {
    const Json* t = field(sch, "type");
    if (!t) return true;
    if (value.is_null()) {
      const Json* nullable = field(sch, "nullable");
      if (nullable && nullable->is_bool() && nullable->as_bool()) return true;
    }

    std::vector<std::string> allowed;
    if (t->is_string()) {
      allowed.push_back(t->as_string());
    } else if (t->is_array()) {
      for (const auto& item : t->as_array()) {
        if (item.is_string()) allowed.push_back(item.as_string());
      }
    }
    if (allowed.empty()) return true;
    for (const auto& name : allowed) {
      if (matches_type(value, name)) return true;
    }

    std::string expected = allowed.front();
    for (size_t k = 1; k < allowed.size(); ++k) expected += " | " + allowed[k];
    report("expected " + expected + ", got " + value.type_name(), path, "type");
    return false;
  }

  void check_number(double n, const JsonObject& sch, const std::string& path) {
    if (auto mn = number_field(sch, "minimum")) {
      if (n < *mn) report("number < minimum", path, "limit");
    }
    if (auto mx = number_field(sch, "maximum")) {
      if (n > *mx) report("number > maximum", path, "limit");
    }
    if (auto mn = number_field(sch, "exclusiveMinimum")) {
      if (n <= *mn) report("number <= exclusiveMinimum", path, "limit");
    }
    if (auto mx = number_field(sch, "exclusiveMaximum")) {
      if (n >= *mx) report("number >= exclusiveMaximum", path, "limit");
    }
    if (auto mul = number_field(sch, "multipleOf")) {
      if (*mul > 0.0) {
        double q = n / *mul;
        if (!std::isfinite(q) || std::fabs(q - std::round(q)) > 1e-9) report("number is not a multipleOf", path, "limit");
      }
    }
  }

  void check_string(const std::string& s, const JsonObject& sch, const std::string& path) {
    if (auto mn = number_field(sch, "minLength")) {
      if (static_cast<double>(s.size()) < *mn) report("string shorter than minLength", path, "limit");
    }
    if (auto mx = number_field(sch, "maxLength")) {
      if (static_cast<double>(s.size()) > *mx) report("string longer than maxLength", path, "limit");
    }
    const Json* pat = field(sch, "pattern");
    if (pat && pat->is_string()) {
      try {
        if (!std::regex_search(s, std::regex(pat->as_string(), std::regex::ECMAScript))) {
          report("string does not match pattern " + pat->as_string(), path);
        }
      } catch (const std::regex_error&) {
        report("invalid pattern regex: " + pat->as_string(), path, "schema");
      }
    }
    const Json* fmt = field(sch, "format");
    if (fmt && fmt->is_string()) check_format(s, fmt->as_string(), path);
  }

  void check_format(const std::string& s, const std::string& fmt, const std::string& path) {
    static const std::regex kEmail(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
    static const std::regex kUuid(R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)");
    static const std::regex kDateTime(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})$)");
    static const std::regex kDate(R"(^\d{4}-\d{2}-\d{2}$)");
    static const std::regex kUri(R"(^[A-Za-z][A-Za-z0-9+.-]*:[^\s]*$)");

    const std::regex* r = nullptr;
    if (fmt == "email") r = &kEmail;
    if (fmt == "uuid") r = &kUuid;
    if (fmt == "date-time") r = &kDateTime;
    if (fmt == "date") r = &kDate;
    if (fmt == "uri") r = &kUri;
    if (r && !std::regex_match(s, *r)) report("string does not match " + fmt + " format", path);
  }

  void check_array(const JsonArray& arr, const JsonObject& sch, const std::string& path) {
    if (auto mn = number_field(sch, "minItems")) {
      if (static_cast<double>(arr.size()) < *mn) report("array shorter than minItems", path, "limit");
    }
    if (auto mx = number_field(sch, "maxItems")) {
      if (static_cast<double>(arr.size()) > *mx) report("array longer than maxItems", path, "limit");
    }
    const Json* unique = field(sch, "uniqueItems");
    if (unique && unique->is_bool() && unique->as_bool()) {
      bool dup = false;
      for (size_t a = 0; a < arr.size() && !dup; ++a) {
        for (size_t b = a + 1; b < arr.size(); ++b) {
          if (arr[a] == arr[b]) {
            report("array items are not unique", path + "[" + std::to_string(b) + "]");
            dup = true;
            break;
          }
        }
      }
    }
    const Json* items = field(sch, "items");
    if (items && items->is_object()) {
      for (size_t idx = 0; idx < arr.size(); ++idx) check(arr[idx], *items, path + "[" + std::to_string(idx) + "]");
    }
  }

  void check_object(const JsonObject& obj, const JsonObject& sch, const std::string& path) {
    if (auto mn = number_field(sch, "minProperties")) {
      if (static_cast<double>(obj.size()) < *mn) report("object has fewer properties than minProperties", path, "limit");
    }
    if (auto mx = number_field(sch, "maxProperties")) {
      if (static_cast<double>(obj.size()) > *mx) report("object has more properties than maxProperties", path, "limit");
    }

    if (const JsonArray* req = array_field(sch, "required")) {
      for (const auto& k : *req) {
        if (k.is_string() && obj.find(k.as_string()) == obj.end()) {
          report("missing required property: " + k.as_string(), path + "." + k.as_string());
        }
      }
    }

    const Json* props = field(sch, "properties");
    if (props && !props->is_object()) props = nullptr;
    const Json* additional = field(sch, "additionalProperties");

    for (const auto& kv : obj) {
      const std::string child = path + "." + kv.first;
      if (props) {
        auto it = props->as_object().find(kv.first);
        if (it != props->as_object().end()) {
          check(kv.second, it->second, child);
          continue;
        }
      }
      if (!additional) continue;
      if (additional->is_bool() && !additional->as_bool()) {
        report("additionalProperties forbidden: " + kv.first, child);
      } else if (additional->is_object()) {
        check(kv.second, *additional, child);
      }
    }
  }
};

}  // namespace

std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path) {
  std::vector<ValidationError> issues;
  SchemaValidator validator(issues);
  validator.check(value, schema, path);
  return issues;
}

bool is_generated_content(const Json& value) {
  return value.is_string() || value.is_array() || value.is_object() || value.is_null();
}

ValidationResult validate_response(const Json& value, const ProcessingContext& context) {
  ValidationResult result;
  if (context.output_format == OutputFormat::Json && context.schema) {
    result.issues = validate_all(value, *context.schema);
  } else if (!is_generated_content(value)) {
    result.issues.emplace_back(std::string("expected generated content (string, array, object or null), got ") +
                                   value.type_name(),
                               "$", "shape");
  }
  result.ok = result.issues.empty();
  if (result.ok) result.value = value;
  return result;
}

}  // namespace llm_json_repair
