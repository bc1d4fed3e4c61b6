#undef NDEBUG
#include "llm_json_repair.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace llm_json_repair;

class RecordingLogger : public RepairLogger {
 public:
  std::vector<std::pair<std::string, std::string>> lines;
  void warn(const std::string& resource, const std::string& message) override { lines.emplace_back(resource, message); }
};

static ProcessingContext json_context(const std::string& resource) {
  ProcessingContext ctx;
  ctx.resource = resource;
  return ctx;
}

static std::vector<std::string> steps(std::initializer_list<const char*> names) {
  return std::vector<std::string>(names.begin(), names.end());
}

static void test_fast_path_returns_no_steps() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("  {\"a\": [1, 2], \"b\": {\"c\": \"d\"}}\n", "r");
  assert(out.steps.empty());
  assert(!out.resilient_diagnostics);
  assert(out.parsed == parse_json("{\"a\": [1, 2], \"b\": {\"c\": \"d\"}}"));
}

static void test_missing_comma_uses_resilient_tier() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("{\"name\": \"Acme\"\n  \"type\": \"vendor\"}", "vendors");
  assert(out.steps == steps({"resilient_sanitization", "add_missing_commas"}));
  assert(out.parsed == parse_json("{\"name\": \"Acme\", \"type\": \"vendor\"}"));
  assert(out.resilient_diagnostics);
}

static void test_fenced_response_uses_extract() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("```json\n{\"a\": 1}\n```", "r");
  assert(out.steps == steps({"extract", "remove_code_fences"}));
  assert(out.parsed == parse_json("{\"a\": 1}"));

  ParsingOutcome prose = p.parse("Sure! Here you go: {\"a\": 1} Let me know.", "r");
  assert(prose.steps == steps({"extract", "remove_code_fences"}));
  assert(prose.parsed == parse_json("{\"a\": 1}"));
}

static void test_concatenation_uses_pre_concat_extract() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("{\"path\": BASE + \"/x.ts\"}", "files");
  assert(out.steps == steps({"pre_concat_extract", "normalize_concatenation_chains"}));
  assert(out.parsed.as_object().at("path").as_string() == "/x.ts");
}

static void test_exact_duplicate_objects_collapse() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("{\"a\": \"x\"} {\"a\": \"x\"}", "r");
  assert(out.steps == steps({"resilient_sanitization", "collapse_duplicate_json_object"}));
  assert(out.parsed == parse_json("{\"a\": \"x\"}"));

  ParsingOutcome chatty = p.parse("{\"a\": \"x\"} {\"a\": \"x\"} Hope this helps", "r");
  assert(chatty.steps == steps({"resilient_sanitization", "collapse_duplicate_json_object"}));
  assert(chatty.parsed == parse_json("{\"a\": \"x\"}"));
}

static void test_distinct_objects_are_rejected() {
  JsonProcessor p;
  try {
    (void)p.parse("{\"a\": \"x\"} {\"a\": \"y\"}", "r");
    assert(false && "expected ProcessingError");
  } catch (const ProcessingError& e) {
    assert(e.kind == ProcessingErrorKind::Parse);
    assert(e.resource == "r");
    assert(e.summary().find("2 distinct concatenated JSON values") != std::string::npos);
    assert(e.sanitized_content.find("\"y\"") != std::string::npos);
    assert(e.cause.has_value());
  }

  try {
    (void)p.parse("{\"a\": \"x\"} {\"b\": \"y\"}", "r");
    assert(false && "expected ProcessingError");
  } catch (const ProcessingError& e) {
    assert(e.kind == ProcessingErrorKind::Parse);
  }

  ProcessorConfig lenient;
  lenient.reject_distinct_concatenated_objects = false;
  JsonProcessor q(lenient);
  try {
    (void)q.parse("{\"a\": \"x\"} {\"a\": \"y\"}", "r");
    assert(false && "expected ProcessingError");
  } catch (const ProcessingError& e) {
    assert(e.summary().find("cannot be parsed to JSON after all sanitization attempts") != std::string::npos);
  }
}

static void test_forced_resilient_tier_matches_fast_path() {
  ProcessorConfig cfg;
  cfg.enable_fast_path = false;
  cfg.enable_light_strategies = false;
  JsonProcessor slow(cfg);
  JsonProcessor fast;

  const char* docs[] = {
      "{\"a\": [1, 2], \"b\": {\"c\": \"d\"}}",
      "[true, false, null, -0.5, \"x\\ny\"]",
      "{\"s\": \"a, b] + c undefined\", \"n\": 1e3}",
      "{\"path\": \"C:\\\\'tmp'\"}",
      "{\"u\": \"http://x/*y*/\", \"q\": \"it's \\\\ \\u00e9 True...\"}",
  };
  for (const char* d : docs) {
    ParsingOutcome a = slow.parse(d, "r");
    ParsingOutcome b = fast.parse(d, "r");
    assert(a.steps == steps({"resilient_sanitization"}));
    assert(!a.resilient_diagnostics);
    assert(a.parsed == b.parsed);
  }
}

static void test_curly_closing_quote_is_repaired() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("{\"name\xE2\x80\x9D: \"Acme\"}", "vendors");
  assert(out.steps == steps({"resilient_sanitization", "remove_control_chars"}));
  assert(out.parsed.as_object().at("name").as_string() == "Acme");
}

static void test_script_style_output_is_normalized() {
  JsonProcessor p;
  ParsingOutcome out = p.parse(
      "{'name': 'Acme', // vendor\n  \"active\": True,\n  \"note\": None,\n  \"tags\": [\"a\", ...]}", "vendors");
  assert(out.steps == steps({"resilient_sanitization", "normalize_single_quotes", "strip_json_comments",
                             "replace_python_literals", "remove_truncation_markers", "remove_trailing_commas"}));
  assert(out.parsed == parse_json("{\"name\": \"Acme\", \"active\": true, \"note\": null, \"tags\": [\"a\"]}"));

  ParsingOutcome assigned = p.parse("{\"name\":= \"Acme\", \"status\": in progress}", "vendors");
  assert(assigned.steps == steps({"resilient_sanitization", "normalize_property_assignment"}));
  assert(assigned.parsed.as_object().at("status").as_string() == "in progress");

  ParsingOutcome unquoted = p.parse("{a: 1\nb: 2}", "r");
  assert(unquoted.steps == steps({"resilient_sanitization", "quote_unquoted_property_names", "add_missing_commas"}));
  assert(unquoted.parsed == parse_json("{\"a\": 1, \"b\": 2}"));
}

static void test_truncated_response_is_completed() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("{\"items\": [{\"id\": 1}, {\"id\": 2", "r");
  assert(out.steps.front() == "resilient_sanitization");
  assert(out.steps.back() == "complete_truncated_structures");
  assert(out.parsed.as_object().at("items").as_array().size() == 2);
}

static void test_schema_envelope_is_unwrapped() {
  JsonProcessor p;
  ParsingOutcome out = p.parse("{\"type\": \"object\", \"properties\": {\"name\": \"Acme\"}}", "r");
  assert(out.steps.empty());
  assert(out.parsed == parse_json("{\"name\": \"Acme\"}"));
}

static void test_no_json_is_terminal() {
  JsonProcessor p;
  try {
    (void)p.parse("I'm sorry, I can't help with that.", "chat");
    assert(false && "expected ProcessingError");
  } catch (const ProcessingError& e) {
    assert(e.kind == ProcessingErrorKind::Parse);
    assert(e.summary() == "LLM response for resource 'chat' doesn't contain valid JSON content");
    assert(e.applied_steps.empty());
    assert(e.original_content == "I'm sorry, I can't help with that.");
    std::string what = e.what();
    assert(what.find("originalLength=34") != std::string::npos);
    assert(what.find("type=parse") != std::string::npos);
    assert(what.find("I'm sorry") == std::string::npos);
  }
}

static void test_validation_failure_carries_issues() {
  JsonObject props;
  props["name"] = Json(JsonObject{{"type", "string"}});
  ProcessingContext ctx = json_context("vendors");
  ctx.schema = Json(JsonObject{
      {"type", "object"},
      {"required", JsonArray{Json("name")}},
      {"properties", Json(props)},
  });
  JsonProcessor p;

  try {
    (void)p.parse_and_validate("{\"age\": 3}", ctx);
    assert(false && "expected ProcessingError");
  } catch (const ProcessingError& e) {
    assert(e.kind == ProcessingErrorKind::Validation);
    assert(e.issues.size() == 1);
    assert(e.issues[0].path == "$.name");
    assert(e.applied_steps.empty());
    assert(e.summary().find("failed validation: $.name") != std::string::npos);
  }

  try {
    (void)p.parse_and_validate("```json\n{\"name\": 5}\n```", ctx);
    assert(false && "expected ProcessingError");
  } catch (const ProcessingError& e) {
    assert(e.kind == ProcessingErrorKind::Validation);
    assert(e.applied_steps == steps({"extract", "remove_code_fences"}));
    assert(e.issues[0].kind == "type");
    assert(e.sanitized_content == "{\"name\":5}");
  }

  ProcessedResponse ok = p.parse_and_validate("{\"name\": \"Acme\"\n\"age\": 3}", ctx);
  assert(ok.value.as_object().at("name").as_string() == "Acme");
  assert(ok.steps == steps({"resilient_sanitization", "add_missing_commas"}));
  assert(ok.diagnostics);
}

static void test_process_does_not_throw() {
  JsonProcessor p;
  ProcessOutcome good = p.process("[1, 2]", json_context("r"));
  assert(good.ok);
  assert(good.response && good.response->value.as_array().size() == 2);
  assert(!good.error);

  ProcessOutcome bad = p.process("no json at all", json_context("r"));
  assert(!bad.ok);
  assert(!bad.response);
  assert(bad.error && bad.error->kind == ProcessingErrorKind::Parse);

  ProcessOutcome number = p.process("42", json_context("r"));
  assert(!number.ok);
  assert(number.error->kind == ProcessingErrorKind::Validation);
  assert(number.error->issues[0].kind == "shape");
}

static void test_host_payload_type_is_checked() {
  JsonProcessor p;
  ProcessingContext ctx = json_context("r");
  try {
    (void)p.parse_and_validate_payload(Json(5), ctx);
    assert(false && "expected BadResponseContentError");
  } catch (const BadResponseContentError& e) {
    assert(e.resource == "r");
    assert(std::string(e.what()).find("got number") != std::string::npos);
  }
  assert(p.parse_and_validate_payload(Json("{\"a\": 1}"), ctx).value == parse_json("{\"a\": 1}"));

  ctx.output_format = OutputFormat::Text;
  assert(p.text_response(Json("plain words"), ctx) == "plain words");
  try {
    (void)p.text_response(Json(JsonArray{}), ctx);
    assert(false && "expected BadResponseContentError");
  } catch (const BadResponseContentError& e) {
    assert(std::string(e.what()).find("expected text, got array") != std::string::npos);
  }
}

static void test_repairs_are_logged_once_significant() {
  auto logger = std::make_shared<RecordingLogger>();
  JsonProcessor p(ProcessorConfig{}, logger);

  (void)p.parse_and_validate("{\"a\": 1}", json_context("clean"));
  (void)p.parse_and_validate("```json\n{\"a\": 1}\n```", json_context("fenced"));
  assert(logger->lines.empty());

  (void)p.parse_and_validate("{\"name\": \"Acme\"\n\"type\": \"vendor\"}", json_context("vendors"));
  assert(logger->lines.size() == 1);
  assert(logger->lines[0].first == "vendors");
  assert(logger->lines[0].second.find("Applied JSON repairs: add_missing_commas") == 0);

  (void)p.parse_and_validate("{\"path\": BASE + \"/x.ts\"}", json_context("files"));
  assert(logger->lines.size() == 2);
  assert(logger->lines[1].second == "Applied JSON repairs: normalize_concatenation_chains");

  ProcessorConfig quiet;
  quiet.log_repairs = false;
  auto silent = std::make_shared<RecordingLogger>();
  JsonProcessor q(quiet, silent);
  (void)q.parse_and_validate("{\"name\": \"Acme\"\n\"type\": \"vendor\"}", json_context("vendors"));
  assert(silent->lines.empty());
}

static void test_insignificant_steps() {
  assert(is_insignificant_step("trim_whitespace"));
  assert(is_insignificant_step("remove_code_fences"));
  assert(!is_insignificant_step("add_missing_commas"));
  assert(std::string(to_string(ProcessingErrorKind::Validation)) == "validation");
}

int main() {
  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("fast_path_returns_no_steps", test_fast_path_returns_no_steps);
    run("missing_comma_uses_resilient_tier", test_missing_comma_uses_resilient_tier);
    run("fenced_response_uses_extract", test_fenced_response_uses_extract);
    run("concatenation_uses_pre_concat_extract", test_concatenation_uses_pre_concat_extract);
    run("exact_duplicate_objects_collapse", test_exact_duplicate_objects_collapse);
    run("distinct_objects_are_rejected", test_distinct_objects_are_rejected);
    run("forced_resilient_tier_matches_fast_path", test_forced_resilient_tier_matches_fast_path);
    run("curly_closing_quote_is_repaired", test_curly_closing_quote_is_repaired);
    run("script_style_output_is_normalized", test_script_style_output_is_normalized);
    run("truncated_response_is_completed", test_truncated_response_is_completed);
    run("schema_envelope_is_unwrapped", test_schema_envelope_is_unwrapped);
    run("no_json_is_terminal", test_no_json_is_terminal);
    run("validation_failure_carries_issues", test_validation_failure_carries_issues);
    run("process_does_not_throw", test_process_does_not_throw);
    run("host_payload_type_is_checked", test_host_payload_type_is_checked);
    run("repairs_are_logged_once_significant", test_repairs_are_logged_once_significant);
    run("insignificant_steps", test_insignificant_steps);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
