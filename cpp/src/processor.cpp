#include "internal.hpp"

#include <set>

namespace llm_json_repair {

// ---------------- Errors ----------------

const char* to_string(ProcessingErrorKind kind) { return kind == ProcessingErrorKind::Parse ? "parse" : "validation"; }

static std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

// Lengths only: raw content stays on the error object, not in the message.
static std::string error_metadata(ProcessingErrorKind kind,
                                  const std::string& original,
                                  const std::string& sanitized,
                                  const std::vector<std::string>& applied) {
  return std::string(" (type=") + to_string(kind) + ", originalLength=" + std::to_string(original.size()) +
         ", sanitizedLength=" + std::to_string(sanitized.size()) + ", appliedSteps=[" + join(applied, ", ") + "])";
}

ProcessingError::ProcessingError(ProcessingErrorKind kind_,
                                 std::string resource_,
                                 std::string message,
                                 std::string original,
                                 std::string sanitized,
                                 std::vector<std::string> applied,
                                 std::optional<std::string> cause_,
                                 std::vector<ValidationError> issues_)
    : std::runtime_error(message + error_metadata(kind_, original, sanitized, applied)),
      kind(kind_),
      resource(std::move(resource_)),
      original_content(std::move(original)),
      sanitized_content(std::move(sanitized)),
      applied_steps(std::move(applied)),
      cause(std::move(cause_)),
      issues(std::move(issues_)),
      summary_(std::move(message)) {}

// ---------------- Logging ----------------

static const char* const kStrategyExtract = "extract";
static const char* const kStrategyPreConcat = "pre_concat_extract";
static const char* const kStrategyResilient = "resilient_sanitization";

static bool is_strategy_name(const std::string& name) {
  return name == kStrategyExtract || name == kStrategyPreConcat || name == kStrategyResilient;
}

bool is_insignificant_step(const std::string& name) {
  static const std::set<std::string> kInsignificant = {"trim_whitespace", "remove_code_fences"};
  return kInsignificant.count(name) > 0;
}

void JsonProcessor::log_repairs(const std::string& resource,
                                const std::vector<std::string>& steps,
                                const std::optional<std::string>& diagnostics) const {
  if (!config_.log_repairs || !logger_) return;
  std::vector<std::string> significant;
  for (const auto& s : steps) {
    if (!is_strategy_name(s) && !is_insignificant_step(s)) significant.push_back(s);
  }
  if (significant.empty()) return;
  std::string message = "Applied JSON repairs: " + join(significant, ", ");
  if (diagnostics) message += " [" + *diagnostics + "]";
  logger_->warn(resource, message);
}

// ---------------- Processor ----------------

JsonProcessor::JsonProcessor(ProcessorConfig config, std::shared_ptr<RepairLogger> logger)
    : config_(std::move(config)), pipeline_(config_.sanitizers), logger_(std::move(logger)) {}

static std::string resource_message(const std::string& resource, const std::string& what) {
  return "LLM response for resource '" + resource + "' " + what;
}

// Balanced span + strict parse, failing when a second top-level value follows the span.
static std::optional<Json> try_extract_and_parse(const std::string& text, std::optional<std::string>& last_error) {
  auto span = find_json_span(text);
  if (!span) {
    last_error = "no balanced JSON span found";
    return std::nullopt;
  }
  size_t after = detail::skip_ws(text, span->end);
  if (after < text.size() && (text[after] == '{' || text[after] == '[') && find_balanced_span_at(text, after)) {
    last_error = "multiple top-level JSON values";
    return std::nullopt;
  }
  try {
    return parse_json(text.substr(span->begin, span->end - span->begin));
  } catch (const JsonParseError& e) {
    last_error = e.what();
    return std::nullopt;
  }
}

static bool has_distinct_values(const std::string& text, const std::vector<JsonSpan>& spans) {
  const std::string first = text.substr(spans[0].begin, spans[0].end - spans[0].begin);
  for (size_t k = 1; k < spans.size(); ++k) {
    if (text.compare(spans[k].begin, spans[k].end - spans[k].begin, first) != 0) return true;
  }
  return false;
}

ParsingOutcome JsonProcessor::parse(const std::string& content, const std::string& resource) const {
  const std::string trimmed = detail::trim_copy(content);
  std::optional<std::string> last_error;

  if (config_.enable_fast_path) {
    try {
      return ParsingOutcome{unwrap_json_schema_structure(parse_json(trimmed)), {}, std::nullopt};
    } catch (const JsonParseError& e) {
      last_error = e.what();
    }
  }

  if (config_.enable_light_strategies) {
    if (!has_json_opener(trimmed)) {
      throw ProcessingError(ProcessingErrorKind::Parse, resource,
                            resource_message(resource, "doesn't contain valid JSON content"), content, trimmed, {},
                            last_error);
    }

    std::vector<std::string> fired;
    SanitizerResult fenced = remove_code_fences(trimmed);
    if (fenced.changed) fired.push_back("remove_code_fences");

    if (auto v = try_extract_and_parse(fenced.content, last_error)) {
      std::vector<std::string> steps{kStrategyExtract};
      steps.insert(steps.end(), fired.begin(), fired.end());
      return ParsingOutcome{unwrap_json_schema_structure(*v), steps, std::nullopt};
    }

    SanitizerResult concat = normalize_concatenation_chains(fenced.content);
    if (concat.changed) {
      if (auto v = try_extract_and_parse(concat.content, last_error)) {
        std::vector<std::string> steps{kStrategyPreConcat};
        steps.insert(steps.end(), fired.begin(), fired.end());
        steps.push_back("normalize_concatenation_chains");
        return ParsingOutcome{unwrap_json_schema_structure(*v), steps, std::nullopt};
      }
    }
  }

  PipelineResult cleaned = pipeline_.run(content);

  if (config_.reject_distinct_concatenated_objects) {
    auto spans = split_top_level_values(cleaned.content);
    if (spans.size() >= 2 && has_distinct_values(cleaned.content, spans)) {
      throw ProcessingError(ProcessingErrorKind::Parse, resource,
                            resource_message(resource, "contains " + std::to_string(spans.size()) +
                                                           " distinct concatenated JSON values; refusing to pick one"),
                            content, cleaned.content, cleaned.applied, std::string("ambiguous concatenated JSON values"));
    }
  }

  try {
    Json parsed = parse_json(cleaned.content);
    std::vector<std::string> steps{kStrategyResilient};
    steps.insert(steps.end(), cleaned.applied.begin(), cleaned.applied.end());
    return ParsingOutcome{unwrap_json_schema_structure(parsed), steps, cleaned.diagnostics()};
  } catch (const JsonParseError& e) {
    throw ProcessingError(ProcessingErrorKind::Parse, resource,
                          resource_message(resource, "cannot be parsed to JSON after all sanitization attempts"),
                          content, cleaned.content, cleaned.applied, std::string(e.what()));
  }
}

ProcessedResponse JsonProcessor::parse_and_validate(const std::string& content, const ProcessingContext& context) const {
  ParsingOutcome outcome = parse(content, context.resource);
  log_repairs(context.resource, outcome.steps, outcome.resilient_diagnostics);

  ValidationResult checked = validate_response(outcome.parsed, context);
  if (!checked.ok) {
    const ValidationError& first = checked.issues.front();
    std::string what = "failed validation: " + first.path + ": " + first.message;
    if (checked.issues.size() > 1) what += " (+" + std::to_string(checked.issues.size() - 1) + " more)";
    throw ProcessingError(ProcessingErrorKind::Validation, context.resource, resource_message(context.resource, what),
                          content, dumps_json(outcome.parsed), outcome.steps, std::nullopt, checked.issues);
  }
  return ProcessedResponse{std::move(*checked.value), std::move(outcome.steps), std::move(outcome.resilient_diagnostics)};
}

ProcessedResponse JsonProcessor::parse_and_validate_payload(const Json& payload, const ProcessingContext& context) const {
  if (!payload.is_string()) {
    throw BadResponseContentError(
        resource_message(context.resource, std::string("must be a string, got ") + payload.type_name()),
        context.resource);
  }
  return parse_and_validate(payload.as_string(), context);
}

ProcessOutcome JsonProcessor::process(const std::string& content, const ProcessingContext& context) const {
  ProcessOutcome out;
  try {
    out.response = parse_and_validate(content, context);
    out.ok = true;
  } catch (const ProcessingError& e) {
    out.error = e;
  }
  return out;
}

std::string JsonProcessor::text_response(const Json& payload, const ProcessingContext& context) const {
  if (!payload.is_string()) {
    throw BadResponseContentError(
        resource_message(context.resource, std::string("expected text, got ") + payload.type_name()),
        context.resource);
  }
  return payload.as_string();
}

}  // namespace llm_json_repair
