#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace llm_json_repair {

// ---------------- Json ----------------

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();

  // "null" | "boolean" | "number" | "string" | "array" | "object"
  const char* type_name() const;
};

bool operator==(const Json& a, const Json& b);
bool operator!=(const Json& a, const Json& b);

struct JsonParseError : public std::runtime_error {
  size_t offset;
  std::string reason;
  JsonParseError(std::string reason_, size_t offset_)
      : std::runtime_error("JSON parse error at offset " + std::to_string(offset_) + ": " + reason_),
        offset(offset_),
        reason(std::move(reason_)) {}
};

// Strict JSON (RFC 8259). Throws JsonParseError; no repairs are attempted here.
Json parse_json(const std::string& text);

// Compact serialization; object keys are emitted in map order.
std::string dumps_json(const Json& value);

// ---------------- Character-state scanner ----------------

// Classification of one character relative to JSON string literals.
enum class CharState {
  Structural,   // outside any string
  OpenQuote,    // the quote that opens a string
  InString,     // plain string content (including a backslash that starts an escape)
  Escaped,      // the character right after an escaping backslash
  CloseQuote,   // the quote that closes a string
};

// Incremental double-quote/backslash tracker shared by every structural repair.
class StringScanner {
 public:
  CharState advance(char c);

  bool in_string() const { return in_string_; }
  // True when the next character will be consumed by an escape.
  bool escaped() const { return escape_; }
  void reset();

 private:
  bool in_string_{false};
  bool escape_{false};
};

// Whether `offset` lies inside a string literal of `text`. The opening quote is
// outside, the closing quote inside. Offsets past the end report the final state.
bool is_inside_string(const std::string& text, size_t offset);

// ---------------- Balanced-span extraction ----------------

struct JsonSpan {
  size_t begin{0};
  size_t end{0};  // one past the closing delimiter
};

// True when the text has any '{' or '['.
bool has_json_opener(const std::string& text);

// Position of the first '{' / '[' that plausibly starts JSON.
std::optional<size_t> find_json_opener(const std::string& text, size_t from = 0);

// Balanced span starting at the first viable opener; nullopt when it never closes.
std::optional<JsonSpan> find_json_span(const std::string& text);

// Same, starting exactly at `begin` (which must hold '{' or '[').
std::optional<JsonSpan> find_balanced_span_at(const std::string& text, size_t begin);

std::optional<std::string> extract_json_span(const std::string& text);

// Spans of top-level values laid back to back and separated only by whitespace.
// Empty unless the whole trimmed text is covered.
std::vector<JsonSpan> split_top_level_values(const std::string& text);

// ---------------- Sanitizers ----------------

struct SanitizerResult {
  std::string content;
  bool changed{false};
  std::optional<std::string> description;
  std::vector<std::string> diagnostics;
};

struct SanitizationStep {
  std::string name;
  bool changed{false};
  std::optional<std::string> description;
  std::vector<std::string> diagnostics;
};

using SanitizerFn = SanitizerResult (*)(const std::string&);

// Upper bound for sanitizers that iterate to a fixed point.
constexpr int kMaxRepairPasses = 50;

SanitizerResult remove_code_fences(const std::string& text);
SanitizerResult remove_control_chars(const std::string& text);
SanitizerResult normalize_single_quotes(const std::string& text);
SanitizerResult strip_json_comments(const std::string& text);
SanitizerResult extract_largest_json_span(const std::string& text);
SanitizerResult unwrap_json_schema(const std::string& text);
SanitizerResult collapse_duplicate_json_object(const std::string& text);
SanitizerResult fix_mismatched_delimiters(const std::string& text);
SanitizerResult remove_stray_property_prefixes(const std::string& text);
SanitizerResult quote_unquoted_property_names(const std::string& text);
SanitizerResult replace_python_literals(const std::string& text);
SanitizerResult fix_undefined_values(const std::string& text);
SanitizerResult normalize_property_assignment(const std::string& text);
SanitizerResult remove_truncation_markers(const std::string& text);
SanitizerResult add_missing_commas(const std::string& text);
SanitizerResult remove_trailing_commas(const std::string& text);
SanitizerResult normalize_concatenation_chains(const std::string& text);
SanitizerResult fix_over_escaped_sequences(const std::string& text);
SanitizerResult complete_truncated_structures(const std::string& text);
SanitizerResult trim_whitespace(const std::string& text);

// A schema-shaped envelope {"type":"object","properties":{...}} becomes its properties.
// Anything else is returned unchanged.
Json unwrap_json_schema_structure(const Json& value);

struct SanitizerConfig {
  // Every stage is on by default; turn flags off to narrow the repair surface.
  bool remove_code_fences{true};
  bool remove_control_chars{true};
  bool normalize_single_quotes{true};
  bool strip_json_comments{true};
  bool extract_largest_json_span{true};
  bool unwrap_json_schema{true};
  bool collapse_duplicate_json_object{true};
  bool fix_mismatched_delimiters{true};
  bool remove_stray_property_prefixes{true};
  bool quote_unquoted_property_names{true};
  bool replace_python_literals{true};
  bool fix_undefined_values{true};
  bool normalize_property_assignment{true};
  bool remove_truncation_markers{true};
  bool add_missing_commas{true};
  bool remove_trailing_commas{true};
  bool normalize_concatenation_chains{true};
  bool fix_over_escaped_sequences{true};
  bool complete_truncated_structures{true};
  bool trim_whitespace{true};
};

struct PipelineResult {
  std::string content;
  std::vector<SanitizationStep> steps;  // every executed stage, in order
  std::vector<std::string> applied;     // names of stages that changed the text

  bool changed() const { return !applied.empty(); }
  // Descriptions and diagnostics of the stages that fired, joined with " | ".
  std::optional<std::string> diagnostics() const;
};

class SanitizerPipeline {
 public:
  struct Stage {
    std::string name;
    SanitizerFn fn;
  };

  explicit SanitizerPipeline(const SanitizerConfig& config = SanitizerConfig{});

  // Custom stage list, for callers composing their own order.
  explicit SanitizerPipeline(std::vector<Stage> stages);

  PipelineResult run(const std::string& text) const;

  const std::vector<Stage>& stages() const { return stages_; }

 private:
  std::vector<Stage> stages_;
};

// ---------------- Validation ----------------

struct ValidationError : public std::runtime_error {
  std::string path;
  std::string message;
  std::string kind;  // schema | type | limit | shape
  explicit ValidationError(std::string message, std::string path_ = "$", std::string kind_ = "schema")
      : std::runtime_error(message), path(std::move(path_)), message(std::move(message)), kind(std::move(kind_)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

enum class OutputFormat {
  Json,
  Text,
};

struct ProcessingContext {
  std::string resource;
  OutputFormat output_format{OutputFormat::Json};
  std::optional<Json> schema;
};

struct ValidationResult {
  bool ok{false};
  std::optional<Json> value;               // set only when ok
  std::vector<ValidationError> issues;     // set only when !ok
};

// Collects every schema issue (JSON-Schema subset); an empty result means valid.
std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path = "$");

// String, array, object or null: the shapes a schema-free response may take.
bool is_generated_content(const Json& value);

ValidationResult validate_response(const Json& value, const ProcessingContext& context);

// ---------------- Errors ----------------

enum class ProcessingErrorKind {
  Parse,
  Validation,
};

const char* to_string(ProcessingErrorKind kind);

struct ProcessingError : public std::runtime_error {
  ProcessingErrorKind kind;
  std::string resource;
  std::string original_content;
  std::string sanitized_content;
  std::vector<std::string> applied_steps;
  std::optional<std::string> cause;
  std::vector<ValidationError> issues;

  ProcessingError(ProcessingErrorKind kind_,
                  std::string resource_,
                  std::string message,
                  std::string original,
                  std::string sanitized,
                  std::vector<std::string> applied,
                  std::optional<std::string> cause_ = std::nullopt,
                  std::vector<ValidationError> issues_ = {});

  // Resource-qualified message without the metadata suffix carried by what().
  const std::string& summary() const { return summary_; }

 private:
  std::string summary_;
};

// Host-contract violation: the payload has the wrong host type. Never repaired.
struct BadResponseContentError : public std::runtime_error {
  std::string resource;
  BadResponseContentError(const std::string& message, std::string resource_)
      : std::runtime_error(message), resource(std::move(resource_)) {}
};

// ---------------- Logging ----------------

class RepairLogger {
 public:
  virtual ~RepairLogger() = default;
  virtual void warn(const std::string& resource, const std::string& message) = 0;
};

// Steps that never warrant a log line on their own.
bool is_insignificant_step(const std::string& name);

// ---------------- Processor ----------------

struct ParsingOutcome {
  Json parsed;
  std::vector<std::string> steps;
  std::optional<std::string> resilient_diagnostics;
};

struct ProcessedResponse {
  Json value;
  std::vector<std::string> steps;
  std::optional<std::string> diagnostics;
};

struct ProcessOutcome {
  bool ok{false};
  std::optional<ProcessedResponse> response;
  std::optional<ProcessingError> error;
};

struct ProcessorConfig {
  bool enable_fast_path{true};
  bool enable_light_strategies{true};
  // Two different top-level objects back to back are rejected instead of picking one.
  bool reject_distinct_concatenated_objects{true};
  bool log_repairs{true};
  SanitizerConfig sanitizers;
};

class JsonProcessor {
 public:
  explicit JsonProcessor(ProcessorConfig config = ProcessorConfig{}, std::shared_ptr<RepairLogger> logger = nullptr);

  // Runs fast path, light strategies and the resilient tier. Throws ProcessingError (Parse).
  ParsingOutcome parse(const std::string& content, const std::string& resource) const;

  // Parse + schema unwrap + validation. Throws ProcessingError.
  ProcessedResponse parse_and_validate(const std::string& content, const ProcessingContext& context) const;

  // Host payload entry point: anything but a string throws BadResponseContentError.
  ProcessedResponse parse_and_validate_payload(const Json& payload, const ProcessingContext& context) const;

  // Non-throwing form of parse_and_validate for ProcessingError failures.
  ProcessOutcome process(const std::string& content, const ProcessingContext& context) const;

  // Free-text responses: the payload must be a string and is returned as-is.
  std::string text_response(const Json& payload, const ProcessingContext& context) const;

  const ProcessorConfig& config() const { return config_; }

 private:
  ProcessorConfig config_;
  SanitizerPipeline pipeline_;
  std::shared_ptr<RepairLogger> logger_;

  void log_repairs(const std::string& resource, const std::vector<std::string>& steps,
                   const std::optional<std::string>& diagnostics) const;
};

}  // namespace llm_json_repair
