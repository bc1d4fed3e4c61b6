#include "internal.hpp"

namespace llm_json_repair {

// ---------------- Sanitizer pipeline ----------------

std::optional<std::string> PipelineResult::diagnostics() const {
  std::string out;
  for (const auto& step : steps) {
    if (!step.changed) continue;
    std::string line = step.name;
    if (step.description) line += ": " + *step.description;
    for (const auto& d : step.diagnostics) {
      if (step.description && d == *step.description) continue;
      line += "; " + d;
    }
    if (!out.empty()) out += " | ";
    out += line;
  }
  if (out.empty()) return std::nullopt;
  return out;
}

SanitizerPipeline::SanitizerPipeline(const SanitizerConfig& config) {
  // Order matters: each stage assumes the structure normalized by the ones before it.
  auto add = [&](bool enabled, const char* name, SanitizerFn fn) {
    if (enabled) stages_.push_back(Stage{name, fn});
  };
  add(config.remove_code_fences, "remove_code_fences", &remove_code_fences);
  add(config.remove_control_chars, "remove_control_chars", &remove_control_chars);
  add(config.normalize_single_quotes, "normalize_single_quotes", &normalize_single_quotes);
  add(config.strip_json_comments, "strip_json_comments", &strip_json_comments);
  add(config.extract_largest_json_span, "extract_largest_json_span", &extract_largest_json_span);
  add(config.unwrap_json_schema, "unwrap_json_schema", &unwrap_json_schema);
  add(config.collapse_duplicate_json_object, "collapse_duplicate_json_object", &collapse_duplicate_json_object);
  add(config.fix_mismatched_delimiters, "fix_mismatched_delimiters", &fix_mismatched_delimiters);
  add(config.remove_stray_property_prefixes, "remove_stray_property_prefixes", &remove_stray_property_prefixes);
  add(config.quote_unquoted_property_names, "quote_unquoted_property_names", &quote_unquoted_property_names);
  add(config.replace_python_literals, "replace_python_literals", &replace_python_literals);
  add(config.fix_undefined_values, "fix_undefined_values", &fix_undefined_values);
  add(config.normalize_property_assignment, "normalize_property_assignment", &normalize_property_assignment);
  add(config.remove_truncation_markers, "remove_truncation_markers", &remove_truncation_markers);
  add(config.add_missing_commas, "add_missing_commas", &add_missing_commas);
  add(config.remove_trailing_commas, "remove_trailing_commas", &remove_trailing_commas);
  add(config.normalize_concatenation_chains, "normalize_concatenation_chains", &normalize_concatenation_chains);
  add(config.fix_over_escaped_sequences, "fix_over_escaped_sequences", &fix_over_escaped_sequences);
  add(config.complete_truncated_structures, "complete_truncated_structures", &complete_truncated_structures);
  add(config.trim_whitespace, "trim_whitespace", &trim_whitespace);
}

SanitizerPipeline::SanitizerPipeline(std::vector<Stage> stages) : stages_(std::move(stages)) {}

PipelineResult SanitizerPipeline::run(const std::string& text) const {
  PipelineResult result;
  result.content = text;
  for (const auto& stage : stages_) {
    SanitizerResult r = stage.fn(result.content);
    SanitizationStep step;
    step.name = stage.name;
    step.changed = r.changed && r.content != result.content;
    step.description = r.description;
    step.diagnostics = std::move(r.diagnostics);
    if (step.changed) {
      result.content = std::move(r.content);
      result.applied.push_back(stage.name);
    }
    result.steps.push_back(std::move(step));
  }
  return result;
}

}  // namespace llm_json_repair
