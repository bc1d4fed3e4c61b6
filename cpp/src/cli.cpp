#include "llm_json_repair.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace llm_json_repair;

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

class StderrLogger : public RepairLogger {
 public:
  void warn(const std::string& resource, const std::string& message) override {
    std::cerr << "warn [" << resource << "] " << message << "\n";
  }
};

static JsonArray string_array(const std::vector<std::string>& items) {
  JsonArray out;
  for (const auto& s : items) out.push_back(s);
  return out;
}

static void usage() {
  std::cerr << "llm_json_repair_cli [--schema <schema.json>] [--input <file>] [--resource <name>] [--text]\n"
            << "                    [--no-fast-path] [--no-light] [--quiet]\n"
            << "  Reads an LLM response from --input or stdin, repairs and validates it,\n"
            << "  and prints the result as JSON to stdout.\n";
}

int main(int argc, char** argv) {
  try {
    std::string schema_path;
    std::string input_path;
    ProcessingContext context;
    context.resource = "cli";
    ProcessorConfig config;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--schema" && i + 1 < argc) {
        schema_path = argv[++i];
      } else if (a == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (a == "--resource" && i + 1 < argc) {
        context.resource = argv[++i];
      } else if (a == "--text") {
        context.output_format = OutputFormat::Text;
      } else if (a == "--no-fast-path") {
        config.enable_fast_path = false;
      } else if (a == "--no-light") {
        config.enable_light_strategies = false;
      } else if (a == "--quiet") {
        quiet = true;
      } else {
        usage();
        return 2;
      }
    }

    std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);
    // The schema file itself is trusted to be strict JSON.
    if (!schema_path.empty()) context.schema = parse_json(read_file(schema_path));

    std::shared_ptr<RepairLogger> logger;
    if (!quiet) logger = std::make_shared<StderrLogger>();
    JsonProcessor processor(config, logger);

    if (context.output_format == OutputFormat::Text) {
      JsonObject o;
      o["ok"] = true;
      o["value"] = processor.text_response(Json(input), context);
      std::cout << dumps_json(Json(o)) << "\n";
      return 0;
    }

    ProcessOutcome outcome = processor.process(input, context);
    JsonObject o;
    o["ok"] = outcome.ok;
    if (outcome.ok) {
      o["value"] = outcome.response->value;
      o["steps"] = string_array(outcome.response->steps);
      if (outcome.response->diagnostics) o["diagnostics"] = *outcome.response->diagnostics;
      std::cout << dumps_json(Json(o)) << "\n";
      return 0;
    }

    const ProcessingError& e = *outcome.error;
    o["kind"] = std::string(to_string(e.kind));
    o["message"] = e.summary();
    o["steps"] = string_array(e.applied_steps);
    if (e.cause) o["cause"] = *e.cause;
    JsonArray issues;
    for (const auto& issue : e.issues) {
      JsonObject io;
      io["path"] = issue.path;
      io["message"] = issue.message;
      io["kind"] = issue.kind;
      issues.push_back(io);
    }
    if (!issues.empty()) o["issues"] = issues;
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const JsonParseError& e) {
    std::cerr << "error: schema is not valid JSON: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
