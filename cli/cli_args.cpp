#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace partialjson::cli {

namespace {

bool parse_int(const std::string& raw, int& out) {
  try {
    size_t pos = 0;
    int value = std::stoi(raw, &pos);
    if (pos != raw.size()) return false;
    out = value;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

bool takes_value(const std::string& arg) {
  return arg == "--fields" || arg == "--query-string" || arg == "--input" || arg == "--config" ||
         arg == "--indent" || arg == "--timeout-ms";
}

}  // namespace

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_help(std::ostream& os) {
  os << "Usage: partialjson --fields <selector> [--input <path|url>]\n";
  os << "       partialjson --query-string <query> [--input <path|url>]\n";
  os << "       partialjson --fields <selector> --explain\n";
  os << "Options:\n";
  os << "  --fields <selector>      Field selector, e.g. kind,items(title,id)\n";
  os << "  --query-string <query>   Read the selector from a URL query string\n";
  os << "  --input <path|url>       JSON input (default: stdin)\n";
  os << "  --config <path>          Config file (default: $PARTIALJSON_CONFIG)\n";
  os << "  --ignore-case            Match field names case-insensitively\n";
  os << "  --ignore-parse-errors    Serialize everything when the selector is invalid\n";
  os << "  --indent <n>             Pretty-print with n spaces (-1 = compact)\n";
  os << "  --explain                Print the parsed selector and exit\n";
  os << "  --timeout-ms <n>         URL fetch timeout\n";
  os << "If neither --fields nor --query-string is given, the input is echoed unfiltered.\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and MUST report the offending flag.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--fields" && has_value) {
      options.fields = std::string(argv[++i]);
    } else if (arg == "--query-string" && has_value) {
      options.query_string = std::string(argv[++i]);
    } else if (arg == "--input" && has_value) {
      options.input = argv[++i];
    } else if (arg == "--config" && has_value) {
      options.config_path = argv[++i];
    } else if (arg == "--ignore-case") {
      options.ignore_case = true;
    } else if (arg == "--ignore-parse-errors") {
      options.ignore_parse_errors = true;
    } else if (arg == "--explain") {
      options.explain = true;
    } else if (arg == "--indent" && has_value) {
      int indent = 0;
      if (!parse_int(argv[++i], indent)) {
        error = "Invalid --indent value (use an integer)";
        return false;
      }
      options.indent = indent;
    } else if (arg == "--timeout-ms" && has_value) {
      int timeout = 0;
      if (!parse_int(argv[++i], timeout) || timeout <= 0) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
      options.timeout_ms = timeout;
    } else if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (takes_value(arg)) {
      error = "Missing value for " + arg;
      return false;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (options.fields.has_value() && options.query_string.has_value()) {
    error = "Use either --fields or --query-string, not both";
    return false;
  }
  return true;
}

}  // namespace partialjson::cli
