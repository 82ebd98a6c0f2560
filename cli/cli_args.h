#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace partialjson::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST leave unset optionals for flags not given so config values can apply.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::optional<std::string> fields;
  std::optional<std::string> query_string;
  std::string input;
  std::string config_path;
  std::optional<bool> ignore_case;
  std::optional<bool> ignore_parse_errors;
  std::optional<int> indent;
  bool explain = false;
  int timeout_ms = 5000;
  bool show_help = false;
};

/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values or malformed numbers.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace partialjson::cli
