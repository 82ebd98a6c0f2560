#pragma once

#include <optional>
#include <string>

#include "partialjson/executor.h"

namespace partialjson::cli {

/// Values read from the config file; unset members keep executor defaults.
struct Settings {
  std::optional<bool> ignore_case;
  std::optional<bool> ignore_parse_errors;
  std::optional<std::string> fields_parameter;
  std::optional<size_t> max_length;
  std::optional<size_t> max_depth;
  std::optional<int> indent;
};

/// Resolves the config file location from PARTIALJSON_CONFIG, XDG_CONFIG_HOME or HOME.
/// MUST return a relative fallback path when none of them is set.
std::string resolve_config_path();
/// Loads `[section]` / `key = value` settings from path.
/// MUST return false with an empty error when the file does not exist and MUST
/// return false with a line-numbered error for malformed values.
/// Inputs are a path; outputs are settings/error with file read side effects.
bool load_config(const std::string& path, Settings& out, std::string& error);
/// Copies every set member of settings onto options.
void apply_settings(const Settings& settings, PartialJsonOptions& options);

}  // namespace partialjson::cli
