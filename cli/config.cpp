#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "util/string_util.h"

namespace partialjson::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parse_size(const std::string& raw, size_t& out) {
  if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) return false;
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size()) return false;
    if (value == 0) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

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

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if (trimmed.front() == '"' || trimmed.front() == '\'') {
    if (trimmed.size() < 2 || trimmed.back() != trimmed.front()) {
      ok = false;
      return {};
    }
    trimmed = trimmed.substr(1, trimmed.size() - 2);
  }
  ok = !trimmed.empty();
  return trimmed;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("PARTIALJSON_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "partialjson" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "partialjson" / "config.toml").string();
  }
  return "partialjson.config.toml";
}

bool load_config(const std::string& path, Settings& out, std::string& error) {
  out = Settings{};
  if (path.empty()) return false;
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    std::string where = " at line " + std::to_string(line_no);
    if (full_key == "partial_json.ignore_case") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid partial_json.ignore_case" + where;
        return false;
      }
      out.ignore_case = parsed;
    } else if (full_key == "partial_json.ignore_parse_errors") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid partial_json.ignore_parse_errors" + where;
        return false;
      }
      out.ignore_parse_errors = parsed;
    } else if (full_key == "partial_json.fields_parameter") {
      bool ok = false;
      std::string parsed = parse_string_value(value, ok);
      if (!ok) {
        error = "Invalid partial_json.fields_parameter" + where;
        return false;
      }
      out.fields_parameter = parsed;
    } else if (full_key == "partial_json.indent") {
      int parsed = 0;
      if (!parse_int(value, parsed)) {
        error = "Invalid partial_json.indent" + where;
        return false;
      }
      out.indent = parsed;
    } else if (full_key == "parser.max_length") {
      size_t parsed = 0;
      if (!parse_size(value, parsed)) {
        error = "Invalid parser.max_length" + where;
        return false;
      }
      out.max_length = parsed;
    } else if (full_key == "parser.max_depth") {
      size_t parsed = 0;
      if (!parse_size(value, parsed)) {
        error = "Invalid parser.max_depth" + where;
        return false;
      }
      out.max_depth = parsed;
    }
  }
  return true;
}

void apply_settings(const Settings& settings, PartialJsonOptions& options) {
  if (settings.ignore_case.has_value()) {
    options.ignore_case = *settings.ignore_case;
  }
  if (settings.ignore_parse_errors.has_value()) {
    options.ignore_parse_errors = *settings.ignore_parse_errors;
  }
  if (settings.fields_parameter.has_value()) {
    options.fields_parameter = *settings.fields_parameter;
  }
  if (settings.indent.has_value()) {
    options.indent = *settings.indent;
  }
  if (settings.max_length.has_value()) {
    options.parse_options.max_length = *settings.max_length;
  }
  if (settings.max_depth.has_value()) {
    options.parse_options.max_depth = *settings.max_depth;
  }
}

}  // namespace partialjson::cli
