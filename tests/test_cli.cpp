#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "test_harness.h"

namespace {

using partialjson::cli::CliOptions;
using partialjson::cli::Settings;

bool parse_args(std::vector<std::string> args, CliOptions& options, std::string& error) {
  args.insert(args.begin(), "partialjson");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return partialjson::cli::parse_cli_args(static_cast<int>(argv.size()), argv.data(), options, error);
}

std::filesystem::path write_temp(const std::string& name, const std::string& contents) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary);
  out << contents;
  return path;
}

void test_cli_args_basic() {
  CliOptions options;
  std::string error;
  bool ok = parse_args({"--fields", "a,b(c)", "--input", "doc.json", "--ignore-case", "--indent", "2"},
                       options, error);
  expect_true(ok, "valid args parse: " + error);
  expect_str(options.fields.value_or(""), "a,b(c)", "fields captured");
  expect_str(options.input, "doc.json", "input captured");
  expect_true(options.ignore_case.value_or(false), "ignore case set");
  expect_true(!options.ignore_parse_errors.has_value(), "ignore parse errors left unset");
  expect_eq(static_cast<size_t>(options.indent.value_or(0)), 2, "indent captured");
}

void test_cli_args_errors() {
  CliOptions options;
  std::string error;
  expect_true(!parse_args({"--indent", "two"}, options, error), "non-numeric indent rejected");
  error.clear();
  expect_true(!parse_args({"--fields"}, options, error), "missing value rejected");
  expect_true(error.find("Missing value") != std::string::npos, "missing value message");
  CliOptions other;
  error.clear();
  expect_true(!parse_args({"--bogus"}, other, error), "unknown flag rejected");
  expect_true(error.find("Unknown argument") != std::string::npos, "unknown flag message");
  CliOptions both;
  error.clear();
  expect_true(!parse_args({"--fields", "a", "--query-string", "fields=b"}, both, error),
              "two selector sources rejected");
  CliOptions timeout;
  error.clear();
  expect_true(!parse_args({"--timeout-ms", "0"}, timeout, error), "zero timeout rejected");
}

void test_config_load() {
  auto path = write_temp("partialjson_test_config.toml",
                         "# partial json\n"
                         "[partial_json]\n"
                         "ignore_case = true\n"
                         "ignore_parse_errors = FALSE\n"
                         "fields_parameter = \"select\"\n"
                         "indent = 4\n"
                         "\n"
                         "[parser]\n"
                         "max_length = 1024\n"
                         "max_depth = 8\n"
                         "unknown = 1\n");
  Settings settings;
  std::string error;
  bool ok = partialjson::cli::load_config(path.string(), settings, error);
  expect_true(ok, "config loads: " + error);
  expect_true(settings.ignore_case.value_or(false), "ignore_case read");
  expect_true(settings.ignore_parse_errors.has_value() && !*settings.ignore_parse_errors,
              "ignore_parse_errors read");
  expect_str(settings.fields_parameter.value_or(""), "select", "quoted string unquoted");
  expect_eq(settings.max_length.value_or(0), 1024, "max_length read");
  expect_eq(settings.max_depth.value_or(0), 8, "max_depth read");

  partialjson::PartialJsonOptions options;
  partialjson::cli::apply_settings(settings, options);
  expect_true(options.ignore_case, "ignore_case applied");
  expect_str(options.fields_parameter, "select", "fields_parameter applied");
  expect_eq(static_cast<size_t>(options.indent), 4, "indent applied");
  expect_eq(options.parse_options.max_depth, 8, "max_depth applied");
  std::filesystem::remove(path);
}

void test_config_invalid_value() {
  auto path = write_temp("partialjson_test_bad_config.toml",
                         "[parser]\n"
                         "max_depth = 0\n");
  Settings settings;
  std::string error;
  expect_true(!partialjson::cli::load_config(path.string(), settings, error), "zero depth rejected");
  expect_true(error.find("line 2") != std::string::npos, "error names the line: " + error);
  std::filesystem::remove(path);
}

void test_config_missing_file() {
  Settings settings;
  std::string error;
  bool ok = partialjson::cli::load_config("/nonexistent/partialjson/config.toml", settings, error);
  expect_true(!ok, "missing file not loaded");
  expect_true(error.empty(), "missing file is not an error");
}

void test_cli_utils_io() {
  expect_true(partialjson::cli::is_url("https://example.com/a.json"), "https is a url");
  expect_true(!partialjson::cli::is_url("./data/a.json"), "path is not a url");
  auto path = write_temp("partialjson_test_input.json", R"({"a":1})");
  expect_str(partialjson::cli::load_input(path.string(), 1000), R"({"a":1})", "file loaded");
  std::filesystem::remove(path);
  bool threw = false;
  try {
    partialjson::cli::read_file("/nonexistent/partialjson/input.json");
  } catch (const std::exception&) {
    threw = true;
  }
  expect_true(threw, "missing input throws");
}

}  // namespace

void register_cli_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cli_args_basic", test_cli_args_basic});
  tests.push_back({"cli_args_errors", test_cli_args_errors});
  tests.push_back({"config_load", test_config_load});
  tests.push_back({"config_invalid_value", test_config_invalid_value});
  tests.push_back({"config_missing_file", test_config_missing_file});
  tests.push_back({"cli_utils_io", test_cli_utils_io});
}
