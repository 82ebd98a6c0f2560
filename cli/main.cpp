#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "partialjson/errors.h"
#include "partialjson/executor.h"
#include "partialjson/fields_parser.h"
#include "partialjson/selection.h"

namespace {

constexpr int kExitRejected = 2;

partialjson::FieldsResult read_fields(const partialjson::cli::CliOptions& cli,
                                      const partialjson::PartialJsonOptions& options) {
  if (cli.query_string.has_value()) {
    return partialjson::fields_from_query_string(*cli.query_string, options);
  }
  return partialjson::parse_optional_fields(cli.fields, options.parse_options);
}

std::string selector_text(const partialjson::cli::CliOptions& cli,
                          const partialjson::PartialJsonOptions& options) {
  if (cli.fields.has_value()) return *cli.fields;
  if (cli.query_string.has_value()) {
    return partialjson::query_parameter(*cli.query_string, options.fields_parameter).value_or("");
  }
  return {};
}

}  // namespace

int main(int argc, char** argv) {
  partialjson::cli::CliOptions cli;
  std::string error;
  if (!partialjson::cli::parse_cli_args(argc, argv, cli, error)) {
    std::cerr << "Error: " << error << std::endl;
    std::cerr << "Run with --help for usage." << std::endl;
    return 1;
  }
  if (cli.show_help) {
    partialjson::cli::print_help(std::cout);
    return 0;
  }

  partialjson::PartialJsonOptions options;
  std::string config_path =
      cli.config_path.empty() ? partialjson::cli::resolve_config_path() : cli.config_path;
  partialjson::cli::Settings settings;
  if (partialjson::cli::load_config(config_path, settings, error)) {
    partialjson::cli::apply_settings(settings, options);
  } else if (!error.empty()) {
    std::cerr << "Error: " << error << std::endl;
    return 1;
  }
  if (cli.ignore_case.has_value()) options.ignore_case = *cli.ignore_case;
  if (cli.ignore_parse_errors.has_value()) options.ignore_parse_errors = *cli.ignore_parse_errors;
  if (cli.indent.has_value()) options.indent = *cli.indent;

  try {
    partialjson::FieldsResult fields = read_fields(cli, options);
    if (fields.is_error()) {
      std::cerr << partialjson::format_parse_error(selector_text(cli, options), *fields.error)
                << std::endl;
    }

    if (cli.explain) {
      if (fields.is_error()) return kExitRejected;
      if (fields.is_absent()) {
        std::cout << "(no selector: everything is serialized)" << std::endl;
      } else if (fields.selection->empty()) {
        std::cout << "(empty selector: everything is serialized)" << std::endl;
      } else {
        std::cout << partialjson::to_string(*fields.selection) << std::endl;
      }
      return 0;
    }

    partialjson::PartialJsonExecutor executor([fields]() { return fields; }, options);
    partialjson::PartialJsonResult result;
    result.value = nlohmann::json::parse(partialjson::cli::load_input(cli.input, cli.timeout_ms));
    partialjson::PartialJsonResponse response = executor.execute(result);
    if (response.status_code == partialjson::kStatusBadRequest) {
      return kExitRejected;
    }
    std::cout << response.body << std::endl;
  } catch (const partialjson::ConfigurationError& e) {
    std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
