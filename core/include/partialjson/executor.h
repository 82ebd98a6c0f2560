#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "partialjson/fields_parser.h"

namespace partialjson {

/// Settings shared by every request served through an executor.
/// MUST carry a non-empty fields_parameter and non-zero parser guardrails.
struct PartialJsonOptions {
  bool ignore_case = false;
  bool ignore_parse_errors = false;
  std::string fields_parameter = "fields";
  ParseOptions parse_options;
  /// Passed to nlohmann::json::dump; -1 renders compact output.
  int indent = -1;
};

/// Value produced by a request handler, before partial serialization.
struct PartialJsonResult {
  nlohmann::json value;
  std::optional<int> status_code;
  std::string content_type;
  /// Overrides PartialJsonOptions::indent for this result only.
  std::optional<int> indent;
};

/// Rendered response handed back to the transport.
struct PartialJsonResponse {
  int status_code = 200;
  std::string content_type;
  std::string body;
};

/// Supplies the parsed selector for the request being executed.
using FieldsProvider = std::function<FieldsResult()>;

constexpr int kStatusBadRequest = 400;
extern const char* const kDefaultContentType;

/// Returns the percent-decoded value of a query string parameter.
/// MUST join repeated occurrences with ',' and MUST return std::nullopt when absent.
/// Inputs are query strings (with or without '?'); outputs are decoded values.
std::optional<std::string> query_parameter(const std::string& query, const std::string& name);

/// Extracts the selector parameter from a raw query string and parses it.
/// MUST percent-decode values, MUST join repeated parameters with ',' and MUST
/// return an absent result when the parameter does not occur.
/// Inputs are query strings (with or without '?'); outputs are FieldsResult.
FieldsResult fields_from_query_string(const std::string& query, const PartialJsonOptions& options);

/// Serializes handler results honoring the request's field selector.
/// MUST reject syntax errors with 400 unless ignore_parse_errors is set, and
/// MUST NOT consult the matcher when the selector is absent or rejected.
/// Inputs are results; outputs are responses with no transport side effects.
class PartialJsonExecutor {
 public:
  /// Binds a fields provider and options for the executor's lifetime.
  /// MUST throw ConfigurationError for an empty provider or invalid options.
  PartialJsonExecutor(FieldsProvider fields_provider, PartialJsonOptions options);

  PartialJsonResponse execute(const PartialJsonResult& result) const;

  const PartialJsonOptions& options() const { return options_; }

 private:
  FieldsProvider fields_provider_;
  PartialJsonOptions options_;
};

}  // namespace partialjson
