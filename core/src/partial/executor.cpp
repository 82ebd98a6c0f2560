#include "partialjson/executor.h"

#include <utility>

#include "partialjson/errors.h"
#include "partialjson/json_filter.h"
#include "util/string_util.h"

namespace partialjson {

const char* const kDefaultContentType = "application/json; charset=utf-8";

namespace {

void validate_options(const PartialJsonOptions& options) {
  if (options.fields_parameter.empty()) {
    throw ConfigurationError("fields_parameter must not be empty");
  }
  if (options.parse_options.max_length == 0) {
    throw ConfigurationError("parse_options.max_length must be greater than zero");
  }
  if (options.parse_options.max_depth == 0) {
    throw ConfigurationError("parse_options.max_depth must be greater than zero");
  }
}

// Invalid UTF-8 in handler strings is replaced with U+FFFD instead of throwing.
std::string dump_body(const nlohmann::json& value, int indent) {
  return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::optional<std::string> query_parameter(const std::string& query, const std::string& name) {
  std::string raw = query;
  if (!raw.empty() && raw.front() == '?') {
    raw.erase(0, 1);
  }
  std::optional<std::string> joined;
  size_t start = 0;
  while (start <= raw.size()) {
    size_t end = raw.find('&', start);
    if (end == std::string::npos) end = raw.size();
    std::string pair = raw.substr(start, end - start);
    size_t eq = pair.find('=');
    if (!pair.empty() && util::percent_decode(pair.substr(0, eq)) == name) {
      std::string value = eq == std::string::npos ? "" : util::percent_decode(pair.substr(eq + 1));
      if (joined.has_value()) {
        joined->push_back(',');
        joined->append(value);
      } else {
        joined = value;
      }
    }
    start = end + 1;
  }
  return joined;
}

FieldsResult fields_from_query_string(const std::string& query, const PartialJsonOptions& options) {
  return parse_optional_fields(query_parameter(query, options.fields_parameter), options.parse_options);
}

PartialJsonExecutor::PartialJsonExecutor(FieldsProvider fields_provider, PartialJsonOptions options)
    : fields_provider_(std::move(fields_provider)), options_(std::move(options)) {
  if (!fields_provider_) {
    throw ConfigurationError("PartialJsonExecutor requires a fields provider");
  }
  validate_options(options_);
}

PartialJsonResponse PartialJsonExecutor::execute(const PartialJsonResult& result) const {
  PartialJsonResponse response;
  FieldsResult fields = fields_provider_();

  if (fields.is_error() && !options_.ignore_parse_errors) {
    response.status_code = kStatusBadRequest;
    return response;
  }

  response.content_type = result.content_type.empty() ? kDefaultContentType : result.content_type;
  if (result.status_code.has_value()) {
    response.status_code = *result.status_code;
  }

  int indent = result.indent.value_or(options_.indent);
  if (fields.is_present()) {
    nlohmann::json filtered = filter_json(result.value, *fields.selection, options_.ignore_case);
    response.body = dump_body(filtered, indent);
  } else {
    response.body = dump_body(result.value, indent);
  }
  return response;
}

}  // namespace partialjson
