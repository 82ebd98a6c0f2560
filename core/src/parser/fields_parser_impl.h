#pragma once

#include <string>

#include "partialjson/fields_parser.h"

namespace partialjson {

/// Parses a selector string into a Selection tree with error reporting.
/// MUST be deterministic and MUST not throw on parse errors.
/// Inputs are selector text/guardrails; outputs are FieldsResult with optional error.
FieldsResult parse_fields_impl(const std::string& input, const ParseOptions& options);

}  // namespace partialjson
