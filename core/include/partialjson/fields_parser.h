#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "partialjson/selection.h"

namespace partialjson {

/// Upper bound on selector input size accepted by default.
constexpr size_t kMaxSelectorLength = 64 * 1024;
/// Upper bound on `(` and `/` nesting accepted by default.
constexpr size_t kMaxNestingDepth = 64;

/// Guardrails applied while parsing a selector.
/// MUST be non-zero; violations are reported as ordinary parse errors.
struct ParseOptions {
  size_t max_length = kMaxSelectorLength;
  size_t max_depth = kMaxNestingDepth;
};

/// Describes a selector syntax error with a message and byte position.
/// MUST report positions relative to the original selector string.
/// Inputs are parser diagnostics; outputs are error details only.
struct ParseError {
  std::string message;
  size_t position = 0;
};

/// Outcome of reading the selector for one request.
/// MUST hold at most one of selection or error; holding neither means no selector
/// was supplied, which callers treat as "serialize everything".
/// Inputs are parser outputs; side effects are none.
struct FieldsResult {
  std::optional<Selection> selection;
  std::optional<ParseError> error;

  bool is_present() const { return selection.has_value(); }
  bool is_error() const { return error.has_value(); }
  bool is_absent() const { return !is_present() && !is_error(); }
};

/// Parses a selector string such as `kind,items(title,id),owner/name`.
/// MUST return errors without throwing on invalid syntax and MUST NOT return a
/// partially built tree alongside an error.
/// Inputs are selector text; outputs are FieldsResult with selection or error.
FieldsResult parse_fields(const std::string& input, const ParseOptions& options = {});

/// Parses a selector that may be missing entirely.
/// MUST return an absent result for std::nullopt and defer to parse_fields otherwise.
FieldsResult parse_optional_fields(const std::optional<std::string>& input,
                                   const ParseOptions& options = {});

/// Renders a parse error with the selector and a caret under the failing byte.
std::string format_parse_error(const std::string& input, const ParseError& error);

}  // namespace partialjson
