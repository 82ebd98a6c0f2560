#pragma once

#include <string>

namespace partialjson::util {

/// Converts a string to lowercase for case-insensitive field lookup.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Decodes `%XX` escapes and `+` as used in URL query strings.
/// MUST leave malformed escapes untouched rather than fail.
/// Inputs are encoded strings; outputs are decoded bytes.
std::string percent_decode(const std::string& s);

}  // namespace partialjson::util
