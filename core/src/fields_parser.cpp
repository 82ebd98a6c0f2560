#include "partialjson/fields_parser.h"

#include <sstream>

#include "parser/fields_parser_impl.h"

namespace partialjson {

namespace {

/// One pad character per code point before byte offset end; tabs are kept.
std::string caret_padding(const std::string& input, size_t end) {
  std::string pad;
  for (size_t i = 0; i < end; ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    if ((c & 0xC0) == 0x80) continue;
    pad.push_back(c == '\t' ? '\t' : ' ');
  }
  return pad;
}

}  // namespace

FieldsResult parse_fields(const std::string& input, const ParseOptions& options) {
  return parse_fields_impl(input, options);
}

FieldsResult parse_optional_fields(const std::optional<std::string>& input,
                                   const ParseOptions& options) {
  if (!input.has_value()) {
    return FieldsResult{};
  }
  return parse_fields_impl(*input, options);
}

std::string format_parse_error(const std::string& input, const ParseError& error) {
  std::ostringstream oss;
  oss << "Invalid fields selector at position " << error.position << ": " << error.message << "\n";
  oss << "  " << input << "\n";
  // WHY: positions past the input (length guardrail) are clamped to its end.
  size_t caret = error.position > input.size() ? input.size() : error.position;
  oss << "  " << caret_padding(input, caret) << "^";
  return oss.str();
}

}  // namespace partialjson
