#include "parser_internal.h"

namespace partialjson {

/// Consumes a token of the expected type or sets a parse error.
/// MUST advance the token stream on success.
/// Inputs are token type/message; outputs are success or error.
bool Parser::consume(TokenType type, const std::string& message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

/// Records the first parse error at the current token.
/// MUST preserve the earliest error position for clarity.
/// Inputs are error message; outputs are false with stored error.
bool Parser::set_error(const std::string& message) {
  return set_error_at(message, current_.pos);
}

bool Parser::set_error_at(const std::string& message, size_t pos) {
  if (!error_.has_value()) {
    error_ = ParseError{message, pos};
  }
  return false;
}

/// Produces a FieldsResult using the recorded error.
/// MUST return no selection alongside the stored error.
FieldsResult Parser::error_result() {
  FieldsResult res;
  res.error = error_;
  return res;
}

/// Advances to the next token in the input stream.
/// MUST be called after consuming tokens to keep state in sync.
void Parser::advance() {
  current_ = lexer_.next();
}

std::string Parser::describe(const Token& token) {
  switch (token.type) {
    case TokenType::Name:
      return "field name '" + token.text + "'";
    case TokenType::Star:
      return "'*'";
    case TokenType::End:
      return "end of selector";
    default:
      return "'" + token.text + "'";
  }
}

}  // namespace partialjson
