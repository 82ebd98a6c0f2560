#pragma once

#include <optional>
#include <string>

#include "partialjson/fields_parser.h"
#include "lexer.h"

namespace partialjson {

/// Implements recursive-descent parsing over the selector token stream.
/// MUST set error_ on the first failure and stop; no backtracking.
/// Inputs are lexer tokens; outputs are FieldsResult with no side effects.
class Parser {
 public:
  Parser(const std::string& input, const ParseOptions& options);
  FieldsResult parse();

 private:
  bool parse_group(Selection& target, size_t depth);
  bool parse_item(Selection& target, size_t depth);
  bool parse_subgroup(const std::string& name, Selection& sub, size_t depth);
  bool parse_slash_chain(const std::string& name, Selection& sub, size_t depth);
  bool check_depth(size_t depth);

  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  bool set_error_at(const std::string& message, size_t pos);
  bool unexpected_token();
  FieldsResult error_result();

  void advance();

  static std::string describe(const Token& token);

  const std::string& input_;
  ParseOptions options_;
  Lexer lexer_;
  Token current_{};
  std::optional<ParseError> error_;
};

}  // namespace partialjson
