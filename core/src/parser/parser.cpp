#include "parser_internal.h"
#include "fields_parser_impl.h"

#include <utility>

namespace partialjson {

/// Constructs a parser over a selector and its guardrails.
/// MUST NOT read tokens until parse() has applied the length guardrail.
Parser::Parser(const std::string& input, const ParseOptions& options)
    : input_(input), options_(options), lexer_(input) {}

/// Parses a full selector and returns either a Selection or a ParseError.
/// MUST consume all tokens or report the first unexpected trailing token.
/// Inputs are internal state; outputs are FieldsResult.
FieldsResult Parser::parse() {
  if (input_.size() > options_.max_length) {
    set_error_at("Selector exceeds maximum length of " +
                     std::to_string(options_.max_length) + " bytes",
                 options_.max_length);
    return error_result();
  }
  advance();
  FieldsResult res;
  if (current_.type == TokenType::End) {
    // WHY: an empty or whitespace-only selector requests no filtering.
    res.selection = Selection{};
    return res;
  }
  Selection root;
  if (!parse_group(root, 0)) return error_result();
  if (current_.type != TokenType::End) {
    if (current_.type == TokenType::RParen) {
      set_error("Unbalanced ')' without matching '('");
    } else {
      set_error("Expected ',' or end of selector but found " + describe(current_));
    }
    return error_result();
  }
  res.selection = std::move(root);
  return res;
}

/// Parses a comma-separated list of items into target.
/// MUST stop at the first token that is not a comma after an item.
bool Parser::parse_group(Selection& target, size_t depth) {
  if (!parse_item(target, depth)) return false;
  while (current_.type == TokenType::Comma) {
    advance();
    if (!parse_item(target, depth)) return false;
  }
  return true;
}

/// Parses one item: a wildcard, a field, a field with a subgroup or a slash chain.
/// MUST merge repeated field names into the existing entry of target.
/// Inputs are tokens; outputs are entries added to target or an error.
bool Parser::parse_item(Selection& target, size_t depth) {
  if (current_.type == TokenType::Star) {
    advance();
    if (current_.type == TokenType::LParen) {
      return set_error("Wildcard cannot have a sub-selection");
    }
    if (current_.type == TokenType::Slash) {
      return set_error("Wildcard cannot be followed by '/'");
    }
    target.set_wildcard();
    return true;
  }
  if (current_.type != TokenType::Name) {
    return unexpected_token();
  }
  std::string name = current_.text;
  advance();
  Selection sub;
  if (current_.type == TokenType::LParen) {
    if (!parse_subgroup(name, sub, depth + 1)) return false;
  } else if (current_.type == TokenType::Slash) {
    if (!parse_slash_chain(name, sub, depth + 1)) return false;
  }
  target.add(name, std::move(sub));
  return true;
}

/// Parses `( group )` following a field name.
/// MUST reject empty parentheses and MUST require the closing ')'.
bool Parser::parse_subgroup(const std::string& name, Selection& sub, size_t depth) {
  if (!check_depth(depth)) return false;
  advance();
  if (current_.type == TokenType::RParen) {
    return set_error("Empty sub-selection for field '" + name + "'");
  }
  if (!parse_group(sub, depth)) return false;
  return consume(TokenType::RParen, "Expected ')' to close sub-selection of '" + name + "'");
}

/// Parses `/ item` following a field name; `a/b/c` becomes `a(b(c))`.
/// MUST require a field name or wildcard right after the slash.
bool Parser::parse_slash_chain(const std::string& name, Selection& sub, size_t depth) {
  if (!check_depth(depth)) return false;
  advance();
  if (current_.type != TokenType::Name && current_.type != TokenType::Star) {
    return set_error("Expected field name after '/' following '" + name + "'");
  }
  return parse_item(sub, depth);
}

bool Parser::check_depth(size_t depth) {
  if (depth > options_.max_depth) {
    return set_error("Selector nesting exceeds maximum depth of " +
                     std::to_string(options_.max_depth));
  }
  return true;
}

/// Reports the error for a token that cannot start an item.
/// MUST name the offending punctuation so empty field names are obvious.
bool Parser::unexpected_token() {
  switch (current_.type) {
    case TokenType::Comma:
      return set_error("Expected field name before ','");
    case TokenType::LParen:
      return set_error("Expected field name before '('");
    case TokenType::RParen:
      return set_error("Expected field name before ')'");
    case TokenType::Slash:
      return set_error("Expected field name before '/'");
    case TokenType::End:
      return set_error("Expected field name at end of selector");
    default:
      return set_error("Unexpected " + describe(current_));
  }
}

FieldsResult parse_fields_impl(const std::string& input, const ParseOptions& options) {
  Parser parser(input, options);
  return parser.parse();
}

}  // namespace partialjson
