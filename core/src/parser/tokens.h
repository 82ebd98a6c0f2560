#pragma once

#include <cstddef>
#include <string>

namespace partialjson {

/// Enumerates lexical tokens produced by the selector lexer.
/// MUST remain consistent with the punctuation the parser expects.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Name,
  Comma,
  Slash,
  LParen,
  RParen,
  Star,
  End
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// Inputs are lexer output; outputs are consumed by the parser.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
};

}  // namespace partialjson
