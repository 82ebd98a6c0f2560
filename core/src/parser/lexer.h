#pragma once

#include <string>

#include "tokens.h"

namespace partialjson {

/// Tokenizes selector input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are selector strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  /// Inputs are internal state; outputs are tokens with positions.
  Token next();

 private:
  /// Lexes a field name up to the next punctuation character.
  /// MUST trim trailing whitespace and keep interior whitespace.
  Token lex_name();
  void skip_ws();
  static bool is_punct(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace partialjson
