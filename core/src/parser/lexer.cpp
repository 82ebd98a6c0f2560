#include "lexer.h"

#include <cctype>

namespace partialjson {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", pos_};
  }

  char c = input_[pos_];
  if (c == ',') {
    ++pos_;
    return Token{TokenType::Comma, ",", pos_ - 1};
  }
  if (c == '/') {
    ++pos_;
    return Token{TokenType::Slash, "/", pos_ - 1};
  }
  if (c == '(') {
    ++pos_;
    return Token{TokenType::LParen, "(", pos_ - 1};
  }
  if (c == ')') {
    ++pos_;
    return Token{TokenType::RParen, ")", pos_ - 1};
  }
  return lex_name();
}

Token Lexer::lex_name() {
  size_t start = pos_;
  while (pos_ < input_.size() && !is_punct(input_[pos_])) {
    ++pos_;
  }
  size_t end = pos_;
  while (end > start && std::isspace(static_cast<unsigned char>(input_[end - 1]))) {
    --end;
  }
  std::string text = input_.substr(start, end - start);
  // WHY: a lone `*` is the wildcard; `*` inside a longer name is an ordinary character.
  if (text == "*") {
    return Token{TokenType::Star, text, start};
  }
  return Token{TokenType::Name, text, start};
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
}

bool Lexer::is_punct(char c) {
  return c == ',' || c == '/' || c == '(' || c == ')';
}

}  // namespace partialjson
