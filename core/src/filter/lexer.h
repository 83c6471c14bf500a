#pragma once

#include <string>
#include <vector>

#include "filter/tokens.h"

namespace jnav::filter {

/// Tokenizes filter text for the parser.
/// MUST NOT outlive the referenced input buffer.
class Lexer {
 public:
  explicit Lexer(const std::string& input);

  /// Produces the next token and advances. Returns End at input exhaustion and
  /// Invalid (with the message as text) for malformed input.
  Token next();

  /// Lexes the whole input, stopping after the first End or Invalid token.
  std::vector<Token> tokenize();

 private:
  Token lex_string();
  Token lex_number();
  Token lex_identifier(TokenType type, size_t start);
  void skip_ws();
  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace jnav::filter
