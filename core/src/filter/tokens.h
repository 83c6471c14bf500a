#pragma once

#include <cstddef>
#include <string>

namespace jnav::filter {

/// Enumerates lexical tokens produced by the filter lexer.
enum class TokenType {
  Dot,
  DotDot,
  Field,
  Identifier,
  String,
  Number,
  LBracket,
  RBracket,
  LParen,
  RParen,
  Pipe,
  Comma,
  Colon,
  Question,
  Minus,
  End,
  Invalid,
};

/// Represents a single token with decoded text and its byte position.
/// Field tokens carry the name without the leading dot; String tokens carry decoded contents.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t pos = 0;
};

const char* token_type_name(TokenType type);

}  // namespace jnav::filter
