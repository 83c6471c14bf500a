#include "filter/lexer.h"

#include <cctype>

#include "jnav/json_value.h"

namespace jnav::filter {

const char* token_type_name(TokenType type) {
  switch (type) {
    case TokenType::Dot:
      return "'.'";
    case TokenType::DotDot:
      return "'..'";
    case TokenType::Field:
      return "field";
    case TokenType::Identifier:
      return "identifier";
    case TokenType::String:
      return "string";
    case TokenType::Number:
      return "number";
    case TokenType::LBracket:
      return "'['";
    case TokenType::RBracket:
      return "']'";
    case TokenType::LParen:
      return "'('";
    case TokenType::RParen:
      return "')'";
    case TokenType::Pipe:
      return "'|'";
    case TokenType::Comma:
      return "','";
    case TokenType::Colon:
      return "':'";
    case TokenType::Question:
      return "'?'";
    case TokenType::Minus:
      return "'-'";
    case TokenType::End:
      return "end of input";
    case TokenType::Invalid:
      return "invalid token";
  }
  return "token";
}

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) return Token{TokenType::End, "", pos_};

  size_t start = pos_;
  char c = input_[pos_];
  switch (c) {
    case '.':
      ++pos_;
      if (pos_ < input_.size() && input_[pos_] == '.') {
        ++pos_;
        return Token{TokenType::DotDot, "..", start};
      }
      if (pos_ < input_.size() && is_ident_start(input_[pos_])) {
        return lex_identifier(TokenType::Field, start);
      }
      return Token{TokenType::Dot, ".", start};
    case '[':
      ++pos_;
      return Token{TokenType::LBracket, "[", start};
    case ']':
      ++pos_;
      return Token{TokenType::RBracket, "]", start};
    case '(':
      ++pos_;
      return Token{TokenType::LParen, "(", start};
    case ')':
      ++pos_;
      return Token{TokenType::RParen, ")", start};
    case '|':
      ++pos_;
      return Token{TokenType::Pipe, "|", start};
    case ',':
      ++pos_;
      return Token{TokenType::Comma, ",", start};
    case ':':
      ++pos_;
      return Token{TokenType::Colon, ":", start};
    case '?':
      ++pos_;
      return Token{TokenType::Question, "?", start};
    case '-':
      ++pos_;
      return Token{TokenType::Minus, "-", start};
    case '"':
      return lex_string();
    default:
      break;
  }
  if (std::isdigit(static_cast<unsigned char>(c))) return lex_number();
  if (is_ident_start(c)) return lex_identifier(TokenType::Identifier, start);

  ++pos_;
  return Token{TokenType::Invalid, std::string("unexpected character '") + c + "'", start};
}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> out;
  while (true) {
    Token token = next();
    TokenType type = token.type;
    out.push_back(std::move(token));
    if (type == TokenType::End || type == TokenType::Invalid) break;
  }
  return out;
}

Token Lexer::lex_string() {
  size_t start = pos_;
  size_t i = pos_ + 1;
  while (i < input_.size()) {
    if (input_[i] == '\\') {
      i += 2;
      continue;
    }
    if (input_[i] == '"') break;
    ++i;
  }
  if (i >= input_.size()) {
    pos_ = input_.size();
    return Token{TokenType::Invalid, "unterminated string literal", start};
  }
  pos_ = i + 1;
  // JSON escapes are a subset of the filter language's string escapes.
  Json decoded = Json::parse(input_.substr(start, pos_ - start), nullptr, false);
  if (decoded.is_discarded() || !decoded.is_string()) {
    return Token{TokenType::Invalid, "invalid escape in string literal", start};
  }
  return Token{TokenType::String, decoded.get<std::string>(), start};
}

Token Lexer::lex_number() {
  size_t start = pos_;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
  if (pos_ + 1 < input_.size() && input_[pos_] == '.' &&
      std::isdigit(static_cast<unsigned char>(input_[pos_ + 1]))) {
    ++pos_;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
  }
  if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
    size_t exp = pos_ + 1;
    if (exp < input_.size() && (input_[exp] == '+' || input_[exp] == '-')) ++exp;
    if (exp < input_.size() && std::isdigit(static_cast<unsigned char>(input_[exp]))) {
      pos_ = exp;
      while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
  }
  return Token{TokenType::Number, input_.substr(start, pos_ - start), start};
}

Token Lexer::lex_identifier(TokenType type, size_t start) {
  size_t name_start = pos_;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) ++pos_;
  return Token{type, input_.substr(name_start, pos_ - name_start), start};
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace jnav::filter
