#include "filter/parser.h"

#include <array>
#include <utility>

#include "filter/lexer.h"
#include "util/string_util.h"

namespace jnav::filter {

namespace {

constexpr std::array<const char*, 10> kBuiltinNames = {
    "keys", "keys_unsorted", "length", "type", "first",
    "last", "reverse", "not", "empty", "add",
};

std::shared_ptr<Expr> make_expr(Expr::Kind kind, size_t start, size_t end) {
  auto node = std::make_shared<Expr>();
  node->kind = kind;
  node->span = Span{start, end};
  return node;
}

ExprPtr make_field(const ExprPtr& target, const std::string& name, size_t start, size_t end) {
  auto node = make_expr(Expr::Kind::Field, start, end);
  node->target = target;
  node->name = name;
  return node;
}

}  // namespace

bool is_builtin_name(const std::string& name) {
  for (const char* builtin : kBuiltinNames) {
    if (name == builtin) return true;
  }
  return false;
}

ParseResult parse_filter(const std::string& input) {
  if (util::trim_ws(input).empty()) {
    ParseResult result;
    result.expr = make_expr(Expr::Kind::Identity, 0, 0);
    return result;
  }
  Lexer lexer(input);
  Parser parser(lexer.tokenize());
  return parser.parse();
}

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  if (tokens_.empty()) tokens_.push_back(Token{TokenType::End, "", 0});
}

ParseResult Parser::parse() {
  ParseResult result;
  ExprPtr expr;
  if (parse_pipe(expr) && current().type != TokenType::End) {
    set_unexpected();
  }
  if (error_.has_value()) {
    result.error = error_;
    return result;
  }
  result.expr = expr;
  return result;
}

bool Parser::parse_pipe(ExprPtr& out) {
  ExprPtr left;
  if (!parse_comma(left)) return false;
  if (current().type != TokenType::Pipe) {
    out = left;
    return true;
  }
  size_t op_pos = current().pos;
  advance();
  ExprPtr right;
  if (!parse_pipe(right)) return false;
  auto node = make_expr(Expr::Kind::Pipe, op_pos, current().pos);
  node->left = left;
  node->right = right;
  out = node;
  return true;
}

bool Parser::parse_comma(ExprPtr& out) {
  ExprPtr left;
  if (!parse_postfix(left)) return false;
  while (current().type == TokenType::Comma) {
    size_t op_pos = current().pos;
    advance();
    ExprPtr right;
    if (!parse_postfix(right)) return false;
    auto node = make_expr(Expr::Kind::Comma, op_pos, current().pos);
    node->left = left;
    node->right = right;
    left = node;
  }
  out = left;
  return true;
}

bool Parser::parse_postfix(ExprPtr& out) {
  ExprPtr base;
  if (!parse_primary(base)) return false;
  while (true) {
    const Token& token = current();
    if (token.type == TokenType::Field) {
      base = make_field(base, token.text, token.pos, token.pos + token.text.size() + 1);
      advance();
    } else if (token.type == TokenType::Dot && peek(1).type == TokenType::String) {
      size_t start = token.pos;
      advance();
      std::string name = current().text;
      advance();
      base = make_field(base, name, start, current().pos);
    } else if (token.type == TokenType::Dot && peek(1).type == TokenType::LBracket) {
      size_t start = token.pos;
      advance();
      if (!parse_bracket_suffix(base, start, base)) return false;
    } else if (token.type == TokenType::LBracket) {
      if (!parse_bracket_suffix(base, token.pos, base)) return false;
    } else if (token.type == TokenType::Question) {
      auto node = make_expr(Expr::Kind::Optional, token.pos, token.pos + 1);
      node->target = base;
      base = node;
      advance();
    } else {
      break;
    }
  }
  out = base;
  return true;
}

bool Parser::parse_bracket_suffix(const ExprPtr& target, size_t start, ExprPtr& out) {
  if (!consume(TokenType::LBracket, "Expected [")) return false;
  if (current().type == TokenType::RBracket) {
    advance();
    auto node = make_expr(Expr::Kind::Iterate, start, current().pos);
    node->target = target;
    out = node;
    return true;
  }
  ExprPtr from;
  if (current().type != TokenType::Colon) {
    if (!parse_pipe(from)) return false;
  }
  if (current().type == TokenType::Colon) {
    advance();
    ExprPtr to;
    if (current().type != TokenType::RBracket) {
      if (!parse_pipe(to)) return false;
    }
    if (!consume(TokenType::RBracket, "Expected ] to close slice")) return false;
    if (!from && !to) return set_error("Slice needs at least one bound");
    auto node = make_expr(Expr::Kind::Slice, start, current().pos);
    node->target = target;
    node->slice_from = from;
    node->slice_to = to;
    out = node;
    return true;
  }
  if (!consume(TokenType::RBracket, "Expected ] to close index")) return false;
  auto node = make_expr(Expr::Kind::Index, start, current().pos);
  node->target = target;
  node->index = from;
  out = node;
  return true;
}

bool Parser::parse_primary(ExprPtr& out) {
  const Token token = current();
  switch (token.type) {
    case TokenType::Dot: {
      advance();
      auto identity = make_expr(Expr::Kind::Identity, token.pos, token.pos + 1);
      if (current().type == TokenType::String) {
        std::string name = current().text;
        advance();
        out = make_field(identity, name, token.pos, current().pos);
        return true;
      }
      out = identity;
      return true;
    }
    case TokenType::DotDot:
      advance();
      out = make_expr(Expr::Kind::RecurseAll, token.pos, token.pos + 2);
      return true;
    case TokenType::Field: {
      advance();
      auto identity = make_expr(Expr::Kind::Identity, token.pos, token.pos + 1);
      out = make_field(identity, token.text, token.pos, token.pos + token.text.size() + 1);
      return true;
    }
    case TokenType::Number:
    case TokenType::Minus: {
      bool negative = token.type == TokenType::Minus;
      if (negative) {
        advance();
        if (current().type != TokenType::Number) return set_unexpected();
      }
      std::string text = (negative ? "-" : "") + current().text;
      auto node = make_expr(Expr::Kind::Literal, token.pos, current().pos + current().text.size());
      node->literal = Json::parse(text, nullptr, false);
      if (node->literal.is_discarded()) return set_error("Invalid number literal: " + text);
      advance();
      out = node;
      return true;
    }
    case TokenType::String: {
      advance();
      auto node = make_expr(Expr::Kind::Literal, token.pos, current().pos);
      node->literal = token.text;
      out = node;
      return true;
    }
    case TokenType::Identifier: {
      advance();
      auto node = make_expr(Expr::Kind::Literal, token.pos, token.pos + token.text.size());
      if (token.text == "true") {
        node->literal = true;
      } else if (token.text == "false") {
        node->literal = false;
      } else if (token.text == "null") {
        node->literal = nullptr;
      } else if (is_builtin_name(token.text)) {
        node->kind = Expr::Kind::Call;
        node->name = token.text;
      } else {
        error_ = ParseError{token.text + "/0 is not defined", token.pos};
        return false;
      }
      out = node;
      return true;
    }
    case TokenType::LParen: {
      advance();
      ExprPtr inner;
      if (!parse_pipe(inner)) return false;
      if (!consume(TokenType::RParen, "Expected ) to close expression")) return false;
      out = inner;
      return true;
    }
    case TokenType::LBracket: {
      advance();
      auto node = make_expr(Expr::Kind::Collect, token.pos, token.pos);
      if (current().type != TokenType::RBracket) {
        ExprPtr inner;
        if (!parse_pipe(inner)) return false;
        node->target = inner;
      }
      if (!consume(TokenType::RBracket, "Expected ] to close array")) return false;
      node->span.end = current().pos;
      out = node;
      return true;
    }
    default:
      return set_unexpected();
  }
}

const Token& Parser::current() const {
  return peek(0);
}

const Token& Parser::peek(size_t ahead) const {
  size_t i = index_ + ahead;
  if (i >= tokens_.size()) return tokens_.back();
  return tokens_[i];
}

void Parser::advance() {
  if (index_ + 1 < tokens_.size()) ++index_;
}

bool Parser::consume(TokenType type, const std::string& message) {
  if (current().type != type) return set_error(message);
  advance();
  return true;
}

bool Parser::set_error(const std::string& message) {
  if (!error_.has_value()) {
    error_ = ParseError{message + " at position " + std::to_string(current().pos), current().pos};
  }
  return false;
}

bool Parser::set_unexpected() {
  const Token& token = current();
  if (token.type == TokenType::Invalid) return set_error(token.text);
  return set_error(std::string("syntax error, unexpected ") + token_type_name(token.type));
}

}  // namespace jnav::filter
