#pragma once

#include <optional>
#include <string>
#include <vector>

#include "filter/ast.h"
#include "filter/tokens.h"

namespace jnav::filter {

struct ParseError {
  std::string message;
  size_t position = 0;
};

struct ParseResult {
  ExprPtr expr;
  std::optional<ParseError> error;
};

/// Parses filter text into an expression tree.
/// Blank text parses as identity.
ParseResult parse_filter(const std::string& input);

/// Recursive-descent parser over a pre-lexed token list.
/// Precedence from loosest: `|` (right associative), `,`, postfix suffixes.
class Parser {
 public:
  explicit Parser(std::vector<Token> tokens);

  ParseResult parse();

 private:
  bool parse_pipe(ExprPtr& out);
  bool parse_comma(ExprPtr& out);
  bool parse_postfix(ExprPtr& out);
  bool parse_primary(ExprPtr& out);
  bool parse_bracket_suffix(const ExprPtr& target, size_t start, ExprPtr& out);

  const Token& current() const;
  const Token& peek(size_t ahead) const;
  void advance();
  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  bool set_unexpected();

  std::vector<Token> tokens_;
  size_t index_ = 0;
  std::optional<ParseError> error_;
};

/// Returns true for builtin names the evaluator understands.
bool is_builtin_name(const std::string& name);

}  // namespace jnav::filter
