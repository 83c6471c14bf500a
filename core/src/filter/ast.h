#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "jnav/json_value.h"

namespace jnav::filter {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// One node of a parsed filter. Postfix forms (field, index, slice, iterate,
/// optional) apply to `target`; Pipe and Comma combine `left` and `right`.
struct Expr {
  enum class Kind {
    Identity,
    RecurseAll,
    Field,
    Index,
    Slice,
    Iterate,
    Optional,
    Pipe,
    Comma,
    Literal,
    Collect,
    Call,
  } kind = Kind::Identity;
  ExprPtr target;
  ExprPtr left;
  ExprPtr right;
  /// Index expression for Index, bounds for Slice (either may be null).
  ExprPtr index;
  ExprPtr slice_from;
  ExprPtr slice_to;
  /// Field name or builtin name.
  std::string name;
  Json literal;
  Span span;
};

}  // namespace jnav::filter
