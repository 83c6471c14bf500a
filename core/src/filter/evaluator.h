#pragma once

#include <vector>

#include "filter/ast.h"
#include "jnav/json_value.h"

namespace jnav::filter {

/// Appends every output of `expr` applied to `input` to `out`.
/// MUST throw FilterError on type errors; outputs produced before the error stay in `out`.
void evaluate(const Expr& expr, const Json& input, std::vector<Json>& out);

}  // namespace jnav::filter
