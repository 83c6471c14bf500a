#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "jnav/json_value.h"

namespace jnav {

/// Raised for unparsable filter text or a runtime type error during evaluation.
class FilterError : public std::runtime_error {
 public:
  static constexpr size_t kNoPosition = static_cast<size_t>(-1);

  explicit FilterError(const std::string& message, size_t position = kNoPosition)
      : std::runtime_error(message), position_(position) {}

  size_t position() const { return position_; }

 private:
  size_t position_;
};

/// Evaluates a filter expression over a sequence of input values.
/// Implementations MUST be free of side effects and MUST be callable from a worker thread.
class IFilterEngine {
 public:
  virtual ~IFilterEngine() = default;
  /// Returns the concatenated outputs for every input value, in input order.
  /// MUST throw FilterError when the query cannot be parsed or evaluated.
  virtual std::vector<Json> evaluate(const std::string& query, const std::vector<Json>& inputs) = 0;
};

/// Built-in engine for the path-oriented subset of the jq language:
/// `.`, `.key`, `."key"`, `.[n]`, `.[]`, `.[a:b]`, `..`, `?`, `|`, `,`, `( )`, `[ ]`,
/// literals and the builtins keys, keys_unsorted, length, type, first, last, reverse, add, not, empty.
class PathFilterEngine final : public IFilterEngine {
 public:
  std::vector<Json> evaluate(const std::string& query, const std::vector<Json>& inputs) override;
};

}  // namespace jnav
