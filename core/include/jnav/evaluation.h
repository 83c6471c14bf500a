#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "jnav/filter_engine.h"
#include "jnav/json_value.h"

namespace jnav {

enum class EvaluationStatus {
  Pending,
  Success,
  Failure,
};

/// Outcome of one filter evaluation, stamped with the generation it was computed for.
struct EvaluationResult {
  EvaluationStatus status = EvaluationStatus::Pending;
  uint64_t generation = 0;
  std::string query;
  std::vector<Json> values;
  std::string error_message;
  /// True when the failure is an empty or all-null result rather than an engine error.
  bool soft_failure = false;
};

/// Runs `query` through `engine` and classifies the outcome.
/// MUST NOT throw: engine errors, empty results and all-null results become Failure.
EvaluationResult run_evaluation(IFilterEngine& engine,
                                const std::string& query,
                                const std::vector<Json>& inputs,
                                uint64_t generation);

}  // namespace jnav
