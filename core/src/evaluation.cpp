#include "jnav/evaluation.h"

#include <algorithm>
#include <exception>

namespace jnav {

EvaluationResult run_evaluation(IFilterEngine& engine,
                                const std::string& query,
                                const std::vector<Json>& inputs,
                                uint64_t generation) {
  EvaluationResult result;
  result.generation = generation;
  result.query = query;
  try {
    result.values = engine.evaluate(query, inputs);
  } catch (const std::exception& ex) {
    result.status = EvaluationStatus::Failure;
    result.error_message = "Failed to execute query '" + query + "': " + ex.what();
    return result;
  } catch (...) {
    result.status = EvaluationStatus::Failure;
    result.error_message = "Failed to execute query '" + query + "': unknown error";
    return result;
  }

  if (result.values.empty()) {
    result.status = EvaluationStatus::Failure;
    result.soft_failure = true;
    result.error_message = "Query ('" + query + "') was executed, but no results were returned.";
    result.values.clear();
    return result;
  }
  bool all_null = std::all_of(result.values.begin(), result.values.end(),
                              [](const Json& value) { return value.is_null(); });
  if (all_null) {
    result.status = EvaluationStatus::Failure;
    result.soft_failure = true;
    result.error_message =
        "Query resulted in 'null', which may indicate a typo or incorrect query: '" + query + "'";
    result.values.clear();
    return result;
  }
  result.status = EvaluationStatus::Success;
  return result;
}

}  // namespace jnav
