#include "jnav/filter_engine.h"

#include "filter/evaluator.h"
#include "filter/parser.h"

namespace jnav {

std::vector<Json> PathFilterEngine::evaluate(const std::string& query,
                                             const std::vector<Json>& inputs) {
  filter::ParseResult parsed = filter::parse_filter(query);
  if (parsed.error.has_value()) {
    throw FilterError(parsed.error->message, parsed.error->position);
  }
  std::vector<Json> out;
  for (const auto& input : inputs) {
    filter::evaluate(*parsed.expr, input, out);
  }
  return out;
}

}  // namespace jnav
