#pragma once

#include <nlohmann/json.hpp>

namespace jnav {

/// JSON value type used across the engine. Objects keep member insertion order.
using Json = nlohmann::ordered_json;

}  // namespace jnav
