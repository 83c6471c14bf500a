#include "filter/evaluator.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include "jnav/filter_engine.h"
#include "util/utf8.h"

namespace jnav::filter {

namespace {

const char* type_name(const Json& value) {
  switch (value.type()) {
    case Json::value_t::object:
      return "object";
    case Json::value_t::array:
      return "array";
    case Json::value_t::string:
      return "string";
    case Json::value_t::boolean:
      return "boolean";
    case Json::value_t::null:
      return "null";
    default:
      return "number";
  }
}

std::string describe(const Json& value) {
  std::string text = value.dump(-1, ' ', false, Json::error_handler_t::replace);
  constexpr size_t kMaxDescribe = 11;
  if (text.size() > kMaxDescribe) text = text.substr(0, kMaxDescribe - 3) + "...";
  return std::string(type_name(value)) + " (" + text + ")";
}

bool truthy(const Json& value) {
  return !(value.is_null() || (value.is_boolean() && !value.get<bool>()));
}

size_t codepoint_count(const std::string& text) {
  size_t count = 0;
  size_t i = 0;
  while (i < text.size()) {
    i = util::next_codepoint_start(text, i);
    ++count;
  }
  return count;
}

// Resolves a possibly negative index against `size`; returns false when out of range.
bool resolve_index(double raw, size_t size, size_t& out) {
  double floored = std::floor(raw);
  if (floored < 0) floored += static_cast<double>(size);
  if (floored < 0 || floored >= static_cast<double>(size)) return false;
  out = static_cast<size_t>(floored);
  return true;
}

size_t clamp_slice_bound(const Json& bound, size_t size, size_t fallback) {
  if (bound.is_null()) return fallback;
  if (!bound.is_number()) {
    throw FilterError("Start and end indices of an array slice must be numbers");
  }
  double value = std::floor(bound.get<double>());
  if (value < 0) value += static_cast<double>(size);
  if (value < 0) return 0;
  if (value > static_cast<double>(size)) return size;
  return static_cast<size_t>(value);
}

Json index_value(const Json& target, const Json& key) {
  if (target.is_null()) {
    if (key.is_string() || key.is_number()) return Json();
  }
  if (target.is_object() && key.is_string()) {
    auto it = target.find(key.get<std::string>());
    return it == target.end() ? Json() : *it;
  }
  if (target.is_array() && key.is_number()) {
    size_t pos = 0;
    if (!resolve_index(key.get<double>(), target.size(), pos)) return Json();
    return target[pos];
  }
  if (key.is_string()) {
    throw FilterError(std::string("Cannot index ") + type_name(target) + " with \"" +
                      key.get<std::string>() + "\"");
  }
  throw FilterError(std::string("Cannot index ") + type_name(target) + " with " + type_name(key));
}

Json slice_value(const Json& target, const Json& from, const Json& to) {
  if (target.is_null()) return Json();
  if (target.is_array()) {
    size_t size = target.size();
    size_t begin = clamp_slice_bound(from, size, 0);
    size_t end = clamp_slice_bound(to, size, size);
    Json out = Json::array();
    for (size_t i = begin; i < end; ++i) out.push_back(target[i]);
    return out;
  }
  if (target.is_string()) {
    const std::string& text = target.get_ref<const std::string&>();
    size_t size = codepoint_count(text);
    size_t begin = clamp_slice_bound(from, size, 0);
    size_t end = clamp_slice_bound(to, size, size);
    size_t byte_begin = 0;
    size_t cp = 0;
    while (cp < begin && byte_begin < text.size()) {
      byte_begin = util::next_codepoint_start(text, byte_begin);
      ++cp;
    }
    size_t byte_end = byte_begin;
    while (cp < end && byte_end < text.size()) {
      byte_end = util::next_codepoint_start(text, byte_end);
      ++cp;
    }
    return text.substr(byte_begin, byte_end > byte_begin ? byte_end - byte_begin : 0);
  }
  throw FilterError(std::string("Cannot index ") + type_name(target) + " with object");
}

void iterate_value(const Json& target, std::vector<Json>& out) {
  if (target.is_array() || target.is_object()) {
    for (const auto& child : target) out.push_back(child);
    return;
  }
  throw FilterError("Cannot iterate over " + describe(target));
}

void recurse_all(const Json& input, std::vector<Json>& out) {
  std::vector<const Json*> stack{&input};
  while (!stack.empty()) {
    const Json* value = stack.back();
    stack.pop_back();
    out.push_back(*value);
    if (!value->is_array() && !value->is_object()) continue;
    std::vector<const Json*> children;
    children.reserve(value->size());
    for (const auto& child : *value) children.push_back(&child);
    for (auto it = children.rbegin(); it != children.rend(); ++it) stack.push_back(*it);
  }
}

Json add_values(const Json& input) {
  if (input.is_object()) {
    Json values = Json::array();
    for (const auto& child : input) values.push_back(child);
    return add_values(values);
  }
  if (!input.is_array()) throw FilterError("Cannot iterate over " + describe(input));
  Json acc;
  for (const auto& item : input) {
    if (item.is_null()) continue;
    if (acc.is_null()) {
      acc = item;
    } else if (acc.is_number_integer() && item.is_number_integer()) {
      acc = acc.get<int64_t>() + item.get<int64_t>();
    } else if (acc.is_number() && item.is_number()) {
      acc = acc.get<double>() + item.get<double>();
    } else if (acc.is_string() && item.is_string()) {
      acc = acc.get<std::string>() + item.get<std::string>();
    } else if (acc.is_array() && item.is_array()) {
      for (const auto& child : item) acc.push_back(child);
    } else if (acc.is_object() && item.is_object()) {
      for (auto it = item.begin(); it != item.end(); ++it) acc[it.key()] = it.value();
    } else {
      throw FilterError(describe(acc) + " and " + describe(item) + " cannot be added");
    }
  }
  return acc;
}

Json call_builtin(const std::string& name, const Json& input) {
  if (name == "keys" || name == "keys_unsorted") {
    Json out = Json::array();
    if (input.is_object()) {
      std::vector<std::string> keys;
      for (auto it = input.begin(); it != input.end(); ++it) keys.push_back(it.key());
      if (name == "keys") std::sort(keys.begin(), keys.end());
      for (auto& key : keys) out.push_back(std::move(key));
      return out;
    }
    if (input.is_array()) {
      for (size_t i = 0; i < input.size(); ++i) out.push_back(i);
      return out;
    }
    throw FilterError(describe(input) + " has no keys");
  }
  if (name == "length") {
    if (input.is_null()) return 0;
    if (input.is_boolean()) throw FilterError(describe(input) + " has no length");
    if (input.is_number_unsigned()) return input;
    if (input.is_number_integer()) {
      int64_t value = input.get<int64_t>();
      // Unsigned negation keeps INT64_MIN in range.
      uint64_t magnitude = static_cast<uint64_t>(value);
      if (value < 0) magnitude = uint64_t{0} - magnitude;
      return magnitude;
    }
    if (input.is_number()) return std::fabs(input.get<double>());
    if (input.is_string()) return codepoint_count(input.get_ref<const std::string&>());
    return input.size();
  }
  if (name == "type") return type_name(input);
  if (name == "first") return index_value(input, 0);
  if (name == "last") return index_value(input, -1);
  if (name == "reverse") {
    if (input.is_null()) return Json::array();
    if (input.is_string()) {
      const std::string& text = input.get_ref<const std::string&>();
      std::string out;
      size_t end = text.size();
      while (end > 0) {
        size_t start = util::prev_codepoint_start(text, end);
        out += text.substr(start, end - start);
        end = start;
      }
      return out;
    }
    if (!input.is_array()) throw FilterError("Cannot reverse " + describe(input));
    Json out = Json::array();
    for (auto it = input.rbegin(); it != input.rend(); ++it) out.push_back(*it);
    return out;
  }
  if (name == "not") return !truthy(input);
  if (name == "add") return add_values(input);
  throw FilterError(name + "/0 is not defined");
}

}  // namespace

void evaluate(const Expr& expr, const Json& input, std::vector<Json>& out) {
  switch (expr.kind) {
    case Expr::Kind::Identity:
      out.push_back(input);
      return;
    case Expr::Kind::RecurseAll:
      recurse_all(input, out);
      return;
    case Expr::Kind::Literal:
      out.push_back(expr.literal);
      return;
    case Expr::Kind::Field: {
      std::vector<Json> targets;
      evaluate(*expr.target, input, targets);
      for (const auto& target : targets) out.push_back(index_value(target, expr.name));
      return;
    }
    case Expr::Kind::Index: {
      std::vector<Json> targets;
      evaluate(*expr.target, input, targets);
      std::vector<Json> keys;
      evaluate(*expr.index, input, keys);
      for (const auto& target : targets) {
        for (const auto& key : keys) out.push_back(index_value(target, key));
      }
      return;
    }
    case Expr::Kind::Slice: {
      std::vector<Json> targets;
      evaluate(*expr.target, input, targets);
      std::vector<Json> froms{Json()};
      std::vector<Json> tos{Json()};
      if (expr.slice_from) {
        froms.clear();
        evaluate(*expr.slice_from, input, froms);
      }
      if (expr.slice_to) {
        tos.clear();
        evaluate(*expr.slice_to, input, tos);
      }
      for (const auto& target : targets) {
        for (const auto& to : tos) {
          for (const auto& from : froms) out.push_back(slice_value(target, from, to));
        }
      }
      return;
    }
    case Expr::Kind::Iterate: {
      std::vector<Json> targets;
      evaluate(*expr.target, input, targets);
      for (const auto& target : targets) iterate_value(target, out);
      return;
    }
    case Expr::Kind::Optional:
      try {
        evaluate(*expr.target, input, out);
      } catch (const FilterError&) {
        // Suppressed by `?`; outputs before the error are kept.
      }
      return;
    case Expr::Kind::Pipe: {
      std::vector<Json> stage;
      evaluate(*expr.left, input, stage);
      for (const auto& value : stage) evaluate(*expr.right, value, out);
      return;
    }
    case Expr::Kind::Comma:
      evaluate(*expr.left, input, out);
      evaluate(*expr.right, input, out);
      return;
    case Expr::Kind::Collect: {
      Json array = Json::array();
      if (expr.target) {
        std::vector<Json> items;
        evaluate(*expr.target, input, items);
        for (auto& item : items) array.push_back(std::move(item));
      }
      out.push_back(std::move(array));
      return;
    }
    case Expr::Kind::Call:
      if (expr.name == "empty") return;
      out.push_back(call_builtin(expr.name, input));
      return;
  }
}

}  // namespace jnav::filter
