#include "jnav/json_tree.h"

#include <stdexcept>

#include "util/string_util.h"

namespace jnav {

namespace {

NodeKind kind_of(const Json& value) {
  switch (value.type()) {
    case Json::value_t::object:
      return NodeKind::Object;
    case Json::value_t::array:
      return NodeKind::Array;
    case Json::value_t::string:
      return NodeKind::String;
    case Json::value_t::boolean:
      return NodeKind::Boolean;
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
    case Json::value_t::number_float:
      return NodeKind::Number;
    default:
      return NodeKind::Null;
  }
}

struct BuildItem {
  const Json* value = nullptr;
  NodeId parent = -1;
  int depth = 0;
  MemberKind member = MemberKind::Root;
  std::string key;
  size_t index = 0;
  size_t document = 0;
};

struct FlattenItem {
  RowKind kind = RowKind::Node;
  NodeId node_id = 0;
  int depth = 0;
  size_t omitted = 0;
};

}  // namespace

bool is_container(NodeKind kind) {
  return kind == NodeKind::Object || kind == NodeKind::Array;
}

JsonTree::JsonTree(TreeOptions options) : options_(options) {}

bool JsonTree::initially_expanded(const TreeNode& node) const {
  if (!is_container(node.kind)) return false;
  if (node.depth == 0) return true;
  return options_.expand_depth < 0 || node.depth <= options_.expand_depth;
}

void JsonTree::build(const std::vector<Json>& values) {
  nodes_.clear();
  roots_.clear();

  std::vector<BuildItem> stack;
  for (size_t i = values.size(); i > 0; --i) {
    BuildItem item;
    item.value = &values[i - 1];
    item.document = i - 1;
    stack.push_back(std::move(item));
  }

  // Children are pushed in reverse so they pop, and get their ids, in document order.
  while (!stack.empty()) {
    BuildItem item = std::move(stack.back());
    stack.pop_back();

    const NodeId id = static_cast<NodeId>(nodes_.size());
    TreeNode node;
    node.kind = kind_of(*item.value);
    node.depth = item.depth;
    node.parent = item.parent;
    node.member = item.member;
    node.key = std::move(item.key);
    node.index = item.index;
    node.document = item.document;
    if (is_container(node.kind)) {
      node.length = item.value->size();
    } else {
      node.scalar = item.value->dump(-1, ' ', false, Json::error_handler_t::replace);
    }
    node.expanded = initially_expanded(node);
    nodes_.push_back(std::move(node));

    if (item.parent < 0) {
      roots_.push_back(id);
    } else {
      nodes_[static_cast<size_t>(item.parent)].children.push_back(id);
    }

    if (item.value->is_object()) {
      std::vector<BuildItem> kids;
      kids.reserve(item.value->size());
      for (auto it = item.value->begin(); it != item.value->end(); ++it) {
        BuildItem child;
        child.value = &it.value();
        child.parent = id;
        child.depth = item.depth + 1;
        child.member = MemberKind::ObjectMember;
        child.key = it.key();
        child.document = item.document;
        kids.push_back(std::move(child));
      }
      for (auto it = kids.rbegin(); it != kids.rend(); ++it) stack.push_back(std::move(*it));
    } else if (item.value->is_array()) {
      const size_t count = item.value->size();
      for (size_t i = count; i > 0; --i) {
        BuildItem child;
        child.value = &(*item.value)[i - 1];
        child.parent = id;
        child.depth = item.depth + 1;
        child.member = MemberKind::ArrayElement;
        child.index = i - 1;
        child.document = item.document;
        stack.push_back(std::move(child));
      }
    }
  }
}

std::vector<FlatRow> JsonTree::flatten() const {
  std::vector<FlatRow> out;
  out.reserve(nodes_.size());
  std::vector<FlattenItem> stack;
  for (auto it = roots_.rbegin(); it != roots_.rend(); ++it) {
    stack.push_back({RowKind::Node, *it, 0, 0});
  }
  while (!stack.empty()) {
    FlattenItem item = stack.back();
    stack.pop_back();
    out.push_back({item.kind, item.node_id, item.depth, item.omitted});
    if (item.kind == RowKind::Truncated) continue;

    const TreeNode& node = nodes_[static_cast<size_t>(item.node_id)];
    if (!node.expanded || node.children.empty()) continue;

    size_t shown = node.children.size();
    if (node.kind == NodeKind::Array && shown > options_.limit_length) {
      shown = options_.limit_length;
      stack.push_back({RowKind::Truncated, item.node_id, item.depth + 1, node.length - shown});
    }
    for (size_t i = shown; i > 0; --i) {
      stack.push_back({RowKind::Node, node.children[i - 1], item.depth + 1, 0});
    }
  }
  return out;
}

bool JsonTree::toggle(NodeId id) {
  if (!valid(id)) return false;
  TreeNode& node = nodes_[static_cast<size_t>(id)];
  if (!is_container(node.kind)) return false;
  node.expanded = !node.expanded;
  return true;
}

void JsonTree::expand_all() {
  for (auto& node : nodes_) {
    if (is_container(node.kind)) node.expanded = true;
  }
}

void JsonTree::collapse_all() {
  for (auto& node : nodes_) {
    if (is_container(node.kind)) node.expanded = node.depth == 0;
  }
}

bool JsonTree::valid(NodeId id) const {
  return id >= 0 && static_cast<size_t>(id) < nodes_.size();
}

const TreeNode& JsonTree::node(NodeId id) const {
  if (!valid(id)) {
    throw std::out_of_range("Invalid tree node id: " + std::to_string(id));
  }
  return nodes_[static_cast<size_t>(id)];
}

std::string JsonTree::path_of(NodeId id) const {
  std::vector<const TreeNode*> chain;
  NodeId cur = id;
  while (valid(cur)) {
    const TreeNode& node = nodes_[static_cast<size_t>(cur)];
    if (node.member == MemberKind::Root) break;
    chain.push_back(&node);
    cur = node.parent;
  }
  if (chain.empty()) return ".";
  std::string out;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    const TreeNode& node = **it;
    if (node.member == MemberKind::ObjectMember) {
      out += util::format_key_step(node.key);
    } else {
      if (out.empty()) out += ".";
      out += "[" + std::to_string(node.index) + "]";
    }
  }
  return out;
}

}  // namespace jnav
