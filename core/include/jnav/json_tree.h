#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "jnav/json_value.h"

namespace jnav {

using NodeId = int64_t;

enum class NodeKind {
  Object,
  Array,
  String,
  Number,
  Boolean,
  Null,
};

/// How a node hangs off its parent; roots are whole documents.
enum class MemberKind {
  Root,
  ObjectMember,
  ArrayElement,
};

/// One JSON value inside the arena.
/// Children are stored by identity, in insertion order for objects and positional order for arrays.
struct TreeNode {
  NodeKind kind = NodeKind::Null;
  int depth = 0;
  NodeId parent = -1;
  std::vector<NodeId> children;
  bool expanded = false;
  /// Member/element count for containers; kept even when rows are truncated.
  size_t length = 0;
  MemberKind member = MemberKind::Root;
  std::string key;
  size_t index = 0;
  /// Serialized text for scalars (strings keep their quotes).
  std::string scalar;
  size_t document = 0;
};

enum class RowKind {
  Node,
  Truncated,
};

/// Represents one visible row in the viewer.
/// Truncated rows reference the array they summarize and sit one level deeper.
struct FlatRow {
  RowKind kind = RowKind::Node;
  NodeId node_id = 0;
  int depth = 0;
  size_t omitted = 0;
};

struct TreeOptions {
  int expand_depth = -1;
  size_t limit_length = 50;
};

/// Arena-backed, foldable tree over one or more JSON values.
/// Identities are indexes into the arena and are invalidated by every build().
class JsonTree {
 public:
  JsonTree() = default;
  explicit JsonTree(TreeOptions options);

  /// Replaces the whole tree with one root per value.
  /// MUST reset fold state: roots expanded, other containers expanded when
  /// expand_depth < 0 or their depth <= expand_depth.
  void build(const std::vector<Json>& values);

  /// Flattens currently visible rows based on expansion state.
  /// MUST keep preorder traversal and emit at most limit_length children per array
  /// followed by one truncated summary row.
  std::vector<FlatRow> flatten() const;

  /// Flips the fold state of one container. Returns false for scalars and bad ids.
  bool toggle(NodeId id);
  void expand_all();
  /// Collapses every container except document roots, which stay open.
  void collapse_all();

  const TreeNode& node(NodeId id) const;
  bool valid(NodeId id) const;
  const std::vector<NodeId>& roots() const { return roots_; }
  size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }
  const TreeOptions& options() const { return options_; }
  void set_options(TreeOptions options) { options_ = options; }

  /// Builds the path expression that selects `id` within its document (e.g. `.items[2].name`).
  std::string path_of(NodeId id) const;

 private:
  bool initially_expanded(const TreeNode& node) const;

  TreeOptions options_;
  std::vector<TreeNode> nodes_;
  std::vector<NodeId> roots_;
};

bool is_container(NodeKind kind);

}  // namespace jnav
