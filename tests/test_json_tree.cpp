#include "test_harness.h"

#include <stdexcept>
#include <vector>

#include "jnav/json_tree.h"
#include "jnav/view_projector.h"
#include "test_utils.h"

namespace {

jnav::JsonTree make_tree(const std::string& json, int expand_depth, size_t limit_length) {
  jnav::TreeOptions options;
  options.expand_depth = expand_depth;
  options.limit_length = limit_length;
  jnav::JsonTree tree(options);
  tree.build({parse_json(json)});
  return tree;
}

void test_build_keeps_object_insertion_order() {
  jnav::JsonTree tree = make_tree(R"({"z":1,"a":2,"m":3})", -1, 50);
  const jnav::TreeNode& root = tree.node(tree.roots()[0]);
  expect_eq(root.children.size(), 3, "three members");
  expect_str_eq(tree.node(root.children[0]).key, "z", "first key kept first");
  expect_str_eq(tree.node(root.children[1]).key, "a", "second key kept second");
  expect_str_eq(tree.node(root.children[2]).key, "m", "third key kept third");
}

void test_expand_depth_one_shows_nested_array() {
  jnav::JsonTree tree = make_tree(R"({"a":1,"b":[1,2,3]})", 1, 50);
  auto rows = tree.flatten();
  expect_eq(rows.size(), 6, "root, a, b and three elements");
  const jnav::TreeNode& a = tree.node(rows[1].node_id);
  expect_str_eq(a.key, "a", "first member is a");
  expect_str_eq(a.scalar, "1", "a holds 1");
  const jnav::TreeNode& b = tree.node(rows[2].node_id);
  expect_str_eq(b.key, "b", "second member is b");
  expect_true(b.expanded, "b starts expanded");
  expect_eq(b.length, 3, "b length");
  for (size_t i = 0; i < 3; ++i) {
    const jnav::TreeNode& element = tree.node(rows[3 + i].node_id);
    expect_eq(element.index, i, "element index");
    expect_str_eq(element.scalar, std::to_string(i + 1), "element value");
    expect_eq(static_cast<size_t>(rows[3 + i].depth), 2, "element depth");
  }
}

void test_expand_depth_zero_collapses_children() {
  jnav::JsonTree tree = make_tree(R"({"a":{"x":1},"b":[1]})", 0, 50);
  auto rows = tree.flatten();
  expect_eq(rows.size(), 3, "root plus two collapsed members");
  expect_true(!tree.node(rows[1].node_id).expanded, "nested object collapsed");
  expect_true(!tree.node(rows[2].node_id).expanded, "nested array collapsed");
}

void test_negative_expand_depth_expands_everything() {
  jnav::JsonTree tree = make_tree(R"({"a":{"b":{"c":[true]}}})", -1, 50);
  auto rows = tree.flatten();
  expect_eq(rows.size(), 5, "every level visible");
  expect_eq(static_cast<size_t>(rows[4].depth), 4, "deepest element depth");
}

void test_array_truncation_reports_omitted() {
  jnav::Json values = jnav::Json::array();
  for (int i = 0; i < 100; ++i) values.push_back(i);
  jnav::TreeOptions options;
  options.limit_length = 50;
  jnav::JsonTree tree(options);
  tree.build({values});
  auto rows = tree.flatten();
  expect_eq(rows.size(), 52, "root, fifty elements and one summary row");
  const jnav::FlatRow& summary = rows.back();
  expect_true(summary.kind == jnav::RowKind::Truncated, "last row is the summary");
  expect_eq(summary.omitted, 50, "fifty elements omitted");
  expect_eq(static_cast<size_t>(summary.depth), 1, "summary sits at child depth");
  expect_eq(tree.node(rows[0].node_id).length, 100, "length keeps the full count");
}

void test_array_at_limit_not_truncated() {
  jnav::JsonTree tree = make_tree("[1,2,3]", -1, 3);
  auto rows = tree.flatten();
  expect_eq(rows.size(), 4, "no summary row at exactly the limit");
  expect_true(rows.back().kind == jnav::RowKind::Node, "last row is an element");
}

void test_toggle_round_trip_restores_rows() {
  jnav::JsonTree tree = make_tree(R"({"a":[1,2],"b":{"c":null}})", -1, 50);
  auto before = tree.flatten();
  jnav::NodeId a = before[1].node_id;
  expect_true(tree.toggle(a), "toggle container");
  auto collapsed = tree.flatten();
  expect_eq(collapsed.size(), before.size() - 2, "collapsing a hides two rows");
  expect_true(tree.toggle(a), "toggle back");
  auto after = tree.flatten();
  expect_eq(after.size(), before.size(), "row count restored");
  for (size_t i = 0; i < after.size(); ++i) {
    expect_true(after[i].node_id == before[i].node_id, "same node order after round trip");
  }
}

void test_toggle_rejects_scalars_and_bad_ids() {
  jnav::JsonTree tree = make_tree(R"({"a":1})", -1, 50);
  auto rows = tree.flatten();
  expect_true(!tree.toggle(rows[1].node_id), "scalar cannot fold");
  expect_true(!tree.toggle(99), "unknown id rejected");
  expect_true(!tree.toggle(-1), "negative id rejected");
}

void test_collapse_all_keeps_roots_open() {
  jnav::JsonTree tree = make_tree(R"({"a":{"b":1},"c":[1,2]})", -1, 50);
  tree.collapse_all();
  auto rows = tree.flatten();
  expect_eq(rows.size(), 3, "root and two collapsed members");
  tree.expand_all();
  expect_eq(tree.flatten().size(), 6, "expand_all shows everything");
}

void test_multiple_documents_are_roots() {
  jnav::JsonTree tree;
  tree.build({parse_json("1"), parse_json(R"({"k":"v"})"), parse_json("null")});
  expect_eq(tree.roots().size(), 3, "one root per document");
  auto rows = tree.flatten();
  expect_eq(rows.size(), 4, "three roots plus one member");
  expect_eq(tree.node(rows[3].node_id).document, 2, "third root from third document");
  expect_str_eq(tree.node(rows[2].node_id).scalar, "\"v\"", "string scalar keeps quotes");
}

void test_rebuild_resets_fold_state() {
  jnav::JsonTree tree = make_tree(R"({"a":[1]})", -1, 50);
  auto rows = tree.flatten();
  tree.toggle(rows[1].node_id);
  tree.build({parse_json(R"({"a":[1]})")});
  expect_eq(tree.flatten().size(), 3, "fold state reset by build");
}

void test_path_of_nested_node() {
  jnav::JsonTree tree = make_tree(R"({"items":[{"name":"x"}],"odd key":1})", -1, 50);
  auto rows = tree.flatten();
  expect_str_eq(tree.path_of(rows[0].node_id), ".", "root path");
  expect_str_eq(tree.path_of(rows[3].node_id), ".items[0].name", "nested path");
  expect_str_eq(tree.path_of(rows[4].node_id), ".\"odd key\"", "quoted key path");
}

void test_node_rejects_invalid_id() {
  jnav::JsonTree tree;
  bool thrown = false;
  try {
    (void)tree.node(0);
  } catch (const std::out_of_range&) {
    thrown = true;
  }
  expect_true(thrown, "node() throws on empty tree");
}

void test_projector_scrolls_minimally() {
  jnav::ViewProjector view(3);
  view.set_row_count(10);
  view.down();
  view.down();
  expect_eq(view.offset(), 0, "cursor within first page");
  view.down();
  expect_eq(view.offset(), 1, "one-row scroll when cursor leaves window");
  auto window = view.window();
  expect_eq(window.begin, 1, "window begin");
  expect_eq(window.end, 4, "window end");
  expect_eq(window.cursor, 3, "window cursor");
}

void test_projector_up_down_clamp() {
  jnav::ViewProjector view(5);
  view.set_row_count(2);
  expect_true(!view.up(), "up at first row fails");
  expect_true(view.down(), "down moves");
  expect_true(!view.down(), "down at last row fails");
}

void test_projector_head_tail() {
  jnav::ViewProjector view(4);
  view.set_row_count(20);
  view.tail();
  expect_eq(view.cursor(), 19, "tail cursor");
  expect_eq(view.offset(), 16, "tail fills the window");
  view.head();
  expect_eq(view.cursor(), 0, "head cursor");
  expect_eq(view.offset(), 0, "head offset");
}

void test_projector_shrinking_rows_clamps_cursor() {
  jnav::ViewProjector view(4);
  view.set_row_count(20);
  view.tail();
  view.set_row_count(6);
  expect_eq(view.cursor(), 5, "cursor clamped to last row");
  expect_eq(view.offset(), 2, "offset clamped to fill the window");
  view.set_row_count(0);
  auto window = view.window();
  expect_eq(window.begin, 0, "empty window begin");
  expect_eq(window.end, 0, "empty window end");
}

void test_projector_resize_keeps_cursor_visible() {
  jnav::ViewProjector view(10);
  view.set_row_count(30);
  view.set_cursor(9);
  view.resize(3);
  auto window = view.window();
  expect_true(window.cursor >= window.begin && window.cursor < window.end,
              "cursor inside window after shrink");
  expect_eq(view.cursor(), 9, "cursor row preserved");
}

}  // namespace

void register_json_tree_tests(std::vector<TestCase>& tests) {
  tests.push_back({"build_keeps_object_insertion_order", test_build_keeps_object_insertion_order});
  tests.push_back({"expand_depth_one_shows_nested_array", test_expand_depth_one_shows_nested_array});
  tests.push_back({"expand_depth_zero_collapses_children", test_expand_depth_zero_collapses_children});
  tests.push_back({"negative_expand_depth_expands_everything",
                   test_negative_expand_depth_expands_everything});
  tests.push_back({"array_truncation_reports_omitted", test_array_truncation_reports_omitted});
  tests.push_back({"array_at_limit_not_truncated", test_array_at_limit_not_truncated});
  tests.push_back({"toggle_round_trip_restores_rows", test_toggle_round_trip_restores_rows});
  tests.push_back({"toggle_rejects_scalars_and_bad_ids", test_toggle_rejects_scalars_and_bad_ids});
  tests.push_back({"collapse_all_keeps_roots_open", test_collapse_all_keeps_roots_open});
  tests.push_back({"multiple_documents_are_roots", test_multiple_documents_are_roots});
  tests.push_back({"rebuild_resets_fold_state", test_rebuild_resets_fold_state});
  tests.push_back({"path_of_nested_node", test_path_of_nested_node});
  tests.push_back({"node_rejects_invalid_id", test_node_rejects_invalid_id});
  tests.push_back({"projector_scrolls_minimally", test_projector_scrolls_minimally});
  tests.push_back({"projector_up_down_clamp", test_projector_up_down_clamp});
  tests.push_back({"projector_head_tail", test_projector_head_tail});
  tests.push_back({"projector_shrinking_rows_clamps_cursor",
                   test_projector_shrinking_rows_clamps_cursor});
  tests.push_back({"projector_resize_keeps_cursor_visible",
                   test_projector_resize_keeps_cursor_visible});
}
