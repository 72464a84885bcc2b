#include <tlvtree/tree.hpp>

#include <gtest/gtest.h>

using namespace tlvtree;

namespace {

auto leaf(parse_tree& t, node_id parent, std::string name, std::uint64_t v) -> node_id {
  node n{};
  n.ty = type::u16();
  n.name = std::move(name);
  n.size = 2;
  n.value = v;
  n.parent = parent;
  auto id = t.add(std::move(n));
  if (parent != no_node) {
    t[parent].children.push_back(id);
  }
  return id;
}

auto composite(parse_tree& t, node_id parent, std::string name, type ty) -> node_id {
  node n{};
  n.ty = std::move(ty);
  n.name = std::move(name);
  n.parent = parent;
  auto id = t.add(std::move(n));
  if (parent != no_node) {
    t[parent].children.push_back(id);
  }
  return id;
}

auto pair_type() -> type {
  schema s{"pair"};
  s.add("a", type::u16());
  s.add("items", type::array(type::u16()));
  return make_structure(std::move(s));
}

// pair { a = 1, items = [10, 20] }
auto sample() -> parse_tree {
  parse_tree t;
  auto root = composite(t, no_node, "", pair_type());
  leaf(t, root, "a", 1);
  auto items = composite(t, root, "items", type::array(type::u16(), 2));
  leaf(t, items, "", 10);
  leaf(t, items, "", 20);
  t.set_root(root);
  return t;
}

TEST(tree_test, find_by_dotted_path) {
  auto t = sample();

  auto a = t.find("a");
  ASSERT_TRUE(a);
  EXPECT_EQ(t[*a].as_uint(), 1U);

  auto second = t.find("items.1");
  ASSERT_TRUE(second);
  EXPECT_EQ(t[*second].as_uint(), 20U);

  EXPECT_FALSE(t.find("items.2"));
  EXPECT_FALSE(t.find("items.x"));
  EXPECT_FALSE(t.find("missing"));
  EXPECT_EQ(t.find(""), t.root());
}

TEST(tree_test, path_of_names_fields_and_indices) {
  auto t = sample();
  EXPECT_EQ(t.path_of(t.root()), "<root>");
  EXPECT_EQ(t.path_of(*t.find("items.1")), "items.1");
  EXPECT_EQ(t.path_of(*t.find("a")), "a");
}

TEST(tree_test, release_frees_subtree_and_reuses_ids) {
  auto t = sample();
  EXPECT_EQ(t.live_count(), 5U);

  auto items = *t.find("items");
  auto first = *t.find("items.0");
  t.release(items);
  EXPECT_EQ(t.live_count(), 2U);
  EXPECT_FALSE(t.contains(items));
  EXPECT_FALSE(t.contains(first));

  auto reused = leaf(t, no_node, "x", 3);
  EXPECT_LT(reused, 5U);
  EXPECT_EQ(t.live_count(), 3U);
}

TEST(tree_test, import_subtree_copies_nodes) {
  auto src = sample();
  parse_tree dst;
  auto root = composite(dst, no_node, "", type::array(pair_type(), 1));
  dst.set_root(root);

  auto copied = dst.import_subtree(src, src.root(), root);
  dst[root].children.push_back(copied);

  EXPECT_EQ(dst[copied].parent, root);
  EXPECT_EQ(dst.live_count(), 6U);
  auto item = dst.find("0.items.0");
  ASSERT_TRUE(item);
  EXPECT_EQ(dst[*item].as_uint(), 10U);
  EXPECT_TRUE(structurally_equal(src, src.root(), dst, copied));
}

TEST(tree_test, structural_equality_ignores_offsets_but_not_values) {
  auto a = sample();
  auto b = sample();
  b[*b.find("a")].offset = 99;
  EXPECT_TRUE(structurally_equal(a, b));

  b[*b.find("items.1")].value = std::uint64_t{21};
  EXPECT_FALSE(structurally_equal(a, b));
}

TEST(tree_test, field_view_sees_only_given_fields) {
  auto t = sample();
  std::vector<node_id> visible{*t.find("a")};
  field_view view{t, visible, 2};

  EXPECT_EQ(view.size(), 1U);
  EXPECT_EQ(view.consumed(), 2U);

  auto a = view.uint("a");
  ASSERT_TRUE(a);
  EXPECT_EQ(*a, 1U);

  auto items = view.uint("items");
  ASSERT_FALSE(items);
  EXPECT_EQ(items.error().code, errc::schema_mismatch);
}

}  // namespace
