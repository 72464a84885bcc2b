#pragma once

#include <tlvtree/encoder.hpp>
#include <tlvtree/logger.hpp>

#include <string>
#include <utility>
#include <vector>

namespace tlvtree {

namespace detail {

inline auto leaf_size(node const& n) -> std::size_t {
  if (is_integer(n.ty.get_kind())) {
    return integer_width(n.ty.get_kind());
  }
  if (auto const* b = std::get_if<bytes>(&n.value)) {
    return b->size();
  }
  return n.size;
}

inline auto write(parse_tree const& tree, node_id id, bytes& out) -> void {
  auto const& n = tree[id];
  if (n.is_composite()) {
    for (auto c : n.children) {
      write(tree, c, out);
    }
    return;
  }
  if (auto const* v = std::get_if<std::uint64_t>(&n.value)) {
    store_le(out, *v, integer_width(n.ty.get_kind()));
  } else if (auto const* b = std::get_if<bytes>(&n.value)) {
    out.insert(out.end(), b->begin(), b->end());
  }
}

/// First array child of `parent` after position `after`.
inline auto next_array(parse_tree const& tree, node_id parent, std::size_t after)
  -> std::optional<node_id> {
  auto const& children = tree[parent].children;
  for (auto i = after + 1; i < children.size(); ++i) {
    if (tree[children[i]].ty.get_kind() == kind::array) {
      return children[i];
    }
  }
  return std::nullopt;
}

inline auto check_field(parse_tree const& tree, node_id field, std::uint64_t value, errc overflow)
  -> expected<void, error_info> {
  auto const& f = tree[field];
  if (!is_integer(f.ty.get_kind())) {
    return make_error(errc::invalid_node, tree.path_of(field) + " is not an integer field");
  }
  if (value > max_for_width(integer_width(f.ty.get_kind()))) {
    return make_error(overflow, tree.path_of(field) + ": " + std::to_string(value) +
                                  " does not fit " + f.ty.name());
  }
  return {};
}

inline auto write_field(parse_tree& tree, node_id field, std::uint64_t value) -> void {
  auto& f = tree[field];
  if (f.as_uint() == value) {
    return;
  }
  if (get_logger().enabled(log_level::debug)) {
    TLVTREE_LOG_DEBUG("resync: {} {} -> {}", tree.path_of(field), f.as_uint(), value);
  }
  f.value = value;
}

inline auto refresh_sizes(parse_tree& tree, node_id id) -> std::size_t {
  auto& n = tree[id];
  if (!n.is_composite()) {
    n.size = leaf_size(n);
    return n.size;
  }
  std::size_t total = 0;
  for (auto c : tree[id].children) {
    total += refresh_sizes(tree, c);
  }
  tree[id].size = total;
  return total;
}

/// Rewrite array types from their contents: the extent of a byte-bounded array, the count of
/// any other array.
inline auto refresh_extents(parse_tree& tree, node_id id) -> void {
  auto& n = tree[id];
  if (n.ty.get_kind() == kind::array) {
    n.ty = n.ty.is_byte_bounded() ? n.ty.with_size(n.size)
                                  : n.ty.with_count(static_cast<std::uint32_t>(n.children.size()));
  }
  for (auto c : tree[id].children) {
    refresh_extents(tree, c);
  }
}

inline auto layout(parse_tree& tree, node_id id) -> void {
  auto cur = tree[id].offset;
  for (auto c : tree[id].children) {
    tree[c].offset = cur;
    layout(tree, c);
    cur += tree[c].size;
  }
}

struct field_write {
  node_id field;
  std::uint64_t value;
};

/// Collect the count and length values `id`'s subtree needs, children before parents, and
/// check that each fits its field. Nothing is written. Returns the subtree's size.
inline auto plan_resync(parse_tree const& tree, node_id id, std::vector<field_write>& writes)
  -> expected<std::size_t, error_info> {
  auto const& n = tree[id];
  if (!n.is_composite()) {
    return leaf_size(n);
  }

  std::size_t total = 0;
  for (auto c : n.children) {
    auto size = plan_resync(tree, c, writes);
    if (!size) {
      return size;
    }
    total += *size;
  }
  if (n.ty.get_kind() != kind::structure) {
    return total;
  }

  for (std::size_t i = 0; i < n.children.size(); ++i) {
    auto field = n.children[i];
    if (tree[field].role == field_role::element_count) {
      auto array = next_array(tree, id, i);
      if (!array) {
        return make_error(errc::invalid_node,
                          tree.path_of(field) + " counts no following array field");
      }
      auto count = tree[*array].children.size();
      if (auto ok = check_field(tree, field, count, errc::count_limit_exceeded); !ok) {
        return unexpected(std::move(ok).error());
      }
      writes.push_back(field_write{.field = field, .value = count});
    } else if (tree[field].role == field_role::record_length) {
      if (auto ok = check_field(tree, field, total, errc::invalid_length); !ok) {
        return unexpected(std::move(ok).error());
      }
      writes.push_back(field_write{.field = field, .value = total});
    }
  }
  return total;
}

inline auto clear_dirty(parse_tree& tree, node_id id) -> void {
  std::vector<node_id> stack{id};
  while (!stack.empty()) {
    auto cur = stack.back();
    stack.pop_back();
    tree[cur].dirty = false;
    stack.insert(stack.end(), tree[cur].children.begin(), tree[cur].children.end());
  }
}

inline auto verify_node(parse_tree const& tree, node_id id) -> expected<void, error_info> {
  auto const& n = tree[id];
  if (!n.is_composite()) {
    if (n.size != leaf_size(n)) {
      return make_error(errc::offset_gap, tree.path_of(id) + " records size " +
                                            std::to_string(n.size) + ", holds " +
                                            std::to_string(leaf_size(n)));
    }
    return {};
  }

  if (n.ty.is_byte_bounded() && n.ty.size() != n.size) {
    return make_error(errc::length_mismatch, tree.path_of(id) + " spans " +
                                               std::to_string(*n.ty.size()) + " bytes, holds " +
                                               std::to_string(n.size));
  }

  if (n.ty.get_kind() == kind::structure) {
    for (std::size_t i = 0; i < n.children.size(); ++i) {
      auto field = n.children[i];
      auto role = tree[field].role;
      if (role == field_role::none) {
        continue;
      }
      auto const* stored = std::get_if<std::uint64_t>(&tree[field].value);
      if (stored == nullptr) {
        return make_error(errc::invalid_node, tree.path_of(field) + " is not an integer field");
      }
      if (role == field_role::record_length) {
        auto actual = serialized_size(tree, id);
        if (*stored != actual) {
          return make_error(errc::length_mismatch, tree.path_of(id) + " declares " +
                                                     std::to_string(*stored) +
                                                     " bytes, serializes to " +
                                                     std::to_string(actual));
        }
      } else {
        auto array = next_array(tree, id, i);
        auto actual = array ? tree[*array].children.size() : 0;
        if (*stored != actual) {
          return make_error(errc::length_mismatch, tree.path_of(field) + " is " +
                                                     std::to_string(*stored) + ", array holds " +
                                                     std::to_string(actual));
        }
      }
    }
  }

  auto expect = n.offset;
  for (auto c : n.children) {
    if (tree[c].offset != expect) {
      return make_error(errc::offset_gap, tree.path_of(c) + " at offset " +
                                            std::to_string(tree[c].offset) + ", expected " +
                                            std::to_string(expect));
    }
    expect += tree[c].size;
  }
  if (expect - n.offset != n.size) {
    return make_error(errc::offset_gap, tree.path_of(id) + " records size " +
                                          std::to_string(n.size) + ", children span " +
                                          std::to_string(expect - n.offset));
  }

  for (auto c : n.children) {
    if (auto ok = verify_node(tree, c); !ok) {
      return ok;
    }
  }
  return {};
}

}  // namespace detail

inline auto serialize(parse_tree const& tree, node_id id) -> expected<bytes, error_info> {
  if (!tree.contains(id)) {
    return make_error(errc::invalid_node, "serialize: node " + std::to_string(id) + " is not live");
  }
  bytes out{};
  out.reserve(serialized_size(tree, id));
  detail::write(tree, id, out);
  return out;
}

inline auto serialized_size(parse_tree const& tree, node_id id) -> std::size_t {
  auto const& n = tree[id];
  if (!n.is_composite()) {
    return detail::leaf_size(n);
  }
  std::size_t total = 0;
  for (auto c : n.children) {
    total += serialized_size(tree, c);
  }
  return total;
}

inline auto recompute_length(parse_tree& tree, node_id id) -> expected<void, error_info> {
  if (!tree.contains(id) || tree[id].ty.get_kind() != kind::structure) {
    return make_error(errc::invalid_node,
                      "recompute_length: node " + std::to_string(id) + " is not a live structure");
  }
  std::optional<node_id> length{};
  for (auto c : tree[id].children) {
    if (tree[c].role == field_role::record_length) {
      length = c;
      break;
    }
  }
  if (!length) {
    return make_error(errc::invalid_node, "recompute_length: " + tree.path_of(id) +
                                            " has no record_length field");
  }

  auto total = serialized_size(tree, id);
  if (auto ok = detail::check_field(tree, *length, total, errc::invalid_length); !ok) {
    return ok;
  }
  detail::write_field(tree, *length, total);
  tree[id].size = total;
  return {};
}

inline auto resync_offsets(parse_tree& tree, node_id root) -> expected<void, error_info> {
  if (!tree.contains(root)) {
    return make_error(errc::invalid_node,
                      "resync_offsets: node " + std::to_string(root) + " is not live");
  }
  detail::refresh_sizes(tree, root);
  detail::layout(tree, root);
  return {};
}

inline auto resync(parse_tree& tree) -> expected<void, error_info> {
  auto root = tree.root();
  if (!tree.contains(root)) {
    return make_error(errc::invalid_node, "resync: tree has no root");
  }

  std::vector<detail::field_write> writes{};
  if (auto planned = detail::plan_resync(tree, root, writes); !planned) {
    return unexpected(std::move(planned).error());
  }
  for (auto const& w : writes) {
    detail::write_field(tree, w.field, w.value);
  }
  detail::refresh_sizes(tree, root);
  detail::refresh_extents(tree, root);
  detail::layout(tree, root);
  detail::clear_dirty(tree, root);
  return {};
}

inline auto verify(parse_tree const& tree) -> expected<void, error_info> {
  if (!tree.contains(tree.root())) {
    return make_error(errc::invalid_node, "verify: tree has no root");
  }
  return detail::verify_node(tree, tree.root());
}

}  // namespace tlvtree
