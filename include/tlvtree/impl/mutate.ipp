#pragma once

#include <tlvtree/logger.hpp>
#include <tlvtree/mutate.hpp>

#include <string>
#include <utility>

namespace tlvtree {

namespace detail {

struct slot_decl {
  // Declared type of the slot; nullopt when the slot is resolved (or is the root).
  std::optional<type> declared{};
  std::string name{};
  field_role role{field_role::none};
};

inline auto slot_of(parse_tree const& tree, node_id parent, std::size_t index) -> slot_decl {
  auto const& p = tree[parent];
  if (p.ty.get_kind() == kind::array) {
    return slot_decl{.declared = p.ty.element()};
  }
  auto const& f = p.ty.fields().at(index);
  slot_decl s{.name = f.name, .role = f.role};
  if (auto const* fixed = std::get_if<type>(&f.decl)) {
    s.declared = *fixed;
  }
  return s;
}

inline auto check_composite(parse_tree const& tree, node_id id, std::string_view op)
  -> expected<void, error_info> {
  if (!tree.contains(id) || !tree[id].is_composite()) {
    return make_error(errc::invalid_node,
                      std::string{op} + ": node " + std::to_string(id) + " is not a live composite");
  }
  return {};
}

inline auto check_array(parse_tree const& tree, node_id id, std::string_view op)
  -> expected<void, error_info> {
  if (!tree.contains(id) || tree[id].ty.get_kind() != kind::array) {
    return make_error(errc::invalid_node,
                      std::string{op} + ": node " + std::to_string(id) + " is not a live array");
  }
  return {};
}

inline auto check_subtree(parse_tree const& tree, parse_tree const& subtree, std::string_view op)
  -> expected<void, error_info> {
  if (&tree == &subtree) {
    return make_error(errc::invalid_node, std::string{op} + ": subtree must be another tree");
  }
  if (!subtree.contains(subtree.root())) {
    return make_error(errc::invalid_node, std::string{op} + ": subtree has no root");
  }
  return {};
}

// A byte-bounded array keeps its extent until resync().
inline auto refresh_count(parse_tree& tree, node_id array) -> void {
  auto& a = tree[array];
  if (!a.ty.is_byte_bounded()) {
    a.ty = a.ty.with_count(static_cast<std::uint32_t>(a.children.size()));
  }
}

}  // namespace detail

inline auto mark_dirty(parse_tree& tree, node_id id) -> void {
  while (tree.contains(id)) {
    tree[id].dirty = true;
    id = tree[id].parent;
  }
}

inline auto index_in_parent(parse_tree const& tree, node_id id) -> std::optional<std::size_t> {
  if (!tree.contains(id) || tree[id].parent == no_node) {
    return std::nullopt;
  }
  auto const& siblings = tree[tree[id].parent].children;
  for (std::size_t i = 0; i < siblings.size(); ++i) {
    if (siblings[i] == id) {
      return i;
    }
  }
  return std::nullopt;
}

inline auto replace(parse_tree& tree, node_id parent, std::size_t index, parse_tree const& subtree)
  -> expected<node_id, error_info> {
  if (auto ok = detail::check_composite(tree, parent, "replace"); !ok) {
    return unexpected(std::move(ok).error());
  }
  if (auto ok = detail::check_subtree(tree, subtree, "replace"); !ok) {
    return unexpected(std::move(ok).error());
  }
  if (index >= tree[parent].children.size()) {
    return make_error(errc::invalid_node, "replace: " + tree.path_of(parent) + " has no child " +
                                            std::to_string(index));
  }

  auto old = tree[parent].children[index];
  auto slot = detail::slot_of(tree, parent, index);
  auto const& candidate = subtree[subtree.root()].ty;
  auto const accepted = slot.declared ? *slot.declared : tree[old].ty.erased();
  if (!fits(accepted, candidate)) {
    return make_error(errc::schema_mismatch, "replace: " + tree.path_of(old) + " expects " +
                                               accepted.name() + ", given " + candidate.name());
  }

  auto id = tree.import_subtree(subtree, subtree.root(), parent);
  tree[id].name = std::move(slot.name);
  tree[id].role = slot.role;
  tree.release(old);
  tree[parent].children[index] = id;
  mark_dirty(tree, parent);

  if (get_logger().enabled(log_level::debug)) {
    TLVTREE_LOG_DEBUG("replace: {} <- {} ({} bytes)", tree.path_of(id), tree[id].ty.name(),
                      tree[id].size);
  }
  return id;
}

inline auto append(parse_tree& tree, node_id array, parse_tree const& subtree)
  -> expected<node_id, error_info> {
  if (auto ok = detail::check_array(tree, array, "append"); !ok) {
    return unexpected(std::move(ok).error());
  }
  if (auto ok = detail::check_subtree(tree, subtree, "append"); !ok) {
    return unexpected(std::move(ok).error());
  }
  auto const& element = tree[array].ty.element();
  auto const& candidate = subtree[subtree.root()].ty;
  if (!fits(element, candidate)) {
    return make_error(errc::schema_mismatch, "append: " + tree.path_of(array) + " holds " +
                                               element.name() + ", given " + candidate.name());
  }

  auto id = tree.import_subtree(subtree, subtree.root(), array);
  tree[id].name.clear();
  tree[id].role = field_role::none;
  tree[array].children.push_back(id);
  detail::refresh_count(tree, array);
  mark_dirty(tree, array);

  if (get_logger().enabled(log_level::debug)) {
    TLVTREE_LOG_DEBUG("append: {} now holds {} elements", tree.path_of(array),
                      tree[array].children.size());
  }
  return id;
}

inline auto erase(parse_tree& tree, node_id array, std::size_t index)
  -> expected<void, error_info> {
  if (auto ok = detail::check_array(tree, array, "erase"); !ok) {
    return ok;
  }
  auto& children = tree[array].children;
  if (index >= children.size()) {
    return make_error(errc::invalid_node, "erase: " + tree.path_of(array) + " has no element " +
                                            std::to_string(index));
  }

  auto old = children[index];
  children.erase(children.begin() + static_cast<std::ptrdiff_t>(index));
  tree.release(old);
  detail::refresh_count(tree, array);
  mark_dirty(tree, array);

  if (get_logger().enabled(log_level::debug)) {
    TLVTREE_LOG_DEBUG("erase: {} element {} removed", tree.path_of(array), index);
  }
  return {};
}

inline auto set_uint(parse_tree& tree, node_id id, std::uint64_t value)
  -> expected<void, error_info> {
  if (!tree.contains(id) || !is_integer(tree[id].ty.get_kind())) {
    return make_error(errc::invalid_node,
                      "set_uint: node " + std::to_string(id) + " is not a live integer leaf");
  }
  auto& n = tree[id];
  if (value > max_for_width(n.size)) {
    return make_error(errc::schema_mismatch, "set_uint: " + std::to_string(value) +
                                               " does not fit " + n.ty.name() + " at " +
                                               tree.path_of(id));
  }
  n.value = value;
  mark_dirty(tree, id);
  return {};
}

inline auto set_bytes(parse_tree& tree, node_id id, bytes value) -> expected<void, error_info> {
  if (!tree.contains(id) || !is_bytes(tree[id].ty.get_kind())) {
    return make_error(errc::invalid_node,
                      "set_bytes: node " + std::to_string(id) + " is not a live block/text leaf");
  }

  bool resizable = true;
  auto parent = tree[id].parent;
  if (parent != no_node) {
    auto index = index_in_parent(tree, id);
    if (!index) {
      return make_error(errc::invalid_node, "set_bytes: node " + std::to_string(id) +
                                              " is not linked to its parent");
    }
    auto slot = detail::slot_of(tree, parent, *index);
    resizable = !slot.declared || slot.declared->is_dynamic();
  }

  auto& n = tree[id];
  if (value.size() != n.size) {
    if (!resizable) {
      return make_error(errc::schema_mismatch, "set_bytes: " + tree.path_of(id) + " is " +
                                                 n.ty.name() + ", given " +
                                                 std::to_string(value.size()) + " bytes");
    }
    n.ty = n.ty.with_size(value.size());
    n.size = value.size();
  }
  n.value = std::move(value);
  mark_dirty(tree, id);
  return {};
}

}  // namespace tlvtree
