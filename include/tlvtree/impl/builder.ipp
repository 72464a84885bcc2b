#pragma once

#include <tlvtree/builder.hpp>

#include <span>
#include <string>
#include <utility>

namespace tlvtree {

namespace detail {

class allocator {
 public:
  explicit allocator(parse_tree& tree) : tree_(tree) {}

  auto build(type const& t, init const& v, std::string name, field_role role, node_id parent,
             std::size_t offset) -> expected<node_id, error_info> {
    if (is_integer(t.get_kind())) {
      return build_integer(t, v, std::move(name), role, parent, offset);
    }
    if (is_bytes(t.get_kind())) {
      return build_bytes(t, v, std::move(name), role, parent, offset);
    }
    if (!v.is_composite()) {
      return make_error(errc::schema_mismatch, label(name, parent) + ": " + t.name() +
                                                 " needs child initializers");
    }
    if (t.get_kind() == kind::array) {
      return build_array(t, v, std::move(name), role, parent, offset);
    }
    return build_structure(t, v, std::move(name), role, parent, offset);
  }

 private:
  auto label(std::string const& name, node_id parent) const -> std::string {
    if (parent == no_node) {
      return name.empty() ? std::string{"<root>"} : name;
    }
    auto p = tree_.path_of(parent);
    auto leaf = name.empty() ? std::to_string(tree_[parent].children.size()) : name;
    return p == "<root>" ? leaf : p + "." + leaf;
  }

  auto make_node(type t, std::string name, field_role role, node_id parent, std::size_t offset)
    -> node {
    node n{};
    n.ty = std::move(t);
    n.name = std::move(name);
    n.role = role;
    n.offset = offset;
    n.parent = parent;
    return n;
  }

  auto build_integer(type const& t, init const& v, std::string name, field_role role,
                     node_id parent, std::size_t offset) -> expected<node_id, error_info> {
    if (!v.is_uint()) {
      return make_error(errc::schema_mismatch,
                        label(name, parent) + ": " + t.name() + " needs an integer");
    }
    auto width = integer_width(t.get_kind());
    if (v.as_uint() > max_for_width(width)) {
      return make_error(errc::schema_mismatch, label(name, parent) + ": " +
                                                 std::to_string(v.as_uint()) +
                                                 " does not fit " + t.name());
    }
    auto n = make_node(t, std::move(name), role, parent, offset);
    n.size = width;
    n.value = v.as_uint();
    return tree_.add(std::move(n));
  }

  auto build_bytes(type const& t, init const& v, std::string name, field_role role,
                   node_id parent, std::size_t offset) -> expected<node_id, error_info> {
    if (!v.is_bytes()) {
      return make_error(errc::schema_mismatch,
                        label(name, parent) + ": " + t.name() + " needs bytes");
    }
    auto const& b = v.as_bytes();
    if (t.size() && *t.size() != b.size()) {
      return make_error(errc::schema_mismatch, label(name, parent) + ": " + t.name() +
                                                 " given " + std::to_string(b.size()) +
                                                 " bytes");
    }
    auto n = make_node(t.is_dynamic() ? t.with_size(b.size()) : t, std::move(name), role, parent,
                       offset);
    n.size = b.size();
    n.value = b;
    return tree_.add(std::move(n));
  }

  auto build_array(type const& t, init const& v, std::string name, field_role role,
                   node_id parent, std::size_t offset) -> expected<node_id, error_info> {
    auto const& items = v.children();
    if (t.count() && *t.count() != items.size()) {
      return make_error(errc::schema_mismatch, label(name, parent) + ": " + t.name() +
                                                 " given " + std::to_string(items.size()) +
                                                 " elements");
    }
    auto node_type =
      t.is_byte_bounded() ? t : t.with_count(static_cast<std::uint32_t>(items.size()));
    auto id = tree_.add(make_node(std::move(node_type), std::move(name), role, parent, offset));

    auto cur = offset;
    for (auto const& item : items) {
      auto child = build(t.element(), item, std::string{}, field_role::none, id, cur);
      if (!child) {
        return unexpected(std::move(child).error());
      }
      cur += tree_[*child].size;
      tree_[id].children.push_back(*child);
    }
    if (t.is_byte_bounded() && cur - offset != *t.size()) {
      return make_error(errc::schema_mismatch, tree_.path_of(id) + ": " + t.name() + " given " +
                                                 std::to_string(cur - offset) + " bytes");
    }
    tree_[id].size = cur - offset;
    return id;
  }

  auto build_structure(type const& t, init const& v, std::string name, field_role role,
                       node_id parent, std::size_t offset) -> expected<node_id, error_info> {
    auto const& fields = t.fields();
    auto const& items = v.children();
    if (items.size() != fields.size()) {
      return make_error(errc::schema_mismatch, label(name, parent) + ": " + fields.name() +
                                                 " has " + std::to_string(fields.size()) +
                                                 " fields, given " +
                                                 std::to_string(items.size()));
    }
    auto id = tree_.add(make_node(t, std::move(name), role, parent, offset));

    auto cur = offset;
    for (std::size_t i = 0; i < fields.size(); ++i) {
      auto const& f = fields.at(i);
      type resolved{};
      if (auto const* fixed = std::get_if<type>(&f.decl)) {
        resolved = *fixed;
      } else {
        auto const& done = tree_[id].children;
        field_view view{tree_, std::span<node_id const>{done}, cur - offset};
        auto r = std::get<resolver>(f.decl)(view);
        if (!r) {
          auto err = std::move(r).error();
          err.append_detail("while resolving " + label(f.name, id));
          return unexpected(std::move(err));
        }
        resolved = std::move(*r);
      }

      auto child = build(resolved, items[i], f.name, f.role, id, cur);
      if (!child) {
        return unexpected(std::move(child).error());
      }
      cur += tree_[*child].size;
      tree_[id].children.push_back(*child);
    }
    tree_[id].size = cur - offset;
    return id;
  }

  parse_tree& tree_;
};

}  // namespace detail

inline auto allocate(type const& t, init const& v) -> expected<parse_tree, error_info> {
  parse_tree tree{};
  detail::allocator alloc{tree};
  auto root = alloc.build(t, v, std::string{}, field_role::none, no_node, 0);
  if (!root) {
    return unexpected(std::move(root).error());
  }
  tree.set_root(*root);
  return tree;
}

}  // namespace tlvtree
