#pragma once

#include <tlvtree/assert.hpp>
#include <tlvtree/tree.hpp>

#include <charconv>

namespace tlvtree {

inline auto parse_tree::add(node n) -> node_id {
  n.live = true;
  if (!free_.empty()) {
    auto id = free_.back();
    free_.pop_back();
    nodes_[id] = std::move(n);
    return id;
  }
  TLVTREE_ENSURE(nodes_.size() < no_node, "parse_tree node ids exhausted");
  auto id = static_cast<node_id>(nodes_.size());
  nodes_.push_back(std::move(n));
  return id;
}

inline auto parse_tree::release(node_id id) -> void {
  std::vector<node_id> stack{id};
  while (!stack.empty()) {
    auto cur = stack.back();
    stack.pop_back();
    auto& n = nodes_.at(cur);
    if (!n.live) {
      continue;
    }
    stack.insert(stack.end(), n.children.begin(), n.children.end());
    n = node{};
    n.live = false;
    free_.push_back(cur);
  }
  if (id == root_) {
    root_ = no_node;
  }
}

inline auto parse_tree::child(node_id id, std::size_t index) const -> std::optional<node_id> {
  if (!contains(id)) {
    return std::nullopt;
  }
  auto const& n = nodes_[id];
  if (index >= n.children.size()) {
    return std::nullopt;
  }
  return n.children[index];
}

inline auto parse_tree::child(node_id id, std::string_view name) const -> std::optional<node_id> {
  if (!contains(id)) {
    return std::nullopt;
  }
  for (auto c : nodes_[id].children) {
    if (nodes_[c].name == name) {
      return c;
    }
  }
  return std::nullopt;
}

inline auto parse_tree::find(node_id from, std::string_view path) const -> std::optional<node_id> {
  if (!contains(from)) {
    return std::nullopt;
  }
  auto cur = from;
  while (!path.empty()) {
    auto dot = path.find('.');
    auto segment = path.substr(0, dot);
    path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

    std::optional<node_id> next{};
    if (nodes_[cur].ty.get_kind() == kind::array) {
      std::size_t index{};
      auto res = std::from_chars(segment.data(), segment.data() + segment.size(), index);
      if (res.ec != std::errc{} || res.ptr != segment.data() + segment.size()) {
        return std::nullopt;
      }
      next = child(cur, index);
    } else {
      next = child(cur, segment);
    }
    if (!next) {
      return std::nullopt;
    }
    cur = *next;
  }
  return cur;
}

inline auto parse_tree::path_of(node_id id) const -> std::string {
  std::vector<std::string> parts{};
  auto cur = id;
  while (contains(cur) && nodes_[cur].parent != no_node) {
    auto const& n = nodes_[cur];
    auto const& p = nodes_[n.parent];
    if (p.ty.get_kind() == kind::array) {
      // A node still being decoded is not linked yet: it is the next element.
      auto index = p.children.size();
      for (std::size_t i = 0; i < p.children.size(); ++i) {
        if (p.children[i] == cur) {
          index = i;
          break;
        }
      }
      parts.push_back(std::to_string(index));
    } else {
      parts.push_back(n.name);
    }
    cur = n.parent;
  }

  std::string out{};
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!out.empty()) {
      out += '.';
    }
    out += *it;
  }
  return out.empty() ? std::string{"<root>"} : out;
}

inline auto parse_tree::import_subtree(parse_tree const& src, node_id src_id, node_id parent)
  -> node_id {
  TLVTREE_ENSURE(&src != this, "import_subtree() source must be a different tree");
  auto const& s = src.at(src_id);
  node copy{};
  copy.ty = s.ty;
  copy.name = s.name;
  copy.role = s.role;
  copy.offset = s.offset;
  copy.size = s.size;
  copy.value = s.value;
  copy.parent = parent;
  copy.dirty = s.dirty;
  auto id = add(std::move(copy));

  std::vector<node_id> kids{};
  kids.reserve(s.children.size());
  for (auto c : s.children) {
    kids.push_back(import_subtree(src, c, id));
  }
  nodes_[id].children = std::move(kids);
  return id;
}

inline auto field_view::find(std::string_view name) const -> node const* {
  for (auto id : fields_) {
    auto const& n = tree_[id];
    if (n.name == name) {
      return &n;
    }
  }
  return nullptr;
}

inline auto field_view::uint(std::string_view name) const -> expected<std::uint64_t, error_info> {
  auto const* n = find(name);
  if (n == nullptr) {
    return make_error(errc::schema_mismatch,
                      "field '" + std::string{name} + "' is not decoded before its dependent");
  }
  if (auto const* v = std::get_if<std::uint64_t>(&n->value)) {
    return *v;
  }
  return make_error(errc::schema_mismatch, "field '" + std::string{name} + "' is not an integer");
}

inline auto structurally_equal(parse_tree const& a, node_id ia, parse_tree const& b, node_id ib)
  -> bool {
  if (!a.contains(ia) || !b.contains(ib)) {
    return false;
  }
  auto const& x = a[ia];
  auto const& y = b[ib];
  if (x.ty.get_kind() != y.ty.get_kind() || x.name != y.name || x.role != y.role ||
      x.value != y.value || x.children.size() != y.children.size()) {
    return false;
  }
  if (x.ty.get_kind() == kind::structure && x.ty.fields().name() != y.ty.fields().name()) {
    return false;
  }
  for (std::size_t i = 0; i < x.children.size(); ++i) {
    if (!structurally_equal(a, x.children[i], b, y.children[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace tlvtree
