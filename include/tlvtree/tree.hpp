#pragma once

#include <tlvtree/endian.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/type.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tlvtree {

using node_id = std::uint32_t;

inline constexpr node_id no_node = (std::numeric_limits<node_id>::max)();

/// One node of a parse tree.
///
/// Ownership: a node owns the nodes listed in `children`. `parent` is a plain back-index used
/// for upward navigation only.
struct node {
  using value_type = std::variant<std::monostate, std::uint64_t, bytes>;

  type ty{};              // concrete (resolved) type
  std::string name{};     // field name within the parent structure; empty for array elements
  field_role role{field_role::none};

  std::size_t offset = 0;  // byte position in the source (or in the serialized root)
  std::size_t size = 0;    // bytes occupied by this node

  // Convention:
  // - integer kinds: std::uint64_t
  // - block/text:    bytes
  // - composite:     std::monostate (content lives in children)
  value_type value{};

  node_id parent = no_node;
  std::vector<node_id> children{};

  // Set by mutations on the mutated node's ancestors; cleared by resync().
  bool dirty = false;
  bool live = true;

  [[nodiscard]] auto is_composite() const noexcept -> bool {
    return tlvtree::is_composite(ty.get_kind());
  }

  /// Throws std::bad_variant_access when the node is not an integer leaf.
  [[nodiscard]] auto as_uint() const -> std::uint64_t { return std::get<std::uint64_t>(value); }

  /// Throws std::bad_variant_access when the node is not a block/text leaf.
  [[nodiscard]] auto as_bytes() const -> bytes const& { return std::get<bytes>(value); }

  [[nodiscard]] auto as_string() const -> std::string {
    auto const& b = as_bytes();
    return std::string(b.begin(), b.end());
  }
};

/// Arena of nodes addressed by node_id.
///
/// Released nodes stay in the arena (not live) and their ids are handed out again by add().
/// Ids of live nodes are stable across mutations.
class parse_tree {
 public:
  parse_tree() = default;

  [[nodiscard]] auto root() const noexcept -> node_id { return root_; }
  auto set_root(node_id id) -> void { root_ = id; }

  [[nodiscard]] auto contains(node_id id) const noexcept -> bool {
    return id < nodes_.size() && nodes_[id].live;
  }

  [[nodiscard]] auto at(node_id id) -> node& { return nodes_.at(id); }
  [[nodiscard]] auto at(node_id id) const -> node const& { return nodes_.at(id); }

  [[nodiscard]] auto operator[](node_id id) -> node& { return nodes_[id]; }
  [[nodiscard]] auto operator[](node_id id) const -> node const& { return nodes_[id]; }

  /// Store a node and return its id (reusing a released slot when available).
  auto add(node n) -> node_id;

  /// Release `id` and all of its descendants. Does not unlink `id` from its parent.
  auto release(node_id id) -> void;

  /// Number of live nodes.
  [[nodiscard]] auto live_count() const noexcept -> std::size_t { return nodes_.size() - free_.size(); }

  /// Child of `id` by position.
  [[nodiscard]] auto child(node_id id, std::size_t index) const -> std::optional<node_id>;

  /// Child of `id` by field name.
  [[nodiscard]] auto child(node_id id, std::string_view name) const -> std::optional<node_id>;

  /// Dotted path lookup from `from`: field names for structures, decimal indices for arrays.
  /// e.g. "payload.elements.1.length"
  [[nodiscard]] auto find(node_id from, std::string_view path) const -> std::optional<node_id>;
  [[nodiscard]] auto find(std::string_view path) const -> std::optional<node_id> {
    return find(root_, path);
  }

  /// Dotted path of `id` from the root, for diagnostics.
  [[nodiscard]] auto path_of(node_id id) const -> std::string;

  /// Copy the subtree rooted at `src_id` of `src` into this arena under `parent`.
  /// Returns the id of the copied root; the caller links it into parent's children.
  auto import_subtree(parse_tree const& src, node_id src_id, node_id parent) -> node_id;

  auto reset() -> void {
    nodes_.clear();
    free_.clear();
    root_ = no_node;
  }

 private:
  std::vector<node> nodes_{};
  std::vector<node_id> free_{};
  node_id root_ = no_node;
};

/// Read-only view over the fields of a structure decoded so far.
///
/// Handed to resolvers: only fields declared before the one being resolved are visible.
class field_view {
 public:
  field_view(parse_tree const& tree, std::span<node_id const> fields, std::size_t consumed)
      : tree_(tree), fields_(fields), consumed_(consumed) {}

  [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }

  /// Bytes occupied by the visible fields.
  [[nodiscard]] auto consumed() const noexcept -> std::size_t { return consumed_; }

  [[nodiscard]] auto find(std::string_view name) const -> node const*;

  /// Integer value of a preceding field; errc::schema_mismatch when absent or not an integer.
  [[nodiscard]] auto uint(std::string_view name) const -> expected<std::uint64_t, error_info>;

 private:
  parse_tree const& tree_;
  std::span<node_id const> fields_;
  std::size_t consumed_;
};

/// Structural equality: kinds, names, roles, values and children (offsets are ignored).
[[nodiscard]] inline auto structurally_equal(parse_tree const& a, node_id ia, parse_tree const& b,
                                             node_id ib) -> bool;

[[nodiscard]] inline auto structurally_equal(parse_tree const& a, parse_tree const& b) -> bool {
  return structurally_equal(a, a.root(), b, b.root());
}

}  // namespace tlvtree

#include <tlvtree/impl/tree.ipp>
