#pragma once

#include <tlvtree/endian.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/tree.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tlvtree {

// Tree edits.
//
// Every operation validates first and only then touches the tree: on error the tree is left
// exactly as it was. Edits never rewrite lengths, counts or offsets; they mark the edited
// node's ancestors dirty and leave the bookkeeping to resync().

/// Replace child `index` of composite node `parent` with a copy of `subtree`'s root.
///
/// The copy takes over the slot's field name and role. Returns the id of the new child.
/// Errors:
/// - errc::invalid_node: `parent` is not a live composite, `index` is out of range, or
///   `subtree` is empty (or is `tree` itself)
/// - errc::schema_mismatch: the replacement does not fit the slot (the field's declared type,
///   the array's element type, or for resolved fields the shape of the current child)
inline auto replace(parse_tree& tree, node_id parent, std::size_t index, parse_tree const& subtree)
  -> expected<node_id, error_info>;

/// Append a copy of `subtree`'s root to array node `array`.
inline auto append(parse_tree& tree, node_id array, parse_tree const& subtree)
  -> expected<node_id, error_info>;

/// Remove element `index` of array node `array` and release its subtree.
inline auto erase(parse_tree& tree, node_id array, std::size_t index) -> expected<void, error_info>;

/// Set an integer leaf. errc::schema_mismatch when `value` exceeds the leaf's width.
inline auto set_uint(parse_tree& tree, node_id id, std::uint64_t value) -> expected<void, error_info>;

/// Set a block/text leaf.
///
/// A leaf in a dynamic slot (dynamic declared type, or a resolved field) is re-sized to the
/// new bytes; otherwise the byte count must equal the leaf's size (errc::schema_mismatch).
inline auto set_bytes(parse_tree& tree, node_id id, bytes value) -> expected<void, error_info>;

/// Mark `id` and all of its ancestors dirty.
inline auto mark_dirty(parse_tree& tree, node_id id) -> void;

/// Position of `id` in its parent's children; nullopt for the root or a detached node.
[[nodiscard]] inline auto index_in_parent(parse_tree const& tree, node_id id) -> std::optional<std::size_t>;

}  // namespace tlvtree

#include <tlvtree/impl/mutate.ipp>
