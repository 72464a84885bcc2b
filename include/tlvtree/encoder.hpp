#pragma once

#include <tlvtree/endian.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/tree.hpp>

#include <cstddef>

namespace tlvtree {

/// Serialize the subtree rooted at `id`: children in schema order, integers little-endian at
/// their width, block/text bytes as stored.
///
/// Length and count fields are written as stored; call resync() first after mutations.
/// errc::invalid_node when `id` is not live.
[[nodiscard]] inline auto serialize(parse_tree const& tree, node_id id)
  -> expected<bytes, error_info>;

[[nodiscard]] inline auto serialize(parse_tree const& tree) -> expected<bytes, error_info> {
  return serialize(tree, tree.root());
}

/// Byte count serialize(tree, id) would produce (computed from values, not stored sizes).
[[nodiscard]] inline auto serialized_size(parse_tree const& tree, node_id id) -> std::size_t;

/// Set the `record_length` field of structure `id` to its serialized size, and its stored size.
///
/// Errors:
/// - errc::invalid_node: `id` is not a live structure with a record_length field
/// - errc::invalid_length: the size does not fit the length field's width
inline auto recompute_length(parse_tree& tree, node_id id) -> expected<void, error_info>;

/// Refresh stored sizes under `root` bottom-up, then lay offsets out contiguously in document
/// order starting at `root`'s own offset. Dirty flags are left as they are.
inline auto resync_offsets(parse_tree& tree, node_id root) -> expected<void, error_info>;

/// Full pass after mutations, children before parents:
/// - element_count fields take the element count of the next array field
/// - sizes are recomputed; arrays take their new count, or their new extent when byte-bounded
/// - record_length fields take the size of their structure
/// then offsets are laid out again and every dirty flag is cleared.
///
/// Every new value is checked before any is written: on error (errc::invalid_length,
/// errc::count_limit_exceeded, errc::invalid_node) the tree is left unchanged.
/// Running it on an already consistent tree changes nothing.
inline auto resync(parse_tree& tree) -> expected<void, error_info>;

/// Check the tree's bookkeeping without changing it.
///
/// - errc::length_mismatch: a record_length or element_count field, or a byte-bounded array's
///   extent, disagrees with the data
/// - errc::invalid_node: a record_length or element_count field does not hold an integer
/// - errc::offset_gap: children are not laid out contiguously from their parent's offset, or
///   a composite's size is not the sum of its children
[[nodiscard]] inline auto verify(parse_tree const& tree) -> expected<void, error_info>;

}  // namespace tlvtree

#include <tlvtree/impl/encoder.ipp>
