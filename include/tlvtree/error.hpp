#pragma once

#include <system_error>
#include <type_traits>

namespace tlvtree {

enum class errc {
  /// Tag is not bound in the registry used for decoding.
  ///
  /// Raised right after the record header has been read; no payload byte is consumed.
  unknown_tag = 1,

  /// Tag is already bound (registration-time conflict).
  duplicate_tag,

  /// The source holds fewer bytes than a field or a record length declares.
  /// The underlying byte-source failure (out_of_range) is attached as the cause.
  truncated_input,

  /// Byte-source read past the end of the source.
  out_of_range,

  /// A value or subtree does not fit the slot it is placed into.
  schema_mismatch,

  /// Record length is smaller than the record header.
  invalid_length,

  /// Record length disagrees with the decoded or serialized size.
  length_mismatch,

  /// Children offsets are not contiguous.
  offset_gap,

  /// Array count exceeds decode_options::max_array_count.
  count_limit_exceeded,

  /// Composite nesting exceeds decode_options::max_depth.
  nesting_too_deep,

  /// Node id, child index or node kind is not valid for the operation.
  invalid_node,

  /// File-backed source could not be opened or read.
  io_error,
};

inline auto make_error_code(errc e) -> std::error_code;

}  // namespace tlvtree

namespace std {

template <>
struct is_error_code_enum<tlvtree::errc> : std::true_type {};

}  // namespace std

#include <tlvtree/impl/error.ipp>
