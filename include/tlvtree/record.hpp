#pragma once

#include <tlvtree/registry.hpp>
#include <tlvtree/tree.hpp>
#include <tlvtree/type.hpp>

#include <cstddef>
#include <string_view>

namespace tlvtree {

/// Record wrapper layout (little-endian):
///
/// | offset | field   | type | notes                                   |
/// |--------|---------|------|-----------------------------------------|
/// | 0      | tag     | u8   | selects the variant in the registry     |
/// | 1      | length  | u32  | total record size including this header |
/// | 5      | payload | ...  | variant payload, `length - 5` bytes     |
inline constexpr std::size_t record_header_size = 5;

inline constexpr std::string_view record_schema_name = "record";
inline constexpr std::string_view list_schema_name = "list";

/// General tag-dispatched record type for `reg`.
///
/// The tag is looked up as soon as it is decoded (errc::unknown_tag when absent), before any
/// byte after it is read. The payload resolver sizes dynamic payloads (unsized block/text, or
/// an array with neither count nor extent) from `length - record_header_size`
/// (errc::invalid_length when length is smaller than the header).
[[nodiscard]] inline auto record_type(registry const& reg) -> type;

/// List payload type: count (u32) followed by exactly `count` records of `reg`.
[[nodiscard]] inline auto list_type(registry const& reg) -> type;

/// Records of `reg` with no count in front of them.
///
/// As a variant payload it is bounded by the record's length: elements are decoded until
/// `length - record_header_size` bytes are used (errc::length_mismatch when the last one runs
/// past that extent).
[[nodiscard]] inline auto record_sequence_type(registry const& reg) -> type {
  return type::array(record_type(reg));
}

}  // namespace tlvtree

#include <tlvtree/impl/record.ipp>
