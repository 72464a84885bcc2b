#pragma once

#include <cstddef>
#include <string_view>

namespace tlvtree {

// clang-format off

/// Decodable type kinds.
enum class kind {
  // Little-endian unsigned integers
  u8,
  u16,
  u32,
  u64,

  // Raw byte runs
  block,      // opaque bytes
  text,       // character bytes, not terminator-aware

  // Composite
  array,      // `count` elements of one element type
  structure,  // ordered named fields
};

// clang-format on

[[nodiscard]] constexpr auto is_integer(kind k) noexcept -> bool {
  return k == kind::u8 || k == kind::u16 || k == kind::u32 || k == kind::u64;
}

[[nodiscard]] constexpr auto is_bytes(kind k) noexcept -> bool {
  return k == kind::block || k == kind::text;
}

[[nodiscard]] constexpr auto is_composite(kind k) noexcept -> bool {
  return k == kind::array || k == kind::structure;
}

/// Byte width of an integer kind, 0 otherwise.
[[nodiscard]] constexpr auto integer_width(kind k) noexcept -> std::size_t {
  switch (k) {
    case kind::u8:  return 1;
    case kind::u16: return 2;
    case kind::u32: return 4;
    case kind::u64: return 8;
    default:        return 0;
  }
}

/// User-readable kind name (for diagnostics/logging).
[[nodiscard]] constexpr auto kind_name(kind k) noexcept -> std::string_view {
  switch (k) {
    case kind::u8:        return "u8";
    case kind::u16:       return "u16";
    case kind::u32:       return "u32";
    case kind::u64:       return "u64";
    case kind::block:     return "block";
    case kind::text:      return "text";
    case kind::array:     return "array";
    case kind::structure: return "structure";
  }
  return "<unknown>";
}

}  // namespace tlvtree
