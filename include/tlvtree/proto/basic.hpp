#pragma once

#include <tlvtree/builder.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/record.hpp>
#include <tlvtree/registry.hpp>
#include <tlvtree/tree.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace tlvtree::proto {

// Basic record family:
//
// | tag | name    | payload                         | record length    |
// |-----|---------|---------------------------------|------------------|
// | 0   | integer | u32                             | 9                |
// | 1   | text    | `length - 5` raw bytes          | 5 + text size    |
// | 2   | list    | u32 count + `count` records     | 9 + element sum  |
inline constexpr tag_type integer_tag = 0;
inline constexpr tag_type text_tag = 1;
inline constexpr tag_type list_tag = 2;

/// Bind the three basic variants in `reg`. The list variant refers back to `reg` for its
/// elements, so any variant registered later may also appear inside a list.
inline auto register_variants(registry& reg) -> expected<void, error_info>;

/// Integer record with a consistent length.
[[nodiscard]] inline auto make_integer(registry const& reg, std::uint32_t value)
  -> expected<parse_tree, error_info>;

/// Text record; `s` is copied byte for byte (embedded NULs included).
[[nodiscard]] inline auto make_text(registry const& reg, std::string_view s)
  -> expected<parse_tree, error_info>;

/// List record holding copies of `elements` (each a record tree), resynced.
[[nodiscard]] inline auto make_list(registry const& reg, std::vector<parse_tree> const& elements)
  -> expected<parse_tree, error_info>;

}  // namespace tlvtree::proto

#include <tlvtree/proto/impl/basic.ipp>
