#pragma once

#include <tlvtree/assert.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tlvtree {

using bytes = std::vector<std::uint8_t>;

/// Little-endian unsigned load of `in.size()` bytes (1..8).
[[nodiscard]] inline auto load_le(std::span<std::uint8_t const> in) noexcept -> std::uint64_t {
  TLVTREE_ASSERT(in.size() <= 8);
  std::uint64_t v = 0;
  for (std::size_t i = in.size(); i > 0; --i) {
    v = (v << 8) | static_cast<std::uint64_t>(in[i - 1]);
  }
  return v;
}

/// Append the low `width` bytes of `v`, least significant first.
inline void store_le(bytes& out, std::uint64_t v, std::size_t width) {
  TLVTREE_ASSERT(width <= 8);
  for (std::size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

/// Largest value representable in `width` bytes.
[[nodiscard]] constexpr auto max_for_width(std::size_t width) noexcept -> std::uint64_t {
  return width >= 8 ? ~std::uint64_t{0} : (std::uint64_t{1} << (8 * width)) - 1;
}

}  // namespace tlvtree
