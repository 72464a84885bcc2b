#pragma once

#include <tlvtree/endian.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/tree.hpp>
#include <tlvtree/type.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <variant>
#include <vector>

namespace tlvtree {

/// Initial value for an allocated node.
///
/// Leaves take an integer or bytes; composites take one child initializer per field (or per
/// array element), in order:
///
///   allocate(record, {0, 9, 0x12345678});
///   allocate(list, {2, 0, {}});           // empty list, placeholder length
///
/// Note: `init{x}` with a single braced element builds a composite with one child. Use
/// `init(x)` for a leaf.
class init {
 public:
  init() = default;

  template <std::integral I>
  init(I v) : value_(static_cast<std::uint64_t>(v)) {}

  init(bytes b) : value_(std::move(b)) {}
  init(std::string_view s) : value_(bytes(s.begin(), s.end())) {}
  init(char const* s) : init(std::string_view{s}) {}

  init(std::initializer_list<init> children) : children_(children) {}

  [[nodiscard]] static auto composite(std::vector<init> children) -> init {
    init v{};
    v.children_ = std::move(children);
    return v;
  }

  [[nodiscard]] auto is_uint() const noexcept -> bool {
    return std::holds_alternative<std::uint64_t>(value_);
  }
  [[nodiscard]] auto is_bytes() const noexcept -> bool {
    return std::holds_alternative<bytes>(value_);
  }
  [[nodiscard]] auto is_composite() const noexcept -> bool {
    return std::holds_alternative<std::monostate>(value_);
  }

  [[nodiscard]] auto as_uint() const -> std::uint64_t { return std::get<std::uint64_t>(value_); }
  [[nodiscard]] auto as_bytes() const -> bytes const& { return std::get<bytes>(value_); }
  [[nodiscard]] auto children() const noexcept -> std::vector<init> const& { return children_; }

 private:
  std::variant<std::monostate, std::uint64_t, bytes> value_{};
  std::vector<init> children_{};
};

/// Allocate a tree of type `t` from `v`, without any byte source.
///
/// Resolver fields are evaluated against the children allocated before them, exactly as the
/// decoder would, so a record's payload type follows its tag and length. Dynamic block/text
/// leaves are sized from their bytes; array counts follow the number of child initializers.
/// Offsets are assigned from 0.
///
/// Returns errc::schema_mismatch when `v` does not fit `t`, or any resolver error.
[[nodiscard]] inline auto allocate(type const& t, init const& v)
  -> expected<parse_tree, error_info>;

}  // namespace tlvtree

#include <tlvtree/impl/builder.ipp>
