#pragma once

#include <tlvtree/error.hpp>

#include <string>

namespace tlvtree {
namespace detail {

struct error_category_impl : std::error_category {
  virtual ~error_category_impl() = default;

  auto name() const noexcept -> char const* override { return "tlvtree"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<errc>(ev)) {
      case errc::unknown_tag:          return "unknown tag";
      case errc::duplicate_tag:        return "duplicate tag";
      case errc::truncated_input:      return "truncated input";
      case errc::out_of_range:         return "read out of range";
      case errc::schema_mismatch:      return "schema mismatch";
      case errc::invalid_length:       return "invalid record length";
      case errc::length_mismatch:      return "record length mismatch";
      case errc::offset_gap:           return "non-contiguous offsets";
      case errc::count_limit_exceeded: return "array count exceeds limit";
      case errc::nesting_too_deep:     return "nesting too deep";
      case errc::invalid_node:         return "invalid node";
      case errc::io_error:             return "i/o error";
      default:                         return "tlvtree error";
    }
    // clang-format on
  }
};

inline auto category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(errc e) -> std::error_code {
  return std::error_code{static_cast<int>(e), detail::category()};
}

}  // namespace tlvtree
