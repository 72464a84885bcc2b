#pragma once

#include <cstddef>
#include <cstdint>

namespace tlvtree {

/// How the decoder treats a record's length field.
enum class length_policy {
  /// The structurally decoded size must equal the declared length (errc::length_mismatch).
  validate,
  /// The declared length sizes dynamic payloads only; disagreements are logged, not rejected.
  trust,
};

/// Decoder configuration.
struct decode_options {
  length_policy lengths = length_policy::validate;

  // Input hardening limits (enabled by default).
  // Exceeding max_array_count is treated as errc::count_limit_exceeded; 0 disables the check.
  std::uint32_t max_array_count = 1'000'000U;

  // Maximum composite nesting (records inside lists inside records ...).
  // Exceeding it is treated as errc::nesting_too_deep.
  std::size_t max_depth = 64;
};

}  // namespace tlvtree
