#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define TLVTREE_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define TLVTREE_LIKELY(x) (x)
#endif

namespace tlvtree::detail {

[[noreturn]] inline void assert_fail(char const* expr, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                                     char const* func) noexcept;

}  // namespace tlvtree::detail

// -------------------- ASSERT --------------------
#if !defined(NDEBUG)

#define TLVTREE_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define TLVTREE_ASSERT_1(expr)    \
  (TLVTREE_LIKELY(expr) ? (void)0 \
                        : ::tlvtree::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define TLVTREE_ASSERT_2(expr, msg) \
  (TLVTREE_LIKELY(expr)             \
     ? (void)0                      \
     : ::tlvtree::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define TLVTREE_ASSERT(...) \
  TLVTREE_ASSERT_SELECTOR(__VA_ARGS__, TLVTREE_ASSERT_2, TLVTREE_ASSERT_1)(__VA_ARGS__)

#else
#define TLVTREE_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE --------------------

#define TLVTREE_ENSURE(expr, msg) \
  (TLVTREE_LIKELY(expr)           \
     ? (void)0                    \
     : ::tlvtree::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, __func__))

#include <tlvtree/impl/assert.ipp>
