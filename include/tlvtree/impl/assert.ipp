#pragma once

#include <tlvtree/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace tlvtree::detail {

[[noreturn]] inline void fail(char const* kind, char const* expr, char const* msg,
                              char const* file, int line, char const* func) noexcept {
  if (msg) {
    std::fprintf(stderr,
                 "[tlvtree] %s failure\n"
                 "  expression: %s\n"
                 "  message   : %s\n"
                 "  location  : %s:%d\n"
                 "  function  : %s\n",
                 kind, expr ? expr : "(none)", msg, file, line, func);
  } else {
    std::fprintf(stderr,
                 "[tlvtree] %s failure\n"
                 "  expression: %s\n"
                 "  location  : %s:%d\n"
                 "  function  : %s\n",
                 kind, expr ? expr : "(none)", file, line, func);
  }
  std::fflush(stderr);
  std::abort();
}

// -------------------- ASSERT --------------------

inline void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  fail("ASSERT", expr, nullptr, file, line, func);
}

inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  fail("ASSERT", expr, msg, file, line, func);
}

// -------------------- ENSURE --------------------

inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  fail("ENSURE", expr, msg, file, line, func);
}

}  // namespace tlvtree::detail
