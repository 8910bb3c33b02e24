#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define SOCKANY_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define SOCKANY_LIKELY(x) (x)
#endif

namespace sockany::detail {

[[noreturn]] void assert_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void assert_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

}  // namespace sockany::detail

// -------------------- ASSERT --------------------
#if !defined(NDEBUG)

#define SOCKANY_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define SOCKANY_ASSERT_1(expr) \
  (SOCKANY_LIKELY(expr) ? (void)0 : ::sockany::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define SOCKANY_ASSERT_2(expr, msg) \
  (SOCKANY_LIKELY(expr) ? (void)0   \
                   : ::sockany::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define SOCKANY_ASSERT(...) SOCKANY_ASSERT_SELECTOR(__VA_ARGS__, SOCKANY_ASSERT_2, SOCKANY_ASSERT_1)(__VA_ARGS__)

#else
#define SOCKANY_ASSERT(...) ((void)0)
#endif

