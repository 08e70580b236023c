#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define SVCWATCH_LIKELY(x) __builtin_expect(!!(x), 1)
#define SVCWATCH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SVCWATCH_LIKELY(x) (x)
#define SVCWATCH_UNLIKELY(x) (x)
#endif

namespace svcwatch::detail {

/// Report a violated invariant and abort the process.
///
/// `kind` is one of "ASSERT", "ENSURE" or "UNREACHABLE"; `expr` and `msg` may be null.
[[noreturn]] void check_failed(char const* kind, char const* expr, char const* msg,
                               char const* file, int line, char const* func) noexcept;

}  // namespace svcwatch::detail

// SVCWATCH_ASSERT: debug-only invariant check (compiled out with NDEBUG).
// SVCWATCH_ENSURE: always-on precondition check for misuse of the public API.
//
// Both accept an optional message: SVCWATCH_ENSURE(ptr, "executor: empty impl").

#define SVCWATCH_CHECK_SELECTOR(_1, _2, NAME, ...) NAME

#define SVCWATCH_CHECK_1(kind, expr)                                                         \
  (SVCWATCH_LIKELY(expr) ? (void)0                                                           \
                         : ::svcwatch::detail::check_failed(kind, #expr, nullptr, __FILE__, \
                                                            __LINE__, __func__))

#define SVCWATCH_CHECK_2(kind, expr, msg)                                                  \
  (SVCWATCH_LIKELY(expr) ? (void)0                                                         \
                         : ::svcwatch::detail::check_failed(kind, #expr, msg, __FILE__,   \
                                                            __LINE__, __func__))

#define SVCWATCH_ENSURE_1(expr) SVCWATCH_CHECK_1("ENSURE", expr)
#define SVCWATCH_ENSURE_2(expr, msg) SVCWATCH_CHECK_2("ENSURE", expr, msg)
#define SVCWATCH_ENSURE(...) \
  SVCWATCH_CHECK_SELECTOR(__VA_ARGS__, SVCWATCH_ENSURE_2, SVCWATCH_ENSURE_1)(__VA_ARGS__)

#if !defined(NDEBUG)
#define SVCWATCH_ASSERT_1(expr) SVCWATCH_CHECK_1("ASSERT", expr)
#define SVCWATCH_ASSERT_2(expr, msg) SVCWATCH_CHECK_2("ASSERT", expr, msg)
#define SVCWATCH_ASSERT(...) \
  SVCWATCH_CHECK_SELECTOR(__VA_ARGS__, SVCWATCH_ASSERT_2, SVCWATCH_ASSERT_1)(__VA_ARGS__)
#else
#define SVCWATCH_ASSERT(...) ((void)0)
#endif

#define SVCWATCH_UNREACHABLE() \
  ::svcwatch::detail::check_failed("UNREACHABLE", nullptr, nullptr, __FILE__, __LINE__, __func__)
