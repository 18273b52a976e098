#pragma once

#include <strata/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void strata_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#ifdef __cplusplus
}
#endif

// clang-format off
#define STRATA_ASSERT(expr)                                                      \
    (STRATA_LIKELY(!!(expr))                                                     \
         ? ((void)0)                                                             \
         : strata_assertion_failed(                                              \
               #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__, nullptr))

/// Abort with a backtrace; msg must be a compile-time-constant string
#define STRATA_ABORT(msg)                                                        \
    strata_assertion_failed(                                                     \
        nullptr, __PRETTY_FUNCTION__, __FILE__, __LINE__, (msg))

#ifdef NDEBUG
    #define STRATA_DEBUG_ASSERT(x)                                               \
        do {                                                                     \
            (void)sizeof(x); /* NOLINT: suppressing bugprone-sizeof-expression*/ \
        }                                                                        \
        while (0)
#else
    #define STRATA_DEBUG_ASSERT(x) STRATA_ASSERT(x)
#endif
// clang-format on
