#pragma once

#include <preload/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void preload_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

#ifdef __cplusplus
}
#endif

// Checked in every build type. For broken internal invariants only; input
// validation goes through Result<T>.
#define PRELOAD_ASSERT(expr)                                                   \
    if (PRELOAD_LIKELY(expr)) {                                                \
    }                                                                          \
    else {                                                                     \
        preload_assertion_failed(                                              \
            #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__);     \
    }
