#pragma once

#include <changefeed/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

void changefeed_assertion_failed(
    char const *expr, char const *function, char const *file, long line)
    __attribute__((noreturn));

#ifdef __cplusplus
}
#endif

#define CHANGEFEED_ASSERT(expr)                                                \
    (CHANGEFEED_LIKELY(!!(expr))                                               \
         ? ((void)0)                                                           \
         : changefeed_assertion_failed(                                        \
               #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__))
