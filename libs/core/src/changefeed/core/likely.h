#pragma once

#define CHANGEFEED_LIKELY(x) __builtin_expect(!!(x), 1)
#define CHANGEFEED_UNLIKELY(x) __builtin_expect(!!(x), 0)
