#pragma once

#include <changefeed/config.hpp>

#define CHANGEFEED_FIBER_NAMESPACE_BEGIN                                       \
    CHANGEFEED_NAMESPACE_BEGIN namespace fiber                                 \
    {

#define CHANGEFEED_FIBER_NAMESPACE_END                                         \
    }                                                                          \
    CHANGEFEED_NAMESPACE_END

#define CHANGEFEED_FIBER_NAMESPACE ::changefeed::fiber
