#pragma once

#include <changefeed/config.hpp>

#define CHANGEFEED_STORAGE_NAMESPACE_BEGIN                                     \
    CHANGEFEED_NAMESPACE_BEGIN namespace storage                               \
    {

#define CHANGEFEED_STORAGE_NAMESPACE_END                                       \
    }                                                                          \
    CHANGEFEED_NAMESPACE_END

#define CHANGEFEED_STORAGE_NAMESPACE ::changefeed::storage
