#pragma once

#define CHANGEFEED_NAMESPACE_BEGIN                                             \
    namespace changefeed                                                       \
    {

#define CHANGEFEED_NAMESPACE_END }

#define CHANGEFEED_NAMESPACE ::changefeed
