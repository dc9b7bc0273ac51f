#pragma once

#include <changefeed/config.hpp>

#include <cstddef>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

inline constexpr std::string_view CHANGE_FEED_CONTAINER_NAME =
    "$blobchangefeed";

//! \brief Control blob carrying `lastConsumable`
inline constexpr std::string_view META_SEGMENTS_PATH = "meta/segments.json";

//! \brief Root of the year/month/day/hour segment hierarchy
inline constexpr std::string_view SEGMENT_PREFIX = "idx/segments/";

//! \brief Year the service writes its initialization segment under; never
//! holds events
inline constexpr std::string_view INITIALIZATION_SEGMENT = "1601";

inline constexpr size_t DEFAULT_PAGE_SIZE = 512;

CHANGEFEED_NAMESPACE_END
