#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/time.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

//! \brief Position inside one segment: the next unread event is event
//! `event_offset` of chunk `chunk_index`
struct SegmentCursor
{
    std::string segment_path;
    uint64_t chunk_index{0};
    uint64_t event_offset{0};

    bool operator==(SegmentCursor const &) const = default;
};

struct ChangeFeedCursor
{
    uint64_t container_hash{0};
    std::optional<Timestamp> end_time;
    SegmentCursor segment_cursor;

    bool operator==(ChangeFeedCursor const &) const = default;
};

//! \brief 64-bit FNV-1a of the container address; stable across processes
uint64_t container_hash(std::string_view address);

nlohmann::json to_json(ChangeFeedCursor const &);
Result<ChangeFeedCursor> cursor_from_json(nlohmann::json const &);

std::string serialize_cursor(ChangeFeedCursor const &);
Result<ChangeFeedCursor> parse_cursor(std::string_view);

CHANGEFEED_NAMESPACE_END
