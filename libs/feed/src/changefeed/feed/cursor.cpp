#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/cursor.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/path.hpp>
#include <changefeed/feed/time.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

namespace
{
    constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
    constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

    bool is_unsigned(nlohmann::json const &j, char const *const key)
    {
        auto const it = j.find(key);
        return it != j.end() && it->is_number_unsigned();
    }
}

uint64_t container_hash(std::string_view const address)
{
    uint64_t hash = FNV_OFFSET_BASIS;
    for (char const c : address) {
        hash ^= static_cast<unsigned char>(c);
        hash *= FNV_PRIME;
    }
    return hash;
}

nlohmann::json to_json(ChangeFeedCursor const &cursor)
{
    nlohmann::json segment{};
    segment["segmentPath"] = cursor.segment_cursor.segment_path;
    segment["chunkIndex"] = cursor.segment_cursor.chunk_index;
    segment["eventOffset"] = cursor.segment_cursor.event_offset;

    nlohmann::json res{};
    res["containerHash"] = cursor.container_hash;
    if (cursor.end_time.has_value()) {
        res["endTime"] = format_timestamp(cursor.end_time.value());
    }
    else {
        res["endTime"] = nullptr;
    }
    res["segmentCursor"] = std::move(segment);
    return res;
}

Result<ChangeFeedCursor> cursor_from_json(nlohmann::json const &j)
{
    if (!j.is_object() || !is_unsigned(j, "containerHash")) {
        return ChangeFeedError::malformed_cursor;
    }
    ChangeFeedCursor cursor;
    cursor.container_hash = j["containerHash"].get<uint64_t>();

    if (auto const it = j.find("endTime"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return ChangeFeedError::malformed_cursor;
        }
        auto const end_time = parse_timestamp(it->get<std::string>());
        if (end_time.has_error()) {
            return ChangeFeedError::malformed_cursor;
        }
        cursor.end_time = end_time.value();
    }

    auto const segment = j.find("segmentCursor");
    if (segment == j.end() || !segment->is_object()) {
        return ChangeFeedError::malformed_cursor;
    }
    auto const path = segment->find("segmentPath");
    if (path == segment->end() || !path->is_string() ||
        !is_unsigned(*segment, "chunkIndex") ||
        !is_unsigned(*segment, "eventOffset")) {
        return ChangeFeedError::malformed_cursor;
    }
    cursor.segment_cursor.segment_path = path->get<std::string>();
    cursor.segment_cursor.chunk_index =
        (*segment)["chunkIndex"].get<uint64_t>();
    cursor.segment_cursor.event_offset =
        (*segment)["eventOffset"].get<uint64_t>();

    // a cursor is only useful if it names a segment we can place in time
    if (parse_segment_path(cursor.segment_cursor.segment_path).has_error()) {
        return ChangeFeedError::malformed_cursor;
    }
    return cursor;
}

std::string serialize_cursor(ChangeFeedCursor const &cursor)
{
    return to_json(cursor).dump();
}

Result<ChangeFeedCursor> parse_cursor(std::string_view const s)
{
    auto const j =
        nlohmann::json::parse(s, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return ChangeFeedError::malformed_cursor;
    }
    return cursor_from_json(j);
}

CHANGEFEED_NAMESPACE_END
