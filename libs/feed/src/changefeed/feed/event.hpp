#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/time.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

CHANGEFEED_NAMESPACE_BEGIN

enum class ChangeFeedEventType : uint8_t
{
    unknown = 0,
    blob_created,
    blob_deleted,
    blob_properties_updated,
    blob_snapshot_created,
    control,
};

enum class BlobType : uint8_t
{
    unknown = 0,
    block,
    page,
    append,
};

struct ChangeFeedEventData
{
    std::string api;
    std::string client_request_id;
    std::string request_id;
    std::string etag;
    std::string content_type;
    std::optional<uint64_t> content_length;
    BlobType blob_type{BlobType::unknown};
    std::string url;
    std::string sequencer;

    bool operator==(ChangeFeedEventData const &) const = default;
};

struct ChangeFeedEvent
{
    std::string id;
    std::string topic;
    std::string subject;
    ChangeFeedEventType event_type{ChangeFeedEventType::unknown};
    Timestamp event_time{};
    std::string data_version;
    std::string metadata_version;
    ChangeFeedEventData data;

    bool operator==(ChangeFeedEvent const &) const = default;
};

using ChangeFeedPage = std::vector<ChangeFeedEvent>;

std::string_view to_string(ChangeFeedEventType);
ChangeFeedEventType event_type_from_string(std::string_view);

std::string_view to_string(BlobType);
BlobType blob_type_from_string(std::string_view);

nlohmann::json to_json(ChangeFeedEvent const &);
Result<ChangeFeedEvent> event_from_json(nlohmann::json const &);

CHANGEFEED_NAMESPACE_END
