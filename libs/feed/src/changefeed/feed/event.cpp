#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/event.hpp>
#include <changefeed/feed/time.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

CHANGEFEED_NAMESPACE_BEGIN

namespace
{
    // Optional string member; a present but non-string member is an error
    bool read_string(
        nlohmann::json const &j, char const *const key, std::string &out)
    {
        auto const it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return true;
        }
        if (!it->is_string()) {
            return false;
        }
        out = it->get<std::string>();
        return true;
    }

    Result<ChangeFeedEventData> data_from_json(nlohmann::json const &j)
    {
        ChangeFeedEventData data;
        if (!j.is_object()) {
            return ChangeFeedError::malformed_event;
        }
        std::string blob_type;
        if (!read_string(j, "api", data.api) ||
            !read_string(j, "clientRequestId", data.client_request_id) ||
            !read_string(j, "requestId", data.request_id) ||
            !read_string(j, "etag", data.etag) ||
            !read_string(j, "contentType", data.content_type) ||
            !read_string(j, "blobType", blob_type) ||
            !read_string(j, "url", data.url) ||
            !read_string(j, "sequencer", data.sequencer)) {
            return ChangeFeedError::malformed_event;
        }
        data.blob_type = blob_type_from_string(blob_type);
        if (auto const it = j.find("contentLength");
            it != j.end() && !it->is_null()) {
            if (!it->is_number_unsigned() && !it->is_number_integer()) {
                return ChangeFeedError::malformed_event;
            }
            if (it->is_number_integer() && it->get<int64_t>() < 0) {
                return ChangeFeedError::malformed_event;
            }
            data.content_length = it->get<uint64_t>();
        }
        return data;
    }
}

std::string_view to_string(ChangeFeedEventType const type)
{
    switch (type) {
    case ChangeFeedEventType::blob_created:
        return "BlobCreated";
    case ChangeFeedEventType::blob_deleted:
        return "BlobDeleted";
    case ChangeFeedEventType::blob_properties_updated:
        return "BlobPropertiesUpdated";
    case ChangeFeedEventType::blob_snapshot_created:
        return "BlobSnapshotCreated";
    case ChangeFeedEventType::control:
        return "Control";
    case ChangeFeedEventType::unknown:
        break;
    }
    return "Unknown";
}

ChangeFeedEventType event_type_from_string(std::string_view const s)
{
    if (s == "BlobCreated") {
        return ChangeFeedEventType::blob_created;
    }
    if (s == "BlobDeleted") {
        return ChangeFeedEventType::blob_deleted;
    }
    if (s == "BlobPropertiesUpdated") {
        return ChangeFeedEventType::blob_properties_updated;
    }
    if (s == "BlobSnapshotCreated") {
        return ChangeFeedEventType::blob_snapshot_created;
    }
    if (s == "Control") {
        return ChangeFeedEventType::control;
    }
    return ChangeFeedEventType::unknown;
}

std::string_view to_string(BlobType const type)
{
    switch (type) {
    case BlobType::block:
        return "BlockBlob";
    case BlobType::page:
        return "PageBlob";
    case BlobType::append:
        return "AppendBlob";
    case BlobType::unknown:
        break;
    }
    return "Unknown";
}

BlobType blob_type_from_string(std::string_view const s)
{
    if (s == "BlockBlob") {
        return BlobType::block;
    }
    if (s == "PageBlob") {
        return BlobType::page;
    }
    if (s == "AppendBlob") {
        return BlobType::append;
    }
    return BlobType::unknown;
}

nlohmann::json to_json(ChangeFeedEvent const &event)
{
    nlohmann::json data{};
    data["api"] = event.data.api;
    data["clientRequestId"] = event.data.client_request_id;
    data["requestId"] = event.data.request_id;
    data["etag"] = event.data.etag;
    data["contentType"] = event.data.content_type;
    if (event.data.content_length.has_value()) {
        data["contentLength"] = event.data.content_length.value();
    }
    data["blobType"] = to_string(event.data.blob_type);
    data["url"] = event.data.url;
    data["sequencer"] = event.data.sequencer;

    nlohmann::json res{};
    res["id"] = event.id;
    res["topic"] = event.topic;
    res["subject"] = event.subject;
    res["eventType"] = to_string(event.event_type);
    res["eventTime"] = format_timestamp(event.event_time);
    res["dataVersion"] = event.data_version;
    res["metadataVersion"] = event.metadata_version;
    res["data"] = std::move(data);
    return res;
}

Result<ChangeFeedEvent> event_from_json(nlohmann::json const &j)
{
    if (!j.is_object()) {
        return ChangeFeedError::malformed_event;
    }
    ChangeFeedEvent event;
    std::string event_type;
    std::string event_time;
    if (!read_string(j, "id", event.id) ||
        !read_string(j, "topic", event.topic) ||
        !read_string(j, "subject", event.subject) ||
        !read_string(j, "eventType", event_type) ||
        !read_string(j, "eventTime", event_time) ||
        !read_string(j, "dataVersion", event.data_version) ||
        !read_string(j, "metadataVersion", event.metadata_version)) {
        return ChangeFeedError::malformed_event;
    }
    event.event_type = event_type_from_string(event_type);

    // every event is placed in time; without eventTime it cannot be filtered
    auto const time = parse_timestamp(event_time);
    if (time.has_error()) {
        return ChangeFeedError::malformed_event;
    }
    event.event_time = time.value();

    if (auto const it = j.find("data"); it != j.end() && !it->is_null()) {
        BOOST_OUTCOME_TRY(auto data, data_from_json(*it));
        event.data = std::move(data);
    }
    return event;
}

CHANGEFEED_NAMESPACE_END
