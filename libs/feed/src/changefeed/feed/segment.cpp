#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/chunk_decoder.hpp>
#include <changefeed/feed/constants.hpp>
#include <changefeed/feed/cursor.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/event.hpp>
#include <changefeed/feed/path.hpp>
#include <changefeed/feed/segment.hpp>
#include <changefeed/feed/time.hpp>
#include <changefeed/storage/blob_store.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h> // NOLINT
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHANGEFEED_NAMESPACE_BEGIN

namespace
{
    // Shard paths in a manifest are prefixed with the container name
    std::string_view strip_container_name(std::string_view path)
    {
        if (path.starts_with(CHANGE_FEED_CONTAINER_NAME) &&
            path.size() > CHANGE_FEED_CONTAINER_NAME.size() &&
            path[CHANGE_FEED_CONTAINER_NAME.size()] == '/') {
            path.remove_prefix(CHANGE_FEED_CONTAINER_NAME.size() + 1);
        }
        return path;
    }
}

Segment::Segment(
    storage::BlobStore &store, ChunkDecoder &decoder, std::string path,
    Timestamp const date_time, uint64_t const chunk_index,
    uint64_t const event_offset)
    : store_{store}
    , decoder_{decoder}
    , path_{std::move(path)}
    , date_time_{date_time}
    , chunk_index_{chunk_index}
    , event_offset_{event_offset}
{
}

Result<Segment> Segment::create(
    storage::BlobStore &store, ChunkDecoder &decoder, std::string path)
{
    BOOST_OUTCOME_TRY(auto const date_time, parse_segment_path(path));
    return Segment{store, decoder, std::move(path), date_time, 0, 0};
}

Result<Segment> Segment::create(
    storage::BlobStore &store, ChunkDecoder &decoder,
    SegmentCursor const &cursor)
{
    BOOST_OUTCOME_TRY(
        auto const date_time, parse_segment_path(cursor.segment_path));
    return Segment{
        store,
        decoder,
        cursor.segment_path,
        date_time,
        cursor.chunk_index,
        cursor.event_offset};
}

Result<void> Segment::initialize()
{
    BOOST_OUTCOME_TRY(auto const manifest, store_.download(path_));
    auto const j =
        nlohmann::json::parse(manifest, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("segment manifest {} is not a JSON object", path_);
        return ChangeFeedError::malformed_manifest;
    }
    auto const shards = j.find("chunkFilePaths");
    if (shards == j.end() || !shards->is_array()) {
        LOG_ERROR("segment manifest {} has no chunkFilePaths", path_);
        return ChangeFeedError::malformed_manifest;
    }

    std::vector<std::string> chunks;
    for (auto const &shard : *shards) {
        if (!shard.is_string()) {
            return ChangeFeedError::malformed_manifest;
        }
        auto const prefix =
            strip_container_name(shard.get_ref<std::string const &>());
        BOOST_OUTCOME_TRY(auto items, store_.list_blobs(prefix));
        std::sort(items.begin(), items.end(), [](auto const &a, auto const &b) {
            return a.name < b.name;
        });
        for (auto &item : items) {
            chunks.push_back(std::move(item.name));
        }
    }

    LOG_DEBUG(
        "segment {} has {} shards, {} chunks",
        path_,
        shards->size(),
        chunks.size());
    chunks_ = std::move(chunks);
    initialized_ = true;
    return success();
}

Result<ChangeFeedPage> Segment::get_page(size_t const page_size)
{
    if (!initialized_) {
        BOOST_OUTCOME_TRY(initialize());
    }

    // work on copies; nothing is committed unless the whole page succeeds
    ChangeFeedPage page;
    uint64_t chunk_index = chunk_index_;
    uint64_t event_offset = event_offset_;
    std::unique_ptr<ChunkReader> reader = std::move(reader_);

    while (chunk_index < chunks_.size()) {
        if (!reader) {
            BOOST_OUTCOME_TRY(
                auto opened,
                decoder_.decode(chunks_[chunk_index], event_offset));
            reader = std::move(opened);
        }
        // move past exhausted chunks even once the page is full, so that
        // has_next() is exact afterwards
        if (!reader->has_next()) {
            ++chunk_index;
            event_offset = 0;
            reader.reset();
            continue;
        }
        if (page.size() >= page_size) {
            break;
        }
        BOOST_OUTCOME_TRY(auto event, reader->next());
        page.push_back(std::move(event));
        ++event_offset;
    }

    chunk_index_ = chunk_index;
    event_offset_ = event_offset;
    reader_ = std::move(reader);
    return page;
}

bool Segment::has_next() const
{
    return !initialized_ || chunk_index_ < chunks_.size();
}

SegmentCursor Segment::get_cursor() const
{
    return SegmentCursor{
        .segment_path = path_,
        .chunk_index = chunk_index_,
        .event_offset = event_offset_};
}

CHANGEFEED_NAMESPACE_END
