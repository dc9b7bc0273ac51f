#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/chunk_decoder.hpp>
#include <changefeed/feed/cursor.hpp>
#include <changefeed/feed/event.hpp>
#include <changefeed/feed/time.hpp>
#include <changefeed/storage/blob_store.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

CHANGEFEED_NAMESPACE_BEGIN

//! \brief One hour bucket of the change feed, read as a flat sequence of
//! events across its chunks.
//!
//! The segment manifest is downloaded and its shards listed on first use.
//! A failed `get_page()` leaves the position where it was, so the call can
//! be repeated.
class Segment
{
    storage::BlobStore &store_;
    ChunkDecoder &decoder_;
    std::string path_;
    Timestamp date_time_;

    bool initialized_{false};
    std::vector<std::string> chunks_;
    uint64_t chunk_index_{0};
    uint64_t event_offset_{0};

    // open reader positioned at (chunk_index_, event_offset_), if any
    std::unique_ptr<ChunkReader> reader_;

    Segment(
        storage::BlobStore &, ChunkDecoder &, std::string path,
        Timestamp date_time, uint64_t chunk_index, uint64_t event_offset);

    Result<void> initialize();

public:
    //! \brief Fails with `malformed_path` if `path` is not a segment path
    static Result<Segment>
    create(storage::BlobStore &, ChunkDecoder &, std::string path);

    //! \brief Resumes at the position recorded in `cursor`
    static Result<Segment> create(
        storage::BlobStore &, ChunkDecoder &, SegmentCursor const &cursor);

    Segment(Segment &&) = default;
    Segment &operator=(Segment &&) = delete;

    Result<ChangeFeedPage> get_page(size_t page_size);

    //! \brief True until the segment is known to hold no unread event
    bool has_next() const;

    Timestamp date_time() const
    {
        return date_time_;
    }

    std::string const &path() const
    {
        return path_;
    }

    SegmentCursor get_cursor() const;
};

CHANGEFEED_NAMESPACE_END
