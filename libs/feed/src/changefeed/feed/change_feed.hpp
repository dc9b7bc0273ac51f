#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/chunk_decoder.hpp>
#include <changefeed/feed/constants.hpp>
#include <changefeed/feed/cursor.hpp>
#include <changefeed/feed/event.hpp>
#include <changefeed/feed/segment.hpp>
#include <changefeed/feed/time.hpp>
#include <changefeed/storage/blob_store.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

CHANGEFEED_NAMESPACE_BEGIN

struct ChangeFeedOptions
{
    //! \brief Rounded down to the hour
    std::optional<Timestamp> start_time;
    //! \brief Rounded up to the next hour
    std::optional<Timestamp> end_time;
};

//! \brief Pull-based reader presenting the year/segment/chunk hierarchy of a
//! change feed container as one ordered stream of event pages.
//!
//! Not thread safe; one instance serves one consumer. Blocking or suspension
//! only happens inside the BlobStore and ChunkDecoder calls.
class ChangeFeed
{
    storage::BlobStore &store_;
    ChunkDecoder &decoder_;

    std::optional<Timestamp> start_time_;
    std::optional<Timestamp> end_time_;
    // position to resume the first segment at, consumed by initialize()
    std::optional<SegmentCursor> resume_;

    bool initialized_{false};
    Timestamp last_consumable_{};
    std::deque<std::string> years_;
    std::deque<std::string> segments_;
    // stays in place, exhausted, once the final segment has been read
    std::optional<Segment> current_segment_;

    Timestamp end_bound() const;

    Result<Timestamp> fetch_last_consumable();
    Result<std::deque<std::string>> get_year_paths();
    Result<std::deque<std::string>>
    get_segments_in_year(std::string const &year_path, Timestamp end_bound);

    //! \brief Next segment from `segments`, refilling it from `years`.
    //! Empty once every year has been consumed.
    Result<std::optional<Segment>> next_segment(
        std::deque<std::string> &years, std::deque<std::string> &segments,
        Timestamp end_bound);

    Result<void> advance();

public:
    ChangeFeed(
        storage::BlobStore &, ChunkDecoder &, ChangeFeedOptions const & = {});

    //! \brief Resumes after the last event read when `cursor` was taken.
    //! Fails with `cursor_mismatch` if it belongs to another container.
    static Result<ChangeFeed> from_cursor(
        storage::BlobStore &, ChunkDecoder &, ChangeFeedCursor const &);

    ChangeFeed(ChangeFeed &&) = default;

    Result<void> initialize();

    Result<ChangeFeedPage> get_page(size_t page_size = DEFAULT_PAGE_SIZE);

    bool has_next() const;

    //! \brief Bound read at initialization; not refreshed afterwards
    std::optional<Timestamp> last_consumable() const;

    Result<ChangeFeedCursor> get_cursor() const;

    std::optional<Timestamp> start_time() const
    {
        return start_time_;
    }

    std::optional<Timestamp> end_time() const
    {
        return end_time_;
    }
};

CHANGEFEED_NAMESPACE_END
