#include <changefeed/config.hpp>
#include <changefeed/core/likely.h>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/change_feed.hpp>
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
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHANGEFEED_NAMESPACE_BEGIN

namespace
{
    std::chrono::year year_of(Timestamp const t)
    {
        return std::chrono::year_month_day{
            std::chrono::floor<std::chrono::days>(t)}
            .year();
    }

    bool is_initialization_year(std::string_view year_path)
    {
        if (!year_path.starts_with(SEGMENT_PREFIX)) {
            return false;
        }
        year_path.remove_prefix(SEGMENT_PREFIX.size());
        return year_path.starts_with(INITIALIZATION_SEGMENT);
    }
}

ChangeFeed::ChangeFeed(
    storage::BlobStore &store, ChunkDecoder &decoder,
    ChangeFeedOptions const &options)
    : store_{store}
    , decoder_{decoder}
    , start_time_{floor_to_hour(options.start_time)}
    , end_time_{ceil_to_hour(options.end_time)}
{
}

Result<ChangeFeed> ChangeFeed::from_cursor(
    storage::BlobStore &store, ChunkDecoder &decoder,
    ChangeFeedCursor const &cursor)
{
    if (cursor.container_hash != container_hash(store.address())) {
        LOG_ERROR(
            "cursor container hash {} does not match container {}",
            cursor.container_hash,
            store.address());
        return ChangeFeedError::cursor_mismatch;
    }
    BOOST_OUTCOME_TRY(
        auto const segment_time,
        parse_segment_path(cursor.segment_cursor.segment_path));

    ChangeFeed feed{store, decoder, {.start_time = segment_time}};
    // the cursor carries the end time already rounded
    feed.end_time_ = cursor.end_time;
    feed.resume_ = cursor.segment_cursor;
    return feed;
}

Timestamp ChangeFeed::end_bound() const
{
    return min_end(last_consumable_, end_time_);
}

Result<Timestamp> ChangeFeed::fetch_last_consumable()
{
    BOOST_OUTCOME_TRY(
        auto const content, store_.download(META_SEGMENTS_PATH));
    auto const j =
        nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("{} is not a JSON object", META_SEGMENTS_PATH);
        return ChangeFeedError::malformed_manifest;
    }
    auto const it = j.find("lastConsumable");
    if (it == j.end() || !it->is_string()) {
        LOG_ERROR("{} has no lastConsumable", META_SEGMENTS_PATH);
        return ChangeFeedError::malformed_manifest;
    }
    auto const last_consumable = parse_timestamp(it->get<std::string>());
    if (last_consumable.has_error()) {
        return ChangeFeedError::malformed_manifest;
    }
    return last_consumable.value();
}

Result<std::deque<std::string>> ChangeFeed::get_year_paths()
{
    BOOST_OUTCOME_TRY(
        auto prefixes, store_.list_prefixes(SEGMENT_PREFIX, '/'));
    std::sort(prefixes.begin(), prefixes.end());

    std::deque<std::string> years;
    for (auto &prefix : prefixes) {
        if (is_initialization_year(prefix)) {
            continue;
        }
        BOOST_OUTCOME_TRY(parse_year_path(prefix));
        years.push_back(std::move(prefix));
    }
    return years;
}

Result<std::deque<std::string>> ChangeFeed::get_segments_in_year(
    std::string const &year_path, Timestamp const end_bound)
{
    BOOST_OUTCOME_TRY(auto items, store_.list_blobs(year_path));
    std::sort(items.begin(), items.end(), [](auto const &a, auto const &b) {
        return a.name < b.name;
    });

    std::deque<std::string> segments;
    for (auto &item : items) {
        auto const segment_time = parse_segment_path(item.name);
        if (CHANGEFEED_UNLIKELY(segment_time.has_error())) {
            LOG_ERROR("unexpected blob {} in {}", item.name, year_path);
            return ChangeFeedError::malformed_path;
        }
        if ((start_time_.has_value() &&
             segment_time.value() < start_time_.value()) ||
            segment_time.value() > end_bound) {
            continue;
        }
        segments.push_back(std::move(item.name));
    }
    LOG_DEBUG(
        "{} eligible segments of {} in {}",
        segments.size(),
        items.size(),
        year_path);
    return segments;
}

Result<std::optional<Segment>> ChangeFeed::next_segment(
    std::deque<std::string> &years, std::deque<std::string> &segments,
    Timestamp const end_bound)
{
    while (segments.empty()) {
        if (years.empty()) {
            return std::optional<Segment>{};
        }
        BOOST_OUTCOME_TRY(
            auto listed, get_segments_in_year(years.front(), end_bound));
        years.pop_front();
        segments = std::move(listed);
    }
    BOOST_OUTCOME_TRY(
        auto segment, Segment::create(store_, decoder_, segments.front()));
    segments.pop_front();
    return std::optional<Segment>{std::move(segment)};
}

Result<void> ChangeFeed::initialize()
{
    if (initialized_) {
        return success();
    }

    BOOST_OUTCOME_TRY(auto const enabled, store_.exists());
    if (!enabled) {
        LOG_ERROR("change feed is not enabled on {}", store_.address());
        return ChangeFeedError::not_enabled;
    }

    BOOST_OUTCOME_TRY(auto const last_consumable, fetch_last_consumable());
    BOOST_OUTCOME_TRY(auto years, get_year_paths());

    if (start_time_.has_value()) {
        auto const start_year = year_of(start_time_.value());
        while (!years.empty()) {
            BOOST_OUTCOME_TRY(
                auto const year_time, parse_year_path(years.front()));
            if (year_of(year_time) >= start_year) {
                break;
            }
            years.pop_front();
        }
    }

    std::deque<std::string> segments;
    BOOST_OUTCOME_TRY(
        auto first,
        next_segment(years, segments, min_end(last_consumable, end_time_)));

    if (resume_.has_value()) {
        if (first.has_value() &&
            first->path() == resume_->segment_path) {
            BOOST_OUTCOME_TRY(
                auto resumed, Segment::create(store_, decoder_, *resume_));
            first.emplace(std::move(resumed));
            LOG_INFO(
                "resuming {} at chunk {} event {}",
                resume_->segment_path,
                resume_->chunk_index,
                resume_->event_offset);
        }
        else {
            LOG_WARNING(
                "segment {} from cursor is gone, resuming at {}",
                resume_->segment_path,
                first.has_value() ? first->path() : std::string{"<end>"});
        }
    }

    last_consumable_ = last_consumable;
    years_ = std::move(years);
    segments_ = std::move(segments);
    if (first.has_value()) {
        current_segment_.emplace(std::move(first.value()));
    }
    resume_.reset();
    initialized_ = true;

    LOG_INFO(
        "change feed on {} initialized: last consumable {}, first segment {}, "
        "{} years pending",
        store_.address(),
        format_timestamp(last_consumable_),
        current_segment_.has_value() ? current_segment_->path()
                                     : std::string{"<none>"},
        years_.size());
    return success();
}

Result<void> ChangeFeed::advance()
{
    if (!current_segment_.has_value() || current_segment_->has_next() ||
        (segments_.empty() && years_.empty())) {
        return success();
    }

    auto years = years_;
    auto segments = segments_;
    BOOST_OUTCOME_TRY(auto next, next_segment(years, segments, end_bound()));

    years_ = std::move(years);
    segments_ = std::move(segments);
    if (next.has_value()) {
        LOG_DEBUG(
            "finished segment {}, advancing to {}",
            current_segment_->path(),
            next->path());
        current_segment_.emplace(std::move(next.value()));
    }
    return success();
}

Result<ChangeFeedPage> ChangeFeed::get_page(size_t const page_size)
{
    BOOST_OUTCOME_TRY(initialize());

    if (!has_next()) {
        return ChangeFeedError::exhausted_stream;
    }

    // an earlier page may have drained the segment without managing to move
    // on; nothing is read from an exhausted segment until that succeeds
    BOOST_OUTCOME_TRY(advance());

    while (true) {
        if (current_segment_->date_time() > end_bound()) {
            return ChangeFeedPage{};
        }

        BOOST_OUTCOME_TRY(auto page, current_segment_->get_page(page_size));

        // a segment at the bound still holds events from later in its hour;
        // they count as read so the cursor moves past them
        auto const bound = end_bound();
        if (auto const dropped =
                std::erase_if(page, [bound](ChangeFeedEvent const &event) {
                    return event.event_time > bound;
                });
            dropped > 0) {
            LOG_DEBUG(
                "dropped {} events of {} after {}",
                dropped,
                current_segment_->path(),
                format_timestamp(bound));
        }

        // the page has been consumed from the segment; a failure to move on
        // is reported by the next call instead of losing it
        if (auto const advanced = advance(); advanced.has_error()) {
            LOG_WARNING(
                "could not advance past {}: {}",
                current_segment_->path(),
                advanced.error().message().c_str());
            return page;
        }

        // segments holding no events within the bound are skipped rather
        // than surfacing as empty pages
        if (!page.empty() || page_size == 0 || !has_next()) {
            return page;
        }
    }
}

bool ChangeFeed::has_next() const
{
    if (!initialized_) {
        return true;
    }
    if (!current_segment_.has_value()) {
        return false;
    }
    if (segments_.empty() && years_.empty() && !current_segment_->has_next()) {
        return false;
    }
    return current_segment_->date_time() <= end_bound();
}

std::optional<Timestamp> ChangeFeed::last_consumable() const
{
    if (!initialized_) {
        return std::nullopt;
    }
    return last_consumable_;
}

Result<ChangeFeedCursor> ChangeFeed::get_cursor() const
{
    if (!initialized_) {
        return ChangeFeedError::not_initialized;
    }
    if (!current_segment_.has_value()) {
        return ChangeFeedError::exhausted_stream;
    }
    return ChangeFeedCursor{
        .container_hash = container_hash(store_.address()),
        .end_time = end_time_,
        .segment_cursor = current_segment_->get_cursor()};
}

CHANGEFEED_NAMESPACE_END
