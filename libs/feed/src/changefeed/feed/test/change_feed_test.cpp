#include "test_fixtures.hpp"

#include <changefeed/feed/change_feed.hpp>
#include <changefeed/feed/cursor.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/json_chunk_decoder.hpp>
#include <changefeed/feed/time.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/blob_store_error.hpp>
#include <changefeed/storage/memory_blob_store.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/generic_code.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

using namespace changefeed;
using namespace changefeed::test;
using namespace std::chrono_literals;

namespace
{
    // 2020 holds a segment without events; 2021/03/05 14:00 holds two
    // chunks with three events
    class ChangeFeedExample : public ::testing::Test
    {
    protected:
        ChangeFeedContainer container;
        JsonChunkDecoder decoder{container.store};
        std::string segment;

        void SetUp() override
        {
            container.add_initialization_segment();
            container.add_segment(2020, 6, 1, 10, {});
            segment = container.add_segment(
                2021,
                3,
                5,
                14,
                {{make_event("e1", make_timestamp(2021, 3, 5, 14)),
                  make_event("e2", make_timestamp(2021, 3, 5, 14, 10))},
                 {make_event("e3", make_timestamp(2021, 3, 5, 14, 50))}});
            container.set_last_consumable(make_timestamp(2021, 3, 5, 15));
        }
    };

    // segments 2019-12-31 23:00 through 2021-01-01 01:00, one event per
    // segment stamped with the segment time, several in a row per hour
    class ChangeFeedYears : public ::testing::Test
    {
    protected:
        ChangeFeedContainer container;
        JsonChunkDecoder decoder{container.store};
        std::vector<std::string> all_ids;

        void add(int const y, unsigned const m, unsigned const d, unsigned const h)
        {
            auto const t = make_timestamp(y, m, d, h);
            auto const base = format_timestamp(t);
            std::vector<std::vector<ChangeFeedEvent>> chunks;
            chunks.push_back({make_event(base + "#0", t), make_event(base + "#1", t)});
            chunks.push_back({make_event(base + "#2", t)});
            container.add_segment(y, m, d, h, chunks);
            for (auto const *const suffix : {"#0", "#1", "#2"}) {
                all_ids.push_back(base + suffix);
            }
        }

        void SetUp() override
        {
            container.add_initialization_segment();
            add(2019, 12, 31, 23);
            add(2020, 1, 1, 0);
            add(2020, 1, 1, 1);
            add(2020, 1, 1, 2);
            add(2020, 7, 4, 12);
            add(2021, 1, 1, 0);
            add(2021, 1, 1, 1);
            container.set_last_consumable(make_timestamp(2022, 1, 1));
        }
    };
}

TEST_F(ChangeFeedExample, reads_all_events_in_one_page)
{
    ChangeFeed feed{container.store, decoder};
    EXPECT_TRUE(feed.has_next());

    auto const page = feed.get_page(10);
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(ids_of(page.value()), (std::vector<std::string>{"e1", "e2", "e3"}));
    EXPECT_FALSE(feed.has_next());
    EXPECT_EQ(feed.last_consumable(), make_timestamp(2021, 3, 5, 15));

    auto const after = feed.get_page(10);
    ASSERT_TRUE(after.has_error());
    EXPECT_EQ(after.error(), ChangeFeedError::exhausted_stream);
}

TEST_F(ChangeFeedExample, end_time_is_ceiled_to_the_hour)
{
    ChangeFeed feed{
        container.store,
        decoder,
        {.end_time = make_timestamp(2021, 3, 5, 14, 30)}};
    EXPECT_EQ(feed.end_time(), make_timestamp(2021, 3, 5, 15));

    EXPECT_EQ(
        ids_of(read_all(feed, 10)),
        (std::vector<std::string>{"e1", "e2", "e3"}));
    EXPECT_FALSE(feed.has_next());
}

TEST_F(ChangeFeedExample, start_time_is_floored_to_the_hour)
{
    ChangeFeed feed{
        container.store,
        decoder,
        {.start_time = make_timestamp(2021, 3, 5, 14, 45)}};
    EXPECT_EQ(feed.start_time(), make_timestamp(2021, 3, 5, 14));

    EXPECT_EQ(
        ids_of(read_all(feed, 2)),
        (std::vector<std::string>{"e1", "e2", "e3"}));
}

TEST_F(ChangeFeedExample, pages_respect_page_size)
{
    ChangeFeed feed{container.store, decoder};
    auto const first = feed.get_page(2);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(ids_of(first.value()), (std::vector<std::string>{"e1", "e2"}));
    EXPECT_TRUE(feed.has_next());

    auto const second = feed.get_page(2);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(ids_of(second.value()), (std::vector<std::string>{"e3"}));
    EXPECT_FALSE(feed.has_next());
}

TEST_F(ChangeFeedExample, not_enabled)
{
    container.store.set_exists(false);
    ChangeFeed feed{container.store, decoder};

    auto const init = feed.initialize();
    ASSERT_TRUE(init.has_error());
    EXPECT_EQ(init.error(), ChangeFeedError::not_enabled);

    auto const page = feed.get_page();
    ASSERT_TRUE(page.has_error());
    EXPECT_EQ(page.error(), ChangeFeedError::not_enabled);

    // nothing was retained
    EXPECT_TRUE(feed.has_next());
    EXPECT_FALSE(feed.last_consumable().has_value());
    auto const cursor = feed.get_cursor();
    ASSERT_TRUE(cursor.has_error());
    EXPECT_EQ(cursor.error(), ChangeFeedError::not_initialized);

    container.store.set_exists(true);
    EXPECT_EQ(
        ids_of(read_all(feed, 10)),
        (std::vector<std::string>{"e1", "e2", "e3"}));
}

TEST_F(ChangeFeedExample, initialize_is_idempotent)
{
    ChangeFeed feed{container.store, decoder};
    ASSERT_TRUE(feed.initialize().has_value());
    ASSERT_TRUE(feed.initialize().has_value());
    EXPECT_TRUE(feed.has_next());
    EXPECT_EQ(
        ids_of(read_all(feed, 10)),
        (std::vector<std::string>{"e1", "e2", "e3"}));
}

TEST_F(ChangeFeedExample, last_consumable_bounds_segments)
{
    container.add_segment(
        2021, 3, 5, 16, {{make_event("late", make_timestamp(2021, 3, 5, 16))}});
    ChangeFeed feed{container.store, decoder};
    EXPECT_EQ(
        ids_of(read_all(feed, 10)),
        (std::vector<std::string>{"e1", "e2", "e3"}));

    auto const page = feed.get_page(10);
    ASSERT_TRUE(page.has_error());
    EXPECT_EQ(page.error(), ChangeFeedError::exhausted_stream);
}

TEST_F(ChangeFeedExample, events_after_the_bound_are_dropped)
{
    container.add_segment(
        2021,
        3,
        5,
        15,
        {{make_event("at_bound", make_timestamp(2021, 3, 5, 15)),
          make_event("after", make_timestamp(2021, 3, 5, 15, 40))}});

    for (size_t const page_size : {1u, 2u, 10u}) {
        // bounded by the ceiled end time, then by lastConsumable alone
        for (auto const &options :
             {ChangeFeedOptions{.end_time = make_timestamp(2021, 3, 5, 14, 30)},
              ChangeFeedOptions{}}) {
            ChangeFeed feed{container.store, decoder, options};
            auto const events = read_all(feed, page_size);
            EXPECT_EQ(
                ids_of(events),
                (std::vector<std::string>{"e1", "e2", "e3", "at_bound"}))
                << page_size;
            for (auto const &event : events) {
                EXPECT_LE(event.event_time, make_timestamp(2021, 3, 5, 15));
            }
            EXPECT_FALSE(feed.has_next());

            // the dropped event is behind the cursor
            auto const cursor = feed.get_cursor();
            ASSERT_TRUE(cursor.has_value());
            EXPECT_EQ(
                cursor.value().segment_cursor,
                (SegmentCursor{
                    .segment_path = segment_path(2021, 3, 5, 15),
                    .chunk_index = 1,
                    .event_offset = 0}));
        }
    }
}

TEST_F(ChangeFeedExample, missing_control_blob)
{
    container.store.remove(META_SEGMENTS_PATH);
    ChangeFeed feed{container.store, decoder};
    auto const page = feed.get_page();
    ASSERT_TRUE(page.has_error());
    EXPECT_EQ(page.error(), storage::BlobStoreError::blob_not_found);
    EXPECT_FALSE(feed.last_consumable().has_value());
}

TEST_F(ChangeFeedExample, malformed_control_blob)
{
    for (auto const *const content :
         {"", "[]", R"({"version": 0})", R"({"lastConsumable": "soon"})"}) {
        container.store.put(std::string{META_SEGMENTS_PATH}, content);
        ChangeFeed feed{container.store, decoder};
        auto const init = feed.initialize();
        ASSERT_TRUE(init.has_error()) << content;
        EXPECT_EQ(init.error(), ChangeFeedError::malformed_manifest) << content;
    }
}

TEST_F(ChangeFeedExample, unexpected_blob_in_year_is_malformed_path)
{
    container.store.put("idx/segments/2021/03/notes.txt", "");
    ChangeFeed feed{container.store, decoder};

    // the 2020 year is listed at initialization and holds no events, so the
    // listing of 2021 happens while paging
    auto const page = feed.get_page(10);
    ASSERT_TRUE(page.has_value());
    EXPECT_TRUE(page.value().empty());
    EXPECT_TRUE(feed.has_next());

    auto const failed = feed.get_page(10);
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error(), ChangeFeedError::malformed_path);
}

TEST_F(ChangeFeedExample, malformed_year_fails_initialization)
{
    container.store.put("idx/segments/20x1/03/05/1400/meta.json", "{}");
    ChangeFeed feed{container.store, decoder};
    auto const init = feed.initialize();
    ASSERT_TRUE(init.has_error());
    EXPECT_EQ(init.error(), ChangeFeedError::malformed_path);
    EXPECT_FALSE(feed.last_consumable().has_value());
}

TEST_F(ChangeFeedExample, failed_chunk_download_keeps_position)
{
    container.store.remove(segment_path(2020, 6, 1, 10));
    FaultyBlobStore faulty{container.store};
    JsonChunkDecoder faulty_decoder{faulty};
    ChangeFeed feed{faulty, faulty_decoder};
    ASSERT_TRUE(feed.initialize().has_value());
    auto const before = feed.get_cursor();
    ASSERT_TRUE(before.has_value());

    faulty.fail_download("log/00/2021/03/05/1400/00001.jsonl");
    auto const failed = feed.get_page(10);
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error(), outcome::experimental::errc::io_error);
    EXPECT_TRUE(feed.has_next());
    auto const after = feed.get_cursor();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after.value(), before.value());

    EXPECT_EQ(
        ids_of(read_all(feed, 10)),
        (std::vector<std::string>{"e1", "e2", "e3"}));
}

TEST_F(ChangeFeedExample, failed_year_listing_is_reported_by_next_page)
{
    container.add_segment(
        2022, 1, 1, 0, {{make_event("next", make_timestamp(2022, 1, 1))}});
    container.set_last_consumable(make_timestamp(2022, 1, 1, 1));
    container.store.remove(segment_path(2020, 6, 1, 10));

    FaultyBlobStore faulty{container.store};
    JsonChunkDecoder faulty_decoder{faulty};
    ChangeFeed feed{faulty, faulty_decoder};
    faulty.fail_list("idx/segments/2022/", 2);

    // the events read are returned even though moving on failed
    auto const first = feed.get_page(10);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(ids_of(first.value()), (std::vector<std::string>{"e1", "e2", "e3"}));
    EXPECT_TRUE(feed.has_next());

    auto const failed = feed.get_page(10);
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error(), outcome::experimental::errc::io_error);

    auto const last = feed.get_page(10);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(ids_of(last.value()), (std::vector<std::string>{"next"}));
    EXPECT_FALSE(feed.has_next());
}

namespace
{
    // Lists a prefix outside the segment hierarchy as a year
    class StrayPrefixBlobStore final : public storage::BlobStore
    {
        storage::BlobStore &store_;

    public:
        explicit StrayPrefixBlobStore(storage::BlobStore &store)
            : store_{store}
        {
        }

        std::string const &address() const override
        {
            return store_.address();
        }

        Result<bool> exists() override
        {
            return store_.exists();
        }

        Result<std::vector<std::string>>
        list_prefixes(std::string_view, char) override
        {
            return std::vector<std::string>{"idx/"};
        }

        Result<std::vector<storage::BlobItem>>
        list_blobs(std::string_view const prefix) override
        {
            return store_.list_blobs(prefix);
        }

        Result<std::string> download(std::string_view const path) override
        {
            return store_.download(path);
        }
    };
}

TEST_F(ChangeFeedExample, year_prefix_outside_segments_is_malformed_path)
{
    StrayPrefixBlobStore store{container.store};
    JsonChunkDecoder stray_decoder{store};
    ChangeFeed feed{store, stray_decoder};
    auto const init = feed.initialize();
    ASSERT_TRUE(init.has_error());
    EXPECT_EQ(init.error(), ChangeFeedError::malformed_path);
}

TEST(ChangeFeed, only_initialization_segment)
{
    ChangeFeedContainer container;
    container.add_initialization_segment();
    container.set_last_consumable(make_timestamp(2021, 3, 5, 15));
    JsonChunkDecoder decoder{container.store};
    ChangeFeed feed{container.store, decoder};

    EXPECT_TRUE(feed.has_next());
    ASSERT_TRUE(feed.initialize().has_value());
    EXPECT_FALSE(feed.has_next());

    auto const page = feed.get_page();
    ASSERT_TRUE(page.has_error());
    EXPECT_EQ(page.error(), ChangeFeedError::exhausted_stream);

    auto const cursor = feed.get_cursor();
    ASSERT_TRUE(cursor.has_error());
    EXPECT_EQ(cursor.error(), ChangeFeedError::exhausted_stream);
}

TEST(ChangeFeed, empty_container)
{
    ChangeFeedContainer container;
    container.set_last_consumable(make_timestamp(2021, 3, 5, 15));
    JsonChunkDecoder decoder{container.store};
    ChangeFeed feed{container.store, decoder};

    auto const page = feed.get_page();
    ASSERT_TRUE(page.has_error());
    EXPECT_EQ(page.error(), ChangeFeedError::exhausted_stream);
    EXPECT_FALSE(feed.has_next());
}

TEST_F(ChangeFeedYears, reads_everything_in_order)
{
    ChangeFeed feed{container.store, decoder};
    auto const events = read_all(feed, 4);
    EXPECT_EQ(ids_of(events), all_ids);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_LE(events[i - 1].event_time, events[i].event_time);
    }
}

TEST_F(ChangeFeedYears, page_size_does_not_change_the_stream)
{
    for (size_t const page_size : {1u, 2u, 3u, 5u, 7u, 100u}) {
        ChangeFeed feed{container.store, decoder};
        std::vector<std::string> ids;
        while (feed.has_next()) {
            auto const page = feed.get_page(page_size);
            ASSERT_TRUE(page.has_value());
            EXPECT_LE(page.value().size(), page_size);
            for (auto const &event : page.value()) {
                ids.push_back(event.id);
            }
        }
        EXPECT_EQ(ids, all_ids) << page_size;
    }
}

TEST_F(ChangeFeedYears, window_filters_years_and_segments)
{
    auto const start = make_timestamp(2020, 1, 1, 0, 30);
    auto const end = make_timestamp(2020, 1, 1, 1, 15);
    ChangeFeed feed{
        container.store, decoder, {.start_time = start, .end_time = end}};

    auto const events = read_all(feed, 2);
    ASSERT_EQ(events.size(), 9u);
    EXPECT_EQ(events.front().id, "2020-01-01T00:00:00Z#0");
    EXPECT_EQ(events.back().id, "2020-01-01T02:00:00Z#2");
    for (auto const &event : events) {
        EXPECT_GE(event.event_time, floor_to_hour(start));
        EXPECT_LE(event.event_time, ceil_to_hour(end));
    }

    auto const page = feed.get_page();
    ASSERT_TRUE(page.has_error());
    EXPECT_EQ(page.error(), ChangeFeedError::exhausted_stream);
}

TEST_F(ChangeFeedYears, start_in_later_year_skips_earlier_years)
{
    ChangeFeed feed{
        container.store,
        decoder,
        {.start_time = make_timestamp(2021, 1, 1, 1, 59)}};
    auto const events = read_all(feed, 10);
    EXPECT_EQ(
        ids_of(events),
        (std::vector<std::string>{
            "2021-01-01T01:00:00Z#0",
            "2021-01-01T01:00:00Z#1",
            "2021-01-01T01:00:00Z#2"}));
}

TEST_F(ChangeFeedYears, start_after_last_segment)
{
    ChangeFeed feed{
        container.store, decoder, {.start_time = make_timestamp(2021, 6, 1)}};
    ASSERT_TRUE(feed.initialize().has_value());
    EXPECT_FALSE(feed.has_next());
}

TEST_F(ChangeFeedYears, last_consumable_inside_a_year)
{
    container.set_last_consumable(make_timestamp(2020, 1, 1, 1, 30));
    ChangeFeed feed{container.store, decoder};
    auto const events = read_all(feed, 5);
    ASSERT_EQ(events.size(), 9u);
    EXPECT_EQ(events.back().id, "2020-01-01T01:00:00Z#2");
    EXPECT_EQ(feed.last_consumable(), make_timestamp(2020, 1, 1, 1, 30));
}

TEST_F(ChangeFeedYears, cursor_resumes_exactly)
{
    ChangeFeedOptions const options{
        .start_time = make_timestamp(2019, 12, 31, 23, 10),
        .end_time = make_timestamp(2020, 12, 31, 23, 30)};
    std::vector<std::string> expected;
    {
        ChangeFeed feed{container.store, decoder, options};
        expected = ids_of(read_all(feed, 100));
    }
    ASSERT_EQ(expected.size(), all_ids.size() - 3);

    for (size_t consumed = 0; consumed <= expected.size(); ++consumed) {
        ChangeFeed feed{container.store, decoder, options};
        ASSERT_TRUE(feed.initialize().has_value());
        std::vector<std::string> ids;
        while (ids.size() < consumed) {
            auto const page = feed.get_page(1);
            ASSERT_TRUE(page.has_value());
            for (auto const &event : page.value()) {
                ids.push_back(event.id);
            }
        }

        auto const cursor = feed.get_cursor();
        ASSERT_TRUE(cursor.has_value());
        EXPECT_EQ(cursor.value().end_time, make_timestamp(2021, 1, 1));
        auto const parsed = parse_cursor(serialize_cursor(cursor.value()));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(parsed.value(), cursor.value());

        auto resumed = ChangeFeed::from_cursor(container.store, decoder, parsed.value());
        ASSERT_TRUE(resumed.has_value());
        EXPECT_EQ(resumed.value().end_time(), make_timestamp(2021, 1, 1));
        for (auto const &id : ids_of(read_all(resumed.value(), 2))) {
            ids.push_back(id);
        }
        EXPECT_EQ(ids, expected) << consumed;

        // the first reader continues with the same sequence
        std::vector<std::string> continued(ids.begin(), ids.begin() + consumed);
        for (auto const &id : ids_of(read_all(feed, 2))) {
            continued.push_back(id);
        }
        EXPECT_EQ(continued, expected) << consumed;
    }
}

TEST_F(ChangeFeedYears, cursor_from_another_container)
{
    ChangeFeed feed{container.store, decoder};
    ASSERT_TRUE(feed.get_page(1).has_value());
    auto const cursor = feed.get_cursor();
    ASSERT_TRUE(cursor.has_value());

    storage::MemoryBlobStore other{"https://other.blob.core.windows.net/$blobchangefeed"};
    JsonChunkDecoder other_decoder{other};
    auto const resumed = ChangeFeed::from_cursor(other, other_decoder, cursor.value());
    ASSERT_TRUE(resumed.has_error());
    EXPECT_EQ(resumed.error(), ChangeFeedError::cursor_mismatch);
}

TEST_F(ChangeFeedYears, cursor_segment_removed)
{
    ChangeFeed feed{container.store, decoder};
    // pages never span segments
    auto const first = feed.get_page(4);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().size(), 3u);
    ASSERT_TRUE(feed.get_page(1).has_value());
    auto const cursor = feed.get_cursor();
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(
        cursor.value().segment_cursor.segment_path, segment_path(2020, 1, 1, 0));
    EXPECT_EQ(cursor.value().segment_cursor.chunk_index, 0u);
    EXPECT_EQ(cursor.value().segment_cursor.event_offset, 1u);

    container.store.remove(segment_path(2020, 1, 1, 0));
    auto resumed = ChangeFeed::from_cursor(container.store, decoder, cursor.value());
    ASSERT_TRUE(resumed.has_value());
    auto const events = read_all(resumed.value(), 10);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().id, "2020-01-01T01:00:00Z#0");
    EXPECT_EQ(events.size(), 15u);
}

TEST_F(ChangeFeedYears, cursor_at_end_of_stream)
{
    ChangeFeed feed{container.store, decoder};
    read_all(feed, 100);
    EXPECT_FALSE(feed.has_next());
    auto const cursor = feed.get_cursor();
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(
        cursor.value().segment_cursor.segment_path, segment_path(2021, 1, 1, 1));
    EXPECT_EQ(cursor.value().segment_cursor.chunk_index, 2u);

    auto resumed = ChangeFeed::from_cursor(container.store, decoder, cursor.value());
    ASSERT_TRUE(resumed.has_value());
    EXPECT_TRUE(read_all(resumed.value(), 10).empty());
    EXPECT_FALSE(resumed.value().has_next());
}

TEST_F(ChangeFeedYears, cursor_before_initialization)
{
    ChangeFeed feed{container.store, decoder};
    auto const cursor = feed.get_cursor();
    ASSERT_TRUE(cursor.has_error());
    EXPECT_EQ(cursor.error(), ChangeFeedError::not_initialized);
}
