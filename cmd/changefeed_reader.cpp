#include <changefeed/core/log_level_map.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/change_feed.hpp>
#include <changefeed/feed/constants.hpp>
#include <changefeed/feed/cursor.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/event.hpp>
#include <changefeed/feed/json_chunk_decoder.hpp>
#include <changefeed/feed/time.hpp>
#include <changefeed/fiber/io_pool.hpp>
#include <changefeed/storage/async_blob_store.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/filesystem_blob_store.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <signal.h>
#include <string>
#include <utility>

namespace fs = std::filesystem;

sig_atomic_t volatile stop;

void signal_handler(int)
{
    stop = 1;
}

namespace
{
    using namespace changefeed;

    std::optional<std::string> read_file(fs::path const &path)
    {
        std::ifstream is{path, std::ios::binary};
        if (!is) {
            return std::nullopt;
        }
        return std::string{
            std::istreambuf_iterator<char>{is},
            std::istreambuf_iterator<char>{}};
    }

    // the cursor is replaced atomically so an interrupted run never leaves a
    // truncated file behind
    bool write_cursor(fs::path const &path, ChangeFeedCursor const &cursor)
    {
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream os{tmp, std::ios::binary | std::ios::trunc};
            os << serialize_cursor(cursor);
            if (!os.flush()) {
                LOG_ERROR("could not write {}", tmp.string());
                return false;
            }
        }
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            LOG_ERROR(
                "could not replace {}: {}", path.string(), ec.message());
            return false;
        }
        return true;
    }

    std::optional<Timestamp>
    parse_time_option(std::optional<std::string> const &s, char const *name)
    {
        if (!s.has_value()) {
            return std::nullopt;
        }
        auto const t = parse_timestamp(s.value());
        if (t.has_error()) {
            std::cerr << name << ": not an ISO-8601 timestamp: " << s.value()
                      << std::endl;
            std::exit(EXIT_FAILURE);
        }
        return t.value();
    }
}

int main(int const argc, char const *argv[])
{
    using namespace changefeed;

    CLI::App cli{"changefeed_reader"};
    cli.option_defaults()->always_capture_default();

    fs::path container{};
    std::optional<std::string> start;
    std::optional<std::string> end;
    size_t page_size = DEFAULT_PAGE_SIZE;
    std::optional<fs::path> cursor_path;
    uint64_t max_pages = 0;
    bool async = false;
    unsigned io_threads = 2;
    unsigned io_fibers = 8;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
           "--container",
           container,
           "directory holding the change feed container")
        ->required();
    cli.add_option("--start", start, "read segments from this time (UTC)");
    cli.add_option("--end", end, "read segments up to this time (UTC)");
    cli.add_option("--page-size", page_size, "events per page")
        ->check(CLI::PositiveNumber);
    cli.add_option(
        "--cursor",
        cursor_path,
        "cursor file; resumes from it when present and is updated on exit");
    cli.add_option(
        "--max-pages", max_pages, "stop after this many pages, 0 for no limit");
    cli.add_flag("--async", async, "perform storage I/O on a fiber pool");
    cli.add_option("--io-threads", io_threads, "number of I/O threads")
        ->check(CLI::PositiveNumber);
    cli.add_option("--io-fibers", io_fibers, "number of fibers per I/O thread")
        ->check(CLI::PositiveNumber);
    cli.add_option("--log-level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // events go to stdout, so logs go to stderr
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    ChangeFeedOptions const options{
        .start_time = parse_time_option(start, "--start"),
        .end_time = parse_time_option(end, "--end")};

    storage::FilesystemBlobStore fs_store{container};
    std::unique_ptr<fiber::IoPool> pool;
    std::unique_ptr<storage::AsyncBlobStore> async_store;
    storage::BlobStore *store = &fs_store;
    if (async) {
        pool = std::make_unique<fiber::IoPool>(io_threads, io_fibers);
        async_store = std::make_unique<storage::AsyncBlobStore>(fs_store, *pool);
        store = async_store.get();
    }
    JsonChunkDecoder decoder{*store};

    std::optional<ChangeFeed> feed;
    auto const saved = cursor_path.has_value()
                           ? read_file(cursor_path.value())
                           : std::nullopt;
    if (saved.has_value() && !saved.value().empty()) {
        auto const cursor = parse_cursor(saved.value());
        if (cursor.has_error()) {
            LOG_ERROR(
                "{}: {}",
                cursor_path->string(),
                cursor.error().message().c_str());
            return EXIT_FAILURE;
        }
        if (start.has_value() || end.has_value()) {
            LOG_WARNING("resuming from cursor, --start and --end are ignored");
        }
        auto resumed = ChangeFeed::from_cursor(*store, decoder, cursor.value());
        if (resumed.has_error()) {
            LOG_ERROR(
                "cannot resume from {}: {}",
                cursor_path->string(),
                resumed.error().message().c_str());
            return EXIT_FAILURE;
        }
        feed.emplace(std::move(resumed.value()));
    }
    else {
        feed.emplace(*store, decoder, options);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    stop = 0;

    int status = EXIT_SUCCESS;
    uint64_t pages = 0;
    uint64_t events = 0;
    while (stop == 0 && feed->has_next() &&
           (max_pages == 0 || pages < max_pages)) {
        auto const page = feed->get_page(page_size);
        if (page.has_error()) {
            if (page.error() == ChangeFeedError::exhausted_stream) {
                break;
            }
            LOG_ERROR(
                "reading {} failed: {}",
                fs_store.address(),
                page.error().message().c_str());
            status = EXIT_FAILURE;
            break;
        }
        for (auto const &event : page.value()) {
            std::cout << to_json(event).dump() << '\n';
        }
        std::cout.flush();
        ++pages;
        events += page.value().size();
    }
    LOG_INFO(
        "read {} events in {} pages, more available: {}",
        events,
        pages,
        feed->has_next());

    if (cursor_path.has_value()) {
        auto const cursor = feed->get_cursor();
        if (cursor.has_value()) {
            if (!write_cursor(cursor_path.value(), cursor.value())) {
                status = EXIT_FAILURE;
            }
        }
        else {
            LOG_INFO(
                "no cursor to save: {}", cursor.error().message().c_str());
        }
    }

    if (pool) {
        pool->shutdown();
    }
    return status;
}
