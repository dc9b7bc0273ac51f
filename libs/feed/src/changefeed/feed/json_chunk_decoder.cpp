#include <changefeed/config.hpp>
#include <changefeed/core/assert.h>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/chunk_decoder.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/event.hpp>
#include <changefeed/feed/json_chunk_decoder.hpp>
#include <changefeed/storage/blob_store.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h> // NOLINT
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHANGEFEED_NAMESPACE_BEGIN

namespace
{
    class JsonChunkReader final : public ChunkReader
    {
        std::string content_;
        std::vector<std::string_view> lines_;
        size_t next_{0};

    public:
        JsonChunkReader(std::string content, uint64_t const event_offset)
            : content_{std::move(content)}
        {
            std::string_view rest{content_};
            while (!rest.empty()) {
                auto const eol = rest.find('\n');
                auto line = rest.substr(0, eol);
                rest.remove_prefix(
                    eol == std::string_view::npos ? rest.size() : eol + 1);
                while (!line.empty() &&
                       (line.back() == '\r' || line.back() == ' ' ||
                        line.back() == '\t')) {
                    line.remove_suffix(1);
                }
                if (!line.empty()) {
                    lines_.push_back(line);
                }
            }
            next_ = event_offset < lines_.size()
                        ? static_cast<size_t>(event_offset)
                        : lines_.size();
        }

        bool has_next() const override
        {
            return next_ < lines_.size();
        }

        Result<ChangeFeedEvent> next() override
        {
            CHANGEFEED_ASSERT(has_next());
            auto const j = nlohmann::json::parse(
                lines_[next_], nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded()) {
                LOG_ERROR("chunk line {} is not valid JSON", next_);
                return ChangeFeedError::malformed_event;
            }
            BOOST_OUTCOME_TRY(auto event, event_from_json(j));
            ++next_;
            return event;
        }
    };
}

JsonChunkDecoder::JsonChunkDecoder(storage::BlobStore &store)
    : store_{store}
{
}

Result<std::unique_ptr<ChunkReader>> JsonChunkDecoder::decode(
    std::string_view const chunk_path, uint64_t const event_offset)
{
    BOOST_OUTCOME_TRY(auto content, store_.download(chunk_path));
    LOG_DEBUG(
        "decoding chunk {} from event {} ({} bytes)",
        chunk_path,
        event_offset,
        content.size());
    return std::unique_ptr<ChunkReader>{
        std::make_unique<JsonChunkReader>(std::move(content), event_offset)};
}

CHANGEFEED_NAMESPACE_END
