#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/chunk_decoder.hpp>
#include <changefeed/storage/blob_store.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

//! \brief Decodes chunks holding one JSON change feed event per line. Blank
//! lines are skipped and do not count towards event offsets.
class JsonChunkDecoder final : public ChunkDecoder
{
    storage::BlobStore &store_;

public:
    explicit JsonChunkDecoder(storage::BlobStore &);

    Result<std::unique_ptr<ChunkReader>>
    decode(std::string_view chunk_path, uint64_t event_offset) override;
};

CHANGEFEED_NAMESPACE_END
